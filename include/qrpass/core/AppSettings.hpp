#ifndef INCLUDE_QRPASS_CORE_APPSETTINGS_HPP
#define INCLUDE_QRPASS_CORE_APPSETTINGS_HPP

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace qrpass::core
{

enum class ImageQuality : std::uint8_t
{
    VeryHigh,
    High,
    Medium,
    Low,
};

enum class QrSize : std::uint8_t
{
    Small,
    Medium,
    Large,
    ExtraLarge,
};

inline constexpr std::array<ImageQuality, 4> g_allImageQualities{ ImageQuality::VeryHigh, ImageQuality::High,
                                                                  ImageQuality::Medium, ImageQuality::Low };
inline constexpr std::array<QrSize, 4> g_allQrSizes{ QrSize::Small, QrSize::Medium, QrSize::Large,
                                                     QrSize::ExtraLarge };

inline constexpr std::string_view g_defaultForegroundColor{ "#000000" };
inline constexpr std::string_view g_defaultBackgroundColor{ "#FFFFFF" };
inline constexpr std::string_view g_defaultLanguage{ "ar" };
inline constexpr std::string_view g_defaultSaveDirName{ "QR-pass" };

struct AppSettings final
{
    std::filesystem::path savePath;
    bool autoSave{ false };
    ImageQuality imageQuality{ ImageQuality::High };
    QrSize qrSize{ QrSize::Medium };
    std::string qrColor{ g_defaultForegroundColor };
    std::string qrBgColor{ g_defaultBackgroundColor };
    std::string language{ g_defaultLanguage };

    friend bool operator==(const AppSettings&, const AppSettings&) = default;
};

// Encoder quality value (0-100).
[[nodiscard]] int qualityValue(ImageQuality quality) noexcept;

// Edge length of the square output image.
[[nodiscard]] int pixelSize(QrSize size) noexcept;

// Persisted labels, shared with settings files written by earlier releases.
[[nodiscard]] std::string_view toLabel(ImageQuality quality) noexcept;
[[nodiscard]] std::string_view toLabel(QrSize size) noexcept;

// English identifiers accepted on the command line.
[[nodiscard]] std::string_view toIdentifier(ImageQuality quality) noexcept;
[[nodiscard]] std::string_view toIdentifier(QrSize size) noexcept;

// Accepts either the persisted label or the English identifier.
[[nodiscard]] std::optional<ImageQuality> parseImageQuality(std::string_view text) noexcept;
[[nodiscard]] std::optional<QrSize> parseQrSize(std::string_view text) noexcept;

[[nodiscard]] bool isSupportedLanguage(std::string_view tag) noexcept;

// <home>/QR-pass, home taken from HOME (USERPROFILE on Windows) or the working directory.
[[nodiscard]] std::filesystem::path defaultSavePath();

[[nodiscard]] AppSettings defaultSettings();

} // namespace qrpass::core

#endif // INCLUDE_QRPASS_CORE_APPSETTINGS_HPP
