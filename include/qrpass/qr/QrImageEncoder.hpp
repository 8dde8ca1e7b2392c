#ifndef INCLUDE_QRPASS_QR_QRIMAGEENCODER_HPP
#define INCLUDE_QRPASS_QR_QRIMAGEENCODER_HPP

#include "qrpass/core/HexColor.hpp"
#include "qrpass/qr/QrSymbol.hpp"
#include <QImage>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace qrpass::qr
{

inline constexpr int g_moduleScale{ 10 };
inline constexpr int g_quietZoneModules{ 4 };

enum class ColorFormatError : std::uint8_t
{
    InvalidForeground,
    InvalidBackground,
};

[[nodiscard]] std::string_view describe(ColorFormatError error) noexcept;

struct RenderOptions final
{
    int pixelSize{ 300 };
    std::string foreground{ "#000000" };
    std::string background{ "#FFFFFF" };
    // PNG writer quality, 0-100.
    int quality{ 90 };
};

struct RasterImage final
{
    int pixelSize{};
    std::vector<std::uint8_t> png;
};

struct EncodedQr final
{
    QrSymbol symbol;
    RasterImage image;
};

template <typename T> using RenderResult = std::variant<T, ColorFormatError>;

class QrImageEncoder final
{
public:
    // Builds the symbol for `text` and renders it as a square PNG. Colors are
    // checked before any work is done. Throws std::length_error for text beyond
    // symbol capacity and std::runtime_error when encoding fails.
    [[nodiscard]] RenderResult<EncodedQr> encode(std::string_view text, const RenderOptions& options) const;

    // Renders at g_moduleScale pixels per module with a g_quietZoneModules border,
    // then scales to pixelSize x pixelSize without smoothing.
    [[nodiscard]] static QImage rasterize(const QrSymbol& symbol, int pixelSize, qrpass::core::Rgb foreground,
                                          qrpass::core::Rgb background);

    [[nodiscard]] static std::vector<std::uint8_t> toPng(const QImage& image, int quality);
};

} // namespace qrpass::qr

#endif // INCLUDE_QRPASS_QR_QRIMAGEENCODER_HPP
