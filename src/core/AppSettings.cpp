#include "qrpass/core/AppSettings.hpp"
#include <cstdlib>
#include <system_error>

namespace qrpass::core
{
namespace
{

[[nodiscard]] std::filesystem::path homeDirectory()
{
#if defined(_WIN32)
    constexpr const char* kHomeVar{ "USERPROFILE" };
#else
    constexpr const char* kHomeVar{ "HOME" };
#endif
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    if (const char* home{ std::getenv(kHomeVar) }; home != nullptr && *home != '\0')
    {
        return std::filesystem::path{ home };
    }

    std::error_code ec{};
    auto cwd{ std::filesystem::current_path(ec) };
    if (ec)
    {
        return std::filesystem::path{ "." };
    }
    return cwd;
}

} // namespace

int qualityValue(ImageQuality quality) noexcept
{
    switch (quality)
    {
    case ImageQuality::VeryHigh:
        return 100;
    case ImageQuality::High:
        return 90;
    case ImageQuality::Medium:
        return 75;
    case ImageQuality::Low:
        return 50;
    }
    return 90;
}

int pixelSize(QrSize size) noexcept
{
    switch (size)
    {
    case QrSize::Small:
        return 200;
    case QrSize::Medium:
        return 300;
    case QrSize::Large:
        return 400;
    case QrSize::ExtraLarge:
        return 500;
    }
    return 300;
}

std::string_view toLabel(ImageQuality quality) noexcept
{
    switch (quality)
    {
    case ImageQuality::VeryHigh:
        return "عالية جداً";
    case ImageQuality::High:
        return "عالية";
    case ImageQuality::Medium:
        return "متوسطة";
    case ImageQuality::Low:
        return "منخفضة";
    }
    return "عالية";
}

std::string_view toLabel(QrSize size) noexcept
{
    switch (size)
    {
    case QrSize::Small:
        return "صغير";
    case QrSize::Medium:
        return "متوسط";
    case QrSize::Large:
        return "كبير";
    case QrSize::ExtraLarge:
        return "كبير جداً";
    }
    return "متوسط";
}

std::string_view toIdentifier(ImageQuality quality) noexcept
{
    switch (quality)
    {
    case ImageQuality::VeryHigh:
        return "very_high";
    case ImageQuality::High:
        return "high";
    case ImageQuality::Medium:
        return "medium";
    case ImageQuality::Low:
        return "low";
    }
    return "high";
}

std::string_view toIdentifier(QrSize size) noexcept
{
    switch (size)
    {
    case QrSize::Small:
        return "small";
    case QrSize::Medium:
        return "medium";
    case QrSize::Large:
        return "large";
    case QrSize::ExtraLarge:
        return "extra_large";
    }
    return "medium";
}

std::optional<ImageQuality> parseImageQuality(std::string_view text) noexcept
{
    for (const ImageQuality q : g_allImageQualities)
    {
        if (text == toLabel(q) || text == toIdentifier(q))
        {
            return q;
        }
    }
    return std::nullopt;
}

std::optional<QrSize> parseQrSize(std::string_view text) noexcept
{
    for (const QrSize s : g_allQrSizes)
    {
        if (text == toLabel(s) || text == toIdentifier(s))
        {
            return s;
        }
    }
    return std::nullopt;
}

bool isSupportedLanguage(std::string_view tag) noexcept
{
    return tag == "ar" || tag == "en";
}

std::filesystem::path defaultSavePath()
{
    return homeDirectory() / std::filesystem::path{ g_defaultSaveDirName };
}

AppSettings defaultSettings()
{
    AppSettings settings{};
    settings.savePath = defaultSavePath();
    return settings;
}

} // namespace qrpass::core
