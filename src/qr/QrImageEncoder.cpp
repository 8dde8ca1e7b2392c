#include "qrpass/qr/QrImageEncoder.hpp"
#include <QBuffer>
#include <QByteArray>
#include <stdexcept>

namespace qrpass::qr
{
namespace
{

[[nodiscard]] QRgb toQRgb(qrpass::core::Rgb color) noexcept
{
    return qRgb(color.red, color.green, color.blue);
}

} // namespace

std::string_view describe(ColorFormatError error) noexcept
{
    switch (error)
    {
    case ColorFormatError::InvalidForeground:
        return "QR color must be a hex color such as #000000";
    case ColorFormatError::InvalidBackground:
        return "QR background color must be a hex color such as #FFFFFF";
    }
    return "invalid color";
}

QImage QrImageEncoder::rasterize(const QrSymbol& symbol, int pixelSize, qrpass::core::Rgb foreground,
                                 qrpass::core::Rgb background)
{
    if (symbol.width <= 0 || pixelSize <= 0)
    {
        throw std::invalid_argument("cannot rasterize an empty symbol or a non-positive size");
    }

    const int side{ (symbol.width + (2 * g_quietZoneModules)) * g_moduleScale };
    QImage base{ side, side, QImage::Format_RGB32 };
    if (base.isNull())
    {
        throw std::runtime_error("cannot allocate QR raster");
    }

    const QRgb dark{ toQRgb(foreground) };
    const QRgb light{ toQRgb(background) };
    base.fill(light);

    for (int py{}; py < side; ++py)
    {
        const int my{ (py / g_moduleScale) - g_quietZoneModules };
        if (my < 0 || my >= symbol.width)
        {
            continue;
        }
        auto* line{ reinterpret_cast<QRgb*>(base.scanLine(py)) };
        for (int px{}; px < side; ++px)
        {
            const int mx{ (px / g_moduleScale) - g_quietZoneModules };
            if (mx >= 0 && mx < symbol.width && symbol.isDark(mx, my))
            {
                line[px] = dark;
            }
        }
    }

    if (side == pixelSize)
    {
        return base;
    }
    return base.scaled(pixelSize, pixelSize, Qt::IgnoreAspectRatio, Qt::FastTransformation);
}

std::vector<std::uint8_t> QrImageEncoder::toPng(const QImage& image, int quality)
{
    QByteArray bytes;
    QBuffer buffer{ &bytes };
    if (!buffer.open(QIODevice::WriteOnly) || !image.save(&buffer, "PNG", quality))
    {
        throw std::runtime_error("PNG encoding failed");
    }
    return { reinterpret_cast<const std::uint8_t*>(bytes.constData()),
             reinterpret_cast<const std::uint8_t*>(bytes.constData()) + bytes.size() };
}

RenderResult<EncodedQr> QrImageEncoder::encode(std::string_view text, const RenderOptions& options) const
{
    const auto foreground{ qrpass::core::parseHexColor(options.foreground) };
    if (!foreground.has_value())
    {
        return ColorFormatError::InvalidForeground;
    }
    const auto background{ qrpass::core::parseHexColor(options.background) };
    if (!background.has_value())
    {
        return ColorFormatError::InvalidBackground;
    }

    EncodedQr out{};
    out.symbol = encodeQrSymbol(text);
    const QImage image{ rasterize(out.symbol, options.pixelSize, *foreground, *background) };
    out.image.pixelSize = options.pixelSize;
    out.image.png = toPng(image, options.quality);
    return out;
}

} // namespace qrpass::qr
