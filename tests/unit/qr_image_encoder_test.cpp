#include "qrpass/qr/QrImageEncoder.hpp"
#include "test_utils/QrTestReader.hpp"

#include <QImage>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

using qrpass::qr::ColorFormatError;
using qrpass::qr::EncodedQr;
using qrpass::qr::QrImageEncoder;
using qrpass::qr::RenderOptions;

namespace
{

constexpr std::string_view kEnvelope{ "3q2+7wABAgMEBQYHCAkKCw==:q83vEjRWeJq83vEjRWeJq6vN7xI0VniavN7xI0VniQ==" };

QImage loadPng(const EncodedQr& qr)
{
    return QImage::fromData(qr.image.png.data(), static_cast<int>(qr.image.png.size()), "PNG");
}

} // namespace

TEST(QrImageEncoder, ProducesPngAtRequestedSize)
{
    QrImageEncoder encoder{};
    for (const int size : { 200, 300, 400, 500 })
    {
        RenderOptions options{};
        options.pixelSize = size;
        const auto result{ encoder.encode(kEnvelope, options) };
        ASSERT_TRUE(std::holds_alternative<EncodedQr>(result)) << size;

        const auto& qr{ std::get<EncodedQr>(result) };
        EXPECT_EQ(qr.image.pixelSize, size);
        const QImage image{ loadPng(qr) };
        ASSERT_FALSE(image.isNull()) << size;
        EXPECT_EQ(image.width(), size);
        EXPECT_EQ(image.height(), size);
    }
}

TEST(QrImageEncoder, UsesConfiguredColors)
{
    RenderOptions options{};
    options.pixelSize = 400;
    options.foreground = "#1A237E";
    options.background = "#fffde7";
    const auto result{ QrImageEncoder{}.encode(kEnvelope, options) };
    ASSERT_TRUE(std::holds_alternative<EncodedQr>(result));

    const auto& qr{ std::get<EncodedQr>(result) };
    const QImage image{ loadPng(qr) };
    ASSERT_FALSE(image.isNull());

    // Quiet zone corner, then the top-left finder pattern just inside it.
    const QRgb corner{ image.pixel(0, 0) };
    EXPECT_EQ(qRed(corner), 0xFF);
    EXPECT_EQ(qGreen(corner), 0xFD);
    EXPECT_EQ(qBlue(corner), 0xE7);

    const int side{ (qr.symbol.width + (2 * qrpass::qr::g_quietZoneModules)) * qrpass::qr::g_moduleScale };
    const int finder{ (((qrpass::qr::g_quietZoneModules * qrpass::qr::g_moduleScale) + 5) * 400) / side };
    const QRgb dark{ image.pixel(finder, finder) };
    EXPECT_EQ(qRed(dark), 0x1A);
    EXPECT_EQ(qGreen(dark), 0x23);
    EXPECT_EQ(qBlue(dark), 0x7E);
}

TEST(QrImageEncoder, RasterDecodesBackToText)
{
    RenderOptions options{};
    options.pixelSize = 400;
    const auto result{ QrImageEncoder{}.encode(kEnvelope, options) };
    ASSERT_TRUE(std::holds_alternative<EncodedQr>(result));

    const auto& qr{ std::get<EncodedQr>(result) };
    const QImage image{ loadPng(qr) };
    ASSERT_FALSE(image.isNull());

    const auto sampled{ qrpass::test_utils::sampleSymbol(image, qRgb(0, 0, 0)) };
    ASSERT_TRUE(sampled.has_value());
    EXPECT_EQ(sampled->version, qr.symbol.version);
    EXPECT_EQ(sampled->width, qr.symbol.width);
    EXPECT_EQ(*sampled, qr.symbol);

    const auto decoded{ qrpass::test_utils::decodeSymbol(*sampled) };
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->eccLevelBits, 2);
    EXPECT_EQ(decoded->text, kEnvelope);
}

TEST(QrImageEncoder, RejectsInvalidColorsBeforeEncoding)
{
    QrImageEncoder encoder{};

    RenderOptions badForeground{};
    badForeground.foreground = "#GGGGGG";
    const auto fg{ encoder.encode(kEnvelope, badForeground) };
    ASSERT_TRUE(std::holds_alternative<ColorFormatError>(fg));
    EXPECT_EQ(std::get<ColorFormatError>(fg), ColorFormatError::InvalidForeground);

    RenderOptions badBackground{};
    badBackground.background = "white";
    const auto bg{ encoder.encode(kEnvelope, badBackground) };
    ASSERT_TRUE(std::holds_alternative<ColorFormatError>(bg));
    EXPECT_EQ(std::get<ColorFormatError>(bg), ColorFormatError::InvalidBackground);

    // Checked before the payload, so even an empty payload reports the color.
    RenderOptions bothBad{};
    bothBad.foreground = "000000";
    bothBad.background = "#12";
    const auto both{ encoder.encode("", bothBad) };
    ASSERT_TRUE(std::holds_alternative<ColorFormatError>(both));
    EXPECT_EQ(std::get<ColorFormatError>(both), ColorFormatError::InvalidForeground);
}

TEST(QrImageEncoder, QualityDoesNotChangePixels)
{
    const auto symbol{ qrpass::qr::encodeQrSymbol(kEnvelope) };
    const QImage raster{ QrImageEncoder::rasterize(symbol, 300, { 0, 0, 0 }, { 255, 255, 255 }) };

    const auto low{ QrImageEncoder::toPng(raster, 50) };
    const auto best{ QrImageEncoder::toPng(raster, 100) };
    const QImage lowImage{ QImage::fromData(low.data(), static_cast<int>(low.size()), "PNG") };
    const QImage bestImage{ QImage::fromData(best.data(), static_cast<int>(best.size()), "PNG") };
    ASSERT_FALSE(lowImage.isNull());
    ASSERT_FALSE(bestImage.isNull());
    EXPECT_EQ(lowImage.convertToFormat(QImage::Format_RGB32), bestImage.convertToFormat(QImage::Format_RGB32));
}

TEST(QrImageEncoder, RasterizeRejectsNonPositiveSize)
{
    const auto symbol{ qrpass::qr::encodeQrSymbol("x") };
    EXPECT_THROW(static_cast<void>(QrImageEncoder::rasterize(symbol, 0, {}, { 255, 255, 255 })),
                 std::invalid_argument);
}

TEST(QrImageEncoder, DescribesColorErrors)
{
    EXPECT_FALSE(qrpass::qr::describe(ColorFormatError::InvalidForeground).empty());
    EXPECT_NE(qrpass::qr::describe(ColorFormatError::InvalidForeground),
              qrpass::qr::describe(ColorFormatError::InvalidBackground));
}
