#include "qrpass/core/HexColor.hpp"
#include <gtest/gtest.h>

using qrpass::core::isValidHexColor;
using qrpass::core::parseHexColor;
using qrpass::core::Rgb;

TEST(HexColor, AcceptsShortAndLongForms)
{
    for (const char* ok : { "#000", "#fff", "#FFF", "#1e3a8a", "#000000", "#FFFFFF", "#aBc123" })
    {
        EXPECT_TRUE(isValidHexColor(ok)) << ok;
    }
}

TEST(HexColor, RejectsMalformedColors)
{
    for (const char* bad : { "", "#", "000000", "#00", "#0000", "#00000", "#0000000", "#gggggg", "# 00000",
                             "#00000 ", "black", "##00000" })
    {
        EXPECT_FALSE(isValidHexColor(bad)) << bad;
    }
}

TEST(HexColor, ParsesComponents)
{
    EXPECT_EQ(parseHexColor("#1e3a8a"), (Rgb{ 0x1EU, 0x3AU, 0x8AU }));
    EXPECT_EQ(parseHexColor("#FFFFFF"), (Rgb{ 0xFFU, 0xFFU, 0xFFU }));
}

TEST(HexColor, ShortFormExpandsEachDigit)
{
    EXPECT_EQ(parseHexColor("#abc"), (Rgb{ 0xAAU, 0xBBU, 0xCCU }));
    EXPECT_EQ(parseHexColor("#f00"), (Rgb{ 0xFFU, 0x00U, 0x00U }));
}

TEST(HexColor, ParseRejectsWhatValidationRejects)
{
    EXPECT_FALSE(parseHexColor("#12345").has_value());
    EXPECT_FALSE(parseHexColor("123456").has_value());
}
