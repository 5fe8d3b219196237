#include <gtest/gtest.h>

#include "imgmgr/format.hpp"
#include "test_support.hpp"

using namespace imgmgr;

TEST(Format, FromMime)
{
    EXPECT_EQ(format_from_mime("image/jpeg"), ImageFormat::Jpeg);
    EXPECT_EQ(format_from_mime("image/jpg"), ImageFormat::Jpeg);
    EXPECT_EQ(format_from_mime("image/png"), ImageFormat::Png);
    EXPECT_EQ(format_from_mime("image/gif"), ImageFormat::Gif);
    EXPECT_EQ(format_from_mime("image/webp"), ImageFormat::Webp);
    EXPECT_FALSE(format_from_mime("image/bmp").has_value());
    EXPECT_FALSE(format_from_mime("image/svg+xml").has_value());
}

TEST(Format, FromExtension)
{
    EXPECT_EQ(format_from_extension("JPG"), ImageFormat::Jpeg);
    EXPECT_EQ(format_from_extension("jpeg"), ImageFormat::Jpeg);
    EXPECT_EQ(format_from_extension("webp"), ImageFormat::Webp);
    EXPECT_FALSE(format_from_extension("tiff").has_value());
    EXPECT_FALSE(format_from_extension("").has_value());
}

TEST(Format, NamesAndAlpha)
{
    EXPECT_STREQ(mime_type(ImageFormat::Png), "image/png");
    EXPECT_STREQ(extension(ImageFormat::Jpeg), "jpg");
    EXPECT_FALSE(supports_alpha(ImageFormat::Jpeg));
    EXPECT_TRUE(supports_alpha(ImageFormat::Png));
    EXPECT_TRUE(supports_alpha(ImageFormat::Gif));
    EXPECT_TRUE(supports_alpha(ImageFormat::Webp));
}

TEST(Format, SniffMagicBytes)
{
    const unsigned char jpeg[] = {0xFF, 0xD8, 0xFF, 0xE0};
    const unsigned char png[]  = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    const unsigned char gif[]  = {'G', 'I', 'F', '8', '9', 'a'};
    const unsigned char webp[] = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'E', 'B', 'P'};
    const unsigned char tiff[] = {'I', 'I', 0x2A, 0x00};
    const unsigned char text[] = {'<', 's', 'v', 'g'};

    EXPECT_EQ(sniff_mime(jpeg, sizeof(jpeg)), "image/jpeg");
    EXPECT_EQ(sniff_mime(png, sizeof(png)), "image/png");
    EXPECT_EQ(sniff_mime(gif, sizeof(gif)), "image/gif");
    EXPECT_EQ(sniff_mime(webp, sizeof(webp)), "image/webp");
    EXPECT_EQ(sniff_mime(tiff, sizeof(tiff)), "image/tiff");
    EXPECT_EQ(sniff_mime(text, sizeof(text)), "");
    EXPECT_EQ(sniff_mime(nullptr, 0), "");

    const Bytes bmp = imgmgr::test::make_bmp(2, 2);
    EXPECT_EQ(sniff_mime(bmp.data(), bmp.size()), "image/bmp");
}
