#include <gtest/gtest.h>

#include <stdexcept>

#include "imgmgr/pixel_ops.hpp"
#include "test_support.hpp"

using namespace imgmgr;
using imgmgr::test::at;
using imgmgr::test::make_gradient;
using imgmgr::test::make_gray;

TEST(PixelOps, ResizeToSameSizeIsExactCopy)
{
    const ImageU8 src = make_gradient(9, 5, 3);
    const ImageU8 out = resize(src, 9, 5, true);

    ASSERT_EQ(out.w(), 9);
    ASSERT_EQ(out.h(), 5);
    ASSERT_EQ(out.c(), 3);
    for (std::size_t i = 0; i < src.byte_size(); ++i) {
        ASSERT_EQ(out.data()[i], src.data()[i]) << "byte " << i;
    }
}

TEST(PixelOps, DownscaleAveragesBlock)
{
    const ImageU8 src = make_gray(2, 2, {0, 100,
                                         200, 100});
    const ImageU8 out = resize(src, 1, 1, true);
    EXPECT_EQ(at(out, 0, 0), 100);
}

// 每 8 欄一條白線，縮 8 倍後每個輸出像素都蓋到剛好一條
TEST(PixelOps, LargeDownscaleKeepsThinLines)
{
    ImageU8 src(400, 400, 1);
    for (int y = 0; y < 400; ++y)
        for (int x = 0; x < 400; ++x)
            src.data()[static_cast<std::size_t>(y) * 400 + x] = (x % 8 == 0) ? 255 : 0;

    const ImageU8 out = resize(src, 50, 50, true);
    ASSERT_EQ(out.w(), 50);
    ASSERT_EQ(out.h(), 50);

    double sum = 0.0;
    for (std::size_t i = 0; i < out.byte_size(); ++i) sum += out.data()[i];
    EXPECT_NEAR(sum / out.byte_size(), 255.0 / 8.0, 1.0);

    EXPECT_EQ(at(out, 0, 0), 32);
    EXPECT_EQ(at(out, 49, 49), 32);
}

TEST(PixelOps, LargeDownscaleFlattensWholeSpan)
{
    // 4x1 → 1x1：只有最右邊一格是不透明白
    ImageU8 src(1, 4, 4);
    for (int x = 0; x < 4; ++x) {
        for (int c = 0; c < 3; ++c) src.data()[x * 4 + c] = 255;
        src.data()[x * 4 + 3] = (x == 3) ? 255 : 0;
    }

    const ImageU8 flat = resize(src, 1, 1, false);
    ASSERT_EQ(flat.c(), 3);
    EXPECT_EQ(at(flat, 0, 0, 0), 64);
    EXPECT_EQ(at(flat, 0, 0, 2), 64);
}

TEST(PixelOps, MirroredDownscaleAveragesFromOrigin)
{
    const ImageU8 src = make_gray(4, 1, {0, 40, 100, 200});
    const ImageU8 out = resample(src, SourceRect{3, 0, -4, 1}, 2, 1, true);
    EXPECT_EQ(at(out, 0, 0), 150);
    EXPECT_EQ(at(out, 1, 0), 20);
}

TEST(PixelOps, ResizeKeepsAlphaWhenPreserved)
{
    ImageU8 src(1, 1, 4);
    src.data()[0] = 200; src.data()[1] = 100; src.data()[2] = 50; src.data()[3] = 128;

    const ImageU8 kept = resize(src, 2, 2, true);
    ASSERT_EQ(kept.c(), 4);
    EXPECT_EQ(at(kept, 1, 1, 0), 200);
    EXPECT_EQ(at(kept, 1, 1, 3), 128);
}

TEST(PixelOps, ResizeFlattensAlphaOnBlack)
{
    ImageU8 src(1, 1, 4);
    src.data()[0] = 200; src.data()[1] = 100; src.data()[2] = 50; src.data()[3] = 128;

    const ImageU8 flat = resize(src, 1, 1, false);
    ASSERT_EQ(flat.c(), 3);
    EXPECT_EQ(at(flat, 0, 0, 0), 100);
    EXPECT_EQ(at(flat, 0, 0, 1), 50);
    EXPECT_EQ(at(flat, 0, 0, 2), 25);
}

TEST(PixelOps, NegativeWidthSourceMirrors)
{
    const ImageU8 src = make_gradient(7, 3, 3);
    const ImageU8 out = resample(src, SourceRect{6, 0, -7, 3}, 7, 3, true);

    for (int y = 0; y < 3; ++y) {
        for (int x = 0; x < 7; ++x) {
            for (int c = 0; c < 3; ++c) {
                ASSERT_EQ(at(out, x, y, c), at(src, 6 - x, y, c));
            }
        }
    }
}

TEST(PixelOps, FlipHorizontal)
{
    const ImageU8 src = make_gray(3, 2, {1, 2, 3,
                                         4, 5, 6});
    const ImageU8 out = flip_horizontal(src);
    EXPECT_EQ(at(out, 0, 0), 3);
    EXPECT_EQ(at(out, 2, 0), 1);
    EXPECT_EQ(at(out, 0, 1), 6);
    EXPECT_EQ(at(out, 1, 1), 5);
}

TEST(PixelOps, CropTruncatesFractionalOrigin)
{
    const ImageU8 src = make_gray(4, 4, { 0,  1,  2,  3,
                                          4,  5,  6,  7,
                                          8,  9, 10, 11,
                                         12, 13, 14, 15});
    const ImageU8 out = crop(src, CropRect{1.7, 1.2, 2, 2});
    ASSERT_EQ(out.w(), 2);
    ASSERT_EQ(out.h(), 2);
    EXPECT_EQ(at(out, 0, 0), 5);
    EXPECT_EQ(at(out, 1, 0), 6);
    EXPECT_EQ(at(out, 0, 1), 9);
    EXPECT_EQ(at(out, 1, 1), 10);
}

TEST(PixelOps, CropClampsToImage)
{
    const ImageU8 src = make_gradient(4, 4, 3);
    const ImageU8 out = crop(src, CropRect{3, 3, 4, 4});
    EXPECT_EQ(out.w(), 1);
    EXPECT_EQ(out.h(), 1);

    EXPECT_THROW(crop(src, CropRect{10, 10, 2, 2}), std::invalid_argument);
    EXPECT_THROW(crop(src, CropRect{0, 0, 0, 2}), std::invalid_argument);
}

TEST(PixelOps, RotateCounterClockwise)
{
    const ImageU8 src = make_gray(2, 2, {10, 20,
                                         30, 40});

    const ImageU8 r90 = rotate(src, 90);
    EXPECT_EQ(at(r90, 0, 0), 20);
    EXPECT_EQ(at(r90, 1, 0), 40);
    EXPECT_EQ(at(r90, 0, 1), 10);
    EXPECT_EQ(at(r90, 1, 1), 30);

    const ImageU8 r180 = rotate(src, 180);
    EXPECT_EQ(at(r180, 0, 0), 40);
    EXPECT_EQ(at(r180, 1, 1), 10);

    const ImageU8 r270 = rotate(src, 270);
    EXPECT_EQ(at(r270, 0, 0), 30);
    EXPECT_EQ(at(r270, 1, 0), 10);
    EXPECT_EQ(at(r270, 0, 1), 40);
    EXPECT_EQ(at(r270, 1, 1), 20);
}

TEST(PixelOps, RotateSwapsDimensions)
{
    const ImageU8 src = make_gradient(5, 3, 4);
    const ImageU8 out = rotate(src, 270);
    EXPECT_EQ(out.w(), 3);
    EXPECT_EQ(out.h(), 5);
    EXPECT_EQ(out.c(), 4);

    EXPECT_THROW(rotate(src, 45), std::invalid_argument);
}

TEST(PixelOps, RejectsBadSizes)
{
    const ImageU8 src = make_gradient(4, 4, 3);
    EXPECT_THROW(resize(src, 0, 4, true), std::invalid_argument);
    EXPECT_THROW(resample(src, SourceRect{0, 0, 0, 4}, 2, 2, true), std::invalid_argument);
    EXPECT_THROW(resize(ImageU8(), 2, 2, true), std::invalid_argument);
}
