#include <gtest/gtest.h>

#include "image/FrameConverter.hpp"

namespace snarp {
namespace {

Image solid(int w, int h, std::uint8_t r, std::uint8_t g, std::uint8_t b) {
    Image image;
    image.w = w;
    image.h = h;
    image.order = PixelOrder::RGB;
    image.pixels.resize(image.expectedSize());
    for (size_t i = 0; i < image.pixels.size(); i += 3) {
        image.pixels[i] = r;
        image.pixels[i + 1] = g;
        image.pixels[i + 2] = b;
    }
    return image;
}

TEST(FrameConverterTest, SwapsChannelOrder) {
    Image image = solid(2, 2, 1, 2, 3);
    convertChannelOrder(image, PixelOrder::BGR);
    EXPECT_EQ(image.order, PixelOrder::BGR);
    EXPECT_EQ(image.pixels[0], 3);
    EXPECT_EQ(image.pixels[1], 2);
    EXPECT_EQ(image.pixels[2], 1);
    EXPECT_EQ(image.pixels[9], 3);

    // Already in order: untouched.
    convertChannelOrder(image, PixelOrder::BGR);
    EXPECT_EQ(image.pixels[0], 3);
}

TEST(FrameConverterTest, ResizeHalvesSolidImage) {
    FrameConverter converter;
    Image in = solid(16, 8, 200, 100, 50);
    Image out;
    std::string err;
    ASSERT_TRUE(converter.resize(in, 8, 4, out, err)) << err;
    EXPECT_EQ(out.w, 8);
    EXPECT_EQ(out.h, 4);
    ASSERT_EQ(out.pixels.size(), out.expectedSize());
    EXPECT_NEAR(out.pixels[0], 200, 2);
    EXPECT_NEAR(out.pixels[1], 100, 2);
    EXPECT_NEAR(out.pixels[2], 50, 2);
}

TEST(FrameConverterTest, PrepareConvertsAndResizes) {
    FrameConverter converter;
    Image frame = solid(32, 24, 10, 20, 30);
    std::string err;
    ASSERT_TRUE(converter.prepare(frame, PixelOrder::BGR, 16, 12, err)) << err;
    EXPECT_EQ(frame.w, 16);
    EXPECT_EQ(frame.h, 12);
    EXPECT_EQ(frame.order, PixelOrder::BGR);
    EXPECT_NEAR(frame.pixels[0], 30, 2);
    EXPECT_NEAR(frame.pixels[2], 10, 2);

    // Second frame reuses the cached context.
    Image next = solid(32, 24, 10, 20, 30);
    ASSERT_TRUE(converter.prepare(next, PixelOrder::BGR, 16, 12, err)) << err;
    EXPECT_EQ(next.w, 16);
}

TEST(FrameConverterTest, PrepareSameSizeOnlyReorders) {
    FrameConverter converter;
    Image frame = solid(4, 4, 1, 2, 3);
    std::string err;
    ASSERT_TRUE(converter.prepare(frame, PixelOrder::RGB, 4, 4, err));
    EXPECT_EQ(frame.pixels[0], 1);
    EXPECT_EQ(frame.w, 4);
}

TEST(FrameConverterTest, RejectsBadInput) {
    FrameConverter converter;
    std::string err;
    Image empty;
    EXPECT_FALSE(converter.prepare(empty, PixelOrder::BGR, 4, 4, err));
    EXPECT_FALSE(err.empty());

    Image truncated = solid(4, 4, 0, 0, 0);
    truncated.pixels.resize(10);
    EXPECT_FALSE(converter.prepare(truncated, PixelOrder::BGR, 4, 4, err));

    Image out;
    EXPECT_FALSE(converter.resize(solid(4, 4, 0, 0, 0), 0, 4, out, err));
}

}  // namespace
}  // namespace snarp
