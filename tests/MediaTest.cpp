#include <gtest/gtest.h>

#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "encode/EncoderFFmpeg.hpp"
#include "image/ImageWriterPng.hpp"
#include "Fakes.hpp"

namespace snarp {
namespace {

std::string tempPath(const std::string& name) {
    const char* tmp = std::getenv("TMPDIR");
    std::string dir = tmp && tmp[0] ? tmp : "/tmp";
    return dir + "/snarp_test_" + std::to_string(::getpid()) + "_" + name;
}

std::vector<unsigned char> readBytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<unsigned char>(std::istreambuf_iterator<char>(in),
                                      std::istreambuf_iterator<char>());
}

Image gradient(int w, int h, PixelOrder order) {
    Image image;
    image.w = w;
    image.h = h;
    image.order = order;
    image.pixels.resize(image.expectedSize());
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            size_t i = (static_cast<size_t>(y) * w + x) * 3;
            image.pixels[i] = static_cast<std::uint8_t>(x * 4);
            image.pixels[i + 1] = static_cast<std::uint8_t>(y * 4);
            image.pixels[i + 2] = 128;
        }
    }
    return image;
}

TEST(PngWriterTest, WritesPngFile) {
    std::string path = tempPath("shot.png");
    std::string err;
    Image image = gradient(32, 16, PixelOrder::BGR);
    Image before = image;
    ASSERT_TRUE(writePng(path, image, err)) << err;
    EXPECT_EQ(image.pixels, before.pixels);
    EXPECT_EQ(image.order, PixelOrder::BGR);

    std::vector<unsigned char> bytes = readBytes(path);
    ASSERT_GT(bytes.size(), 8u);
    const unsigned char signature[8] = {0x89, 'P', 'N', 'G',
                                        '\r', '\n', 0x1a, '\n'};
    for (int i = 0; i < 8; ++i) {
        EXPECT_EQ(bytes[i], signature[i]);
    }
    std::remove(path.c_str());
}

TEST(PngWriterTest, ReportsFailures) {
    std::string err;
    EXPECT_FALSE(writePng(tempPath("empty.png"), Image{}, err));
    EXPECT_EQ(err, "cannot write an empty image");

    EXPECT_FALSE(writePng("/definitely/not/here/shot.png",
                          gradient(4, 4, PixelOrder::RGB), err));
    EXPECT_FALSE(err.empty());
}

TEST(EncoderFFmpegTest, RejectsBadParameters) {
    test::CapturingLogSink log;
    auto encoder = CreateEncoderFFmpeg(log);
    std::string err;
    EXPECT_FALSE(encoder->open(tempPath("odd.mp4"), 33, 32, 30, err));
    EXPECT_FALSE(encoder->open(tempPath("zero.mp4"), 0, 32, 30, err));
    EXPECT_FALSE(encoder->open(tempPath("fps.mp4"), 32, 32, 0, err));
    EXPECT_EQ(err, "frame rate must be positive");
    // Closing a writer that never opened is harmless.
    encoder->close();
    encoder->close();
}

TEST(EncoderFFmpegTest, UnwritablePathIsInitFailure) {
    test::CapturingLogSink log;
    auto encoder = CreateEncoderFFmpeg(log);
    std::string err;
    EXPECT_FALSE(
        encoder->open("/definitely/not/here/rec.mp4", 64, 48, 30, err));
    EXPECT_FALSE(err.empty());
    encoder->close();
}

TEST(EncoderFFmpegTest, EncodesBgrFrames) {
    test::CapturingLogSink log;
    auto encoder = CreateEncoderFFmpeg(log);
    ASSERT_EQ(encoder->inputOrder(), PixelOrder::BGR);

    std::string path = tempPath("rec.mp4");
    std::string err;
    ASSERT_TRUE(encoder->open(path, 64, 48, 30, err)) << err;
    Image frame = gradient(64, 48, PixelOrder::BGR);
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(encoder->writeFrame(frame, err)) << err;
    }

    Image wrongSize = gradient(32, 48, PixelOrder::BGR);
    EXPECT_FALSE(encoder->writeFrame(wrongSize, err));
    Image wrongOrder = gradient(64, 48, PixelOrder::RGB);
    EXPECT_FALSE(encoder->writeFrame(wrongOrder, err));
    EXPECT_EQ(err, "frame is not in BGR order");

    encoder->close();
    encoder->close();
    EXPECT_EQ(encoder->framesWritten(), 10u);
    EXPECT_GT(readBytes(path).size(), 0u);
    std::remove(path.c_str());
}

}  // namespace
}  // namespace snarp
