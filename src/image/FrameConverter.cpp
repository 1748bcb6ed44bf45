#include "image/FrameConverter.hpp"

extern "C" {
#include <libavutil/pixfmt.h>
#include <libswscale/swscale.h>
}

#include <utility>

namespace snarp {

void convertChannelOrder(Image& image, PixelOrder order) {
    if (image.order == order) {
        return;
    }
    const size_t count = static_cast<size_t>(image.w) *
                         static_cast<size_t>(image.h);
    std::uint8_t* px = image.pixels.data();
    for (size_t i = 0; i < count; ++i) {
        std::swap(px[i * 3 + 0], px[i * 3 + 2]);
    }
    image.order = order;
}

FrameConverter::~FrameConverter() {
    if (sws_) {
        sws_freeContext(sws_);
    }
}

bool FrameConverter::resize(const Image& in, int width, int height, Image& out,
                            std::string& err) {
    if (in.empty() || in.pixels.size() < in.expectedSize()) {
        err = "resize: source frame is empty or truncated";
        return false;
    }
    if (width <= 0 || height <= 0) {
        err = "resize: target size must be positive";
        return false;
    }

    // The pixel order is carried through unchanged, so the format only has
    // to describe 3 packed bytes per pixel.
    const AVPixelFormat fmt = AV_PIX_FMT_RGB24;
    sws_ = sws_getCachedContext(sws_, in.w, in.h, fmt, width, height, fmt,
                                SWS_AREA, nullptr, nullptr, nullptr);
    if (!sws_) {
        err = "resize: sws_getCachedContext failed";
        return false;
    }

    out.w = width;
    out.h = height;
    out.order = in.order;
    out.pixels.resize(out.expectedSize());

    const std::uint8_t* srcData[4] = {in.pixels.data(), nullptr, nullptr,
                                      nullptr};
    const int srcStride[4] = {in.w * 3, 0, 0, 0};
    std::uint8_t* dstData[4] = {out.pixels.data(), nullptr, nullptr, nullptr};
    const int dstStride[4] = {width * 3, 0, 0, 0};

    int rows = sws_scale(sws_, srcData, srcStride, 0, in.h, dstData, dstStride);
    if (rows != height) {
        err = "resize: sws_scale produced " + std::to_string(rows) +
              " rows, expected " + std::to_string(height);
        return false;
    }
    return true;
}

bool FrameConverter::prepare(Image& frame, PixelOrder order, int width,
                             int height, std::string& err) {
    if (frame.empty() || frame.pixels.size() < frame.expectedSize()) {
        err = "captured frame is empty or truncated";
        return false;
    }
    convertChannelOrder(frame, order);
    if (frame.w == width && frame.h == height) {
        return true;
    }
    if (!resize(frame, width, height, scratch_, err)) {
        return false;
    }
    std::swap(frame, scratch_);
    return true;
}

}  // namespace snarp
