#pragma once

#include <string>

#include "capture/CaptureTypes.hpp"

struct SwsContext;

namespace snarp {

// Swaps the R and B channels in place when the image is not already in the
// requested order.
void convertChannelOrder(Image& image, PixelOrder order);

// Brings captured frames into the exact layout an encoder was opened with.
// Holds a cached swscale context, so one converter serves one stream.
class FrameConverter {
public:
    FrameConverter() = default;
    ~FrameConverter();

    FrameConverter(const FrameConverter&) = delete;
    FrameConverter& operator=(const FrameConverter&) = delete;

    // Area-filtered resize to exactly width x height; keeps the pixel order.
    bool resize(const Image& in, int width, int height, Image& out,
                std::string& err);

    // Channel order conversion followed by a resize when the size differs.
    bool prepare(Image& frame, PixelOrder order, int width, int height,
                 std::string& err);

private:
    SwsContext* sws_ = nullptr;
    Image scratch_;
};

}  // namespace snarp
