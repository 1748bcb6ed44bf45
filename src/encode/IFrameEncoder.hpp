#pragma once

#include <cstdint>
#include <string>

#include "capture/CaptureTypes.hpp"

namespace snarp {

// A video sink bound to one output file. Frames must arrive in inputOrder()
// at exactly the size given to open().
class IFrameEncoder {
public:
    virtual ~IFrameEncoder() = default;
    virtual bool open(const std::string& path, int width, int height, int fps,
                      std::string& err) = 0;
    virtual bool writeFrame(const Image& frame, std::string& err) = 0;
    // Flushes and finalizes the container. Safe to call more than once and
    // on a sink that never opened.
    virtual void close() = 0;
    virtual PixelOrder inputOrder() const = 0;
    virtual std::uint64_t framesWritten() const = 0;
};

}  // namespace snarp
