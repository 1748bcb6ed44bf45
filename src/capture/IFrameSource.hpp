#pragma once

#include <string>

#include "capture/CaptureTypes.hpp"
#include "core/Region.hpp"

namespace snarp {

class IFrameSource {
public:
    virtual ~IFrameSource() = default;
    virtual std::string name() const = 0;
    virtual bool isAvailable() const = 0;
    // False when every capture involves user interaction or a slow round
    // trip, so the source is only fit for still screenshots.
    virtual bool supportsContinuous() const = 0;
    // Pixels of the region, nominally region.width() x region.height(). A
    // false return is a capture error; err says why.
    virtual bool capture(const Region& region, Image& out,
                         std::string& err) = 0;
    // Size of the whole capturable desktop, for full-screen snapshots.
    virtual bool desktopSize(int& width, int& height) = 0;
};

}  // namespace snarp
