#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace snarp {

enum class PixelOrder { RGB, BGR };

// 8-bit, 3 channel, tightly packed rows, top row first.
struct Image {
    int w = 0;
    int h = 0;
    PixelOrder order = PixelOrder::RGB;
    std::vector<std::uint8_t> pixels;

    bool empty() const {
        return w <= 0 || h <= 0 || pixels.empty();
    }
    size_t expectedSize() const {
        return static_cast<size_t>(w) * static_cast<size_t>(h) * 3u;
    }
};

// Output (Wayland) or screen geometry in the flat global coordinate space.
struct OutputInfo {
    std::string name;
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
    float scale = 1.0f;
};

}  // namespace snarp
