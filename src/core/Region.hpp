#pragma once

#include <optional>
#include <string>

namespace snarp {

// Rectangle in screen pixel space, top-left origin. Always satisfies
// x >= 0, y >= 0, width > 0, height > 0 when obtained from create(), and
// right() and bottom() fit in an int.
class Region {
public:
    static std::optional<Region> create(int x, int y, int width, int height,
                                        std::string* err = nullptr);

    int x() const {
        return x_;
    }
    int y() const {
        return y_;
    }
    int width() const {
        return width_;
    }
    int height() const {
        return height_;
    }
    int right() const {
        return x_ + width_;
    }
    int bottom() const {
        return y_ + height_;
    }

    // Width and height rounded down to even numbers, as required by
    // chroma-subsampled encoders. A 1 px dimension becomes 0; callers that
    // encode must reject such regions first.
    Region withEvenDimensions() const;

    bool operator==(const Region& other) const {
        return x_ == other.x_ && y_ == other.y_ && width_ == other.width_ &&
               height_ == other.height_;
    }
    bool operator!=(const Region& other) const {
        return !(*this == other);
    }

    std::string toString() const;

private:
    Region(int x, int y, int width, int height)
        : x_(x), y_(y), width_(width), height_(height) {}

    int x_ = 0;
    int y_ = 0;
    int width_ = 0;
    int height_ = 0;
};

// Parses "x,y,w,h".
std::optional<Region> parseRegion(const std::string& text, std::string* err);

}  // namespace snarp
