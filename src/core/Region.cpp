#include "core/Region.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <vector>

namespace snarp {

std::optional<Region> Region::create(int x, int y, int width, int height,
                                     std::string* err) {
    if (width <= 0 || height <= 0) {
        if (err) {
            *err = "width and height must be positive";
        }
        return std::nullopt;
    }
    if (x < 0 || y < 0) {
        if (err) {
            *err = "coordinates must be non-negative";
        }
        return std::nullopt;
    }
    if (width > INT_MAX - x || height > INT_MAX - y) {
        if (err) {
            *err = "region extends past the largest coordinate";
        }
        return std::nullopt;
    }
    return Region(x, y, width, height);
}

Region Region::withEvenDimensions() const {
    return Region(x_, y_, width_ - (width_ % 2), height_ - (height_ % 2));
}

std::string Region::toString() const {
    return std::to_string(x_) + "," + std::to_string(y_) + " " +
           std::to_string(width_) + "x" + std::to_string(height_);
}

std::optional<Region> parseRegion(const std::string& text, std::string* err) {
    std::vector<int> values;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t comma = text.find(',', pos);
        std::string part = text.substr(
            pos, comma == std::string::npos ? std::string::npos : comma - pos);
        if (part.empty()) {
            if (err) {
                *err = "region must be x,y,w,h: " + text;
            }
            return std::nullopt;
        }
        char* end = nullptr;
        errno = 0;
        long value = std::strtol(part.c_str(), &end, 10);
        if (errno != 0 || !end || *end != '\0' || value < INT_MIN ||
            value > INT_MAX) {
            if (err) {
                *err = "invalid number in region: " + part;
            }
            return std::nullopt;
        }
        values.push_back(static_cast<int>(value));
        if (comma == std::string::npos) {
            break;
        }
        pos = comma + 1;
    }
    if (values.size() != 4) {
        if (err) {
            *err = "region must be x,y,w,h: " + text;
        }
        return std::nullopt;
    }
    return Region::create(values[0], values[1], values[2], values[3], err);
}

}  // namespace snarp
