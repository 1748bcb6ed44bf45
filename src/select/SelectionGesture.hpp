#pragma once

#include <optional>
#include <string>

#include "core/Region.hpp"

namespace snarp {

inline constexpr int kMinSelectionSize = 10;

// Axis-aligned rectangle between the press point and the pointer, in the
// overlay's pixel space. Width or height may be zero while dragging.
struct DragRect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
};

// Press -> drag -> release tracking for rubber-band selection.
class SelectionGesture {
public:
    void press(int x, int y);
    void drag(int x, int y);
    // Ends the gesture. Returns the selected region, or nullopt when there
    // was no press or the rectangle is smaller than kMinSelectionSize in
    // either dimension (err then explains why).
    std::optional<Region> release(int x, int y, std::string& err);
    void reset();

    bool active() const {
        return active_;
    }
    // Current rubber band, if a press is in progress.
    std::optional<DragRect> current() const;

private:
    bool active_ = false;
    int startX_ = 0;
    int startY_ = 0;
    int curX_ = 0;
    int curY_ = 0;
};

DragRect normalizedRect(int x1, int y1, int x2, int y2);

}  // namespace snarp
