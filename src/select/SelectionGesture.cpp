#include "select/SelectionGesture.hpp"

#include <algorithm>
#include <cstdlib>

namespace snarp {

DragRect normalizedRect(int x1, int y1, int x2, int y2) {
    DragRect rect;
    rect.x = std::min(x1, x2);
    rect.y = std::min(y1, y2);
    rect.w = std::abs(x2 - x1);
    rect.h = std::abs(y2 - y1);
    return rect;
}

void SelectionGesture::press(int x, int y) {
    active_ = true;
    startX_ = x;
    startY_ = y;
    curX_ = x;
    curY_ = y;
}

void SelectionGesture::drag(int x, int y) {
    if (!active_) {
        return;
    }
    curX_ = x;
    curY_ = y;
}

std::optional<Region> SelectionGesture::release(int x, int y,
                                                std::string& err) {
    if (!active_) {
        err = "selection released without a press";
        return std::nullopt;
    }
    active_ = false;
    curX_ = x;
    curY_ = y;

    DragRect rect = normalizedRect(startX_, startY_, x, y);
    if (rect.w < kMinSelectionSize || rect.h < kMinSelectionSize) {
        err = "Selection too small (minimum " +
              std::to_string(kMinSelectionSize) + "x" +
              std::to_string(kMinSelectionSize) + " pixels)";
        return std::nullopt;
    }
    return Region::create(rect.x, rect.y, rect.w, rect.h, &err);
}

void SelectionGesture::reset() {
    active_ = false;
}

std::optional<DragRect> SelectionGesture::current() const {
    if (!active_) {
        return std::nullopt;
    }
    return normalizedRect(startX_, startY_, curX_, curY_);
}

}  // namespace snarp
