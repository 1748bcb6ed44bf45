#include "record/Pacer.hpp"

#include <thread>

namespace snarp {

void HybridPacer::sleepUntil(TimePoint deadline) {
    TimePoint coarseEnd = deadline - spinWindow_;
    if (Clock::now() < coarseEnd) {
        std::this_thread::sleep_until(coarseEnd);
    }
    while (Clock::now() < deadline) {
        std::this_thread::yield();
    }
}

}  // namespace snarp
