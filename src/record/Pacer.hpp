#pragma once

#include <chrono>

namespace snarp {

// Clock and wait primitive used by the capture loop. Swappable for a
// platform timer, or for a virtual clock in tests.
class IPacer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    virtual ~IPacer() = default;
    virtual TimePoint now() = 0;
    // Returns no earlier than deadline, as closely after it as the strategy
    // allows. Returns immediately for deadlines in the past.
    virtual void sleepUntil(TimePoint deadline) = 0;
};

// Coarse sleep_until for all but the last spinWindow before the deadline,
// then a busy poll of the clock. Typical pacing error is well under a
// millisecond on an idle machine; under scheduler pressure the coarse sleep
// can still overshoot by one scheduler tick.
class HybridPacer final : public IPacer {
public:
    explicit HybridPacer(
        std::chrono::microseconds spinWindow = std::chrono::milliseconds(1))
        : spinWindow_(spinWindow) {}

    TimePoint now() override {
        return Clock::now();
    }
    void sleepUntil(TimePoint deadline) override;

private:
    std::chrono::microseconds spinWindow_;
};

}  // namespace snarp
