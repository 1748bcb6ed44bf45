#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "capture/IFrameSource.hpp"
#include "core/Region.hpp"
#include "encode/IFrameEncoder.hpp"
#include "image/FrameConverter.hpp"
#include "platform/Log.hpp"
#include "record/Pacer.hpp"

namespace snarp {

// ConvertFailed covers frames the source delivered but that could not be
// brought to the encoder's size and channel order.
enum class LoopOutcome {
    Cancelled,
    CaptureFailed,
    ConvertFailed,
    EncodeFailed,
};

struct CaptureLoopResult {
    LoopOutcome outcome = LoopOutcome::Cancelled;
    std::uint64_t framesWritten = 0;
    std::string error;
};

// Capture -> convert -> encode at a target rate until cancelled or a frame
// fails. The encoder must already be open at the region's size; run() closes
// it exactly once on every exit path.
//
// Cancellation is observed only at the top of a cycle, so stop latency is
// bounded by one frame interval plus one capture and encode.
//
// Pacing skips rather than queues: when a cycle overruns its budget the
// deadline is reset to now, so a slow source lowers the effective frame rate
// instead of building a backlog.
class CaptureLoop {
public:
    CaptureLoop(IFrameSource& source, IFrameEncoder& encoder, IPacer& pacer,
                LogSink& log);

    CaptureLoopResult run(const Region& region, int fps,
                          const std::atomic<bool>& cancel);

    // Safe to poll from another thread while run() is active.
    std::uint64_t framesWritten() const {
        return framesWritten_.load(std::memory_order_relaxed);
    }

private:
    IFrameSource& source_;
    IFrameEncoder& encoder_;
    IPacer& pacer_;
    LogSink& log_;
    FrameConverter converter_;
    std::atomic<std::uint64_t> framesWritten_{0};
};

}  // namespace snarp
