#include "record/CaptureLoop.hpp"

namespace snarp {

CaptureLoop::CaptureLoop(IFrameSource& source, IFrameEncoder& encoder,
                         IPacer& pacer, LogSink& log)
    : source_(source), encoder_(encoder), pacer_(pacer), log_(log) {}

CaptureLoopResult CaptureLoop::run(const Region& region, int fps,
                                   const std::atomic<bool>& cancel) {
    CaptureLoopResult result;
    framesWritten_.store(0, std::memory_order_relaxed);

    const auto frameInterval =
        std::chrono::duration_cast<IPacer::Clock::duration>(
            std::chrono::nanoseconds(1000000000LL / (fps > 0 ? fps : 1)));
    const PixelOrder order = encoder_.inputOrder();
    const int width = region.width();
    const int height = region.height();

    IPacer::TimePoint nextFrameDeadline = pacer_.now();
    std::uint64_t frames = 0;
    Image frame;

    for (;;) {
        if (cancel.load(std::memory_order_acquire)) {
            result.outcome = LoopOutcome::Cancelled;
            break;
        }

        std::string err;
        if (!source_.capture(region, frame, err)) {
            LOG_ERROR(log_, "capture failed after %llu frames: %s",
                      static_cast<unsigned long long>(frames), err.c_str());
            result.outcome = LoopOutcome::CaptureFailed;
            result.error = err;
            break;
        }

        if (frame.w != width || frame.h != height) {
            LOG_DEBUG(log_, "frame %llu captured at %dx%d, resizing to %dx%d",
                      static_cast<unsigned long long>(frames), frame.w,
                      frame.h, width, height);
        }
        if (!converter_.prepare(frame, order, width, height, err)) {
            LOG_ERROR(log_, "frame conversion failed after %llu frames: %s",
                      static_cast<unsigned long long>(frames), err.c_str());
            result.outcome = LoopOutcome::ConvertFailed;
            result.error = err;
            break;
        }

        if (!encoder_.writeFrame(frame, err)) {
            LOG_ERROR(log_, "encoding frame %llu failed: %s",
                      static_cast<unsigned long long>(frames), err.c_str());
            result.outcome = LoopOutcome::EncodeFailed;
            result.error = err;
            break;
        }
        ++frames;
        framesWritten_.store(frames, std::memory_order_relaxed);

        nextFrameDeadline += frameInterval;
        IPacer::TimePoint now = pacer_.now();
        if (nextFrameDeadline > now) {
            pacer_.sleepUntil(nextFrameDeadline);
        } else {
            nextFrameDeadline = now;
        }
    }

    encoder_.close();
    result.framesWritten = frames;
    LOG_INFO(log_, "recording loop finished, frames recorded: %llu",
             static_cast<unsigned long long>(frames));
    return result;
}

}  // namespace snarp
