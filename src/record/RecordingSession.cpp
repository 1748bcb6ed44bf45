#include "record/RecordingSession.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <utility>

#include "record/CaptureLoop.hpp"

namespace snarp {

const char* sessionStateName(SessionState state) {
    switch (state) {
        case SessionState::NotStarted:
            return "not started";
        case SessionState::Running:
            return "running";
        case SessionState::Stopped:
            return "stopped";
        case SessionState::Failed:
            return "failed";
    }
    return "unknown";
}

// Everything the capture thread touches, shared with the thread so that a
// detached thread never outlives it. The mutex also guards the session's own
// state.
struct RecordingSession::Worker {
    std::unique_ptr<IFrameSource> source;
    std::unique_ptr<IPacer> pacer;
    std::unique_ptr<IFrameEncoder> encoder;
    std::unique_ptr<CaptureLoop> loop;

    std::mutex mutex;
    std::condition_variable doneCv;
    bool loopDone = false;
    CaptureLoopResult result;
    std::atomic<bool> cancel{false};
};

RecordingSession::RecordingSession(std::unique_ptr<IFrameSource> source,
                                   EncoderFactory encoderFactory, LogSink& log,
                                   std::unique_ptr<IPacer> pacer)
    : log_(log),
      encoderFactory_(std::move(encoderFactory)),
      worker_(std::make_shared<Worker>()) {
    worker_->source = std::move(source);
    worker_->pacer = pacer ? std::move(pacer) : std::make_unique<HybridPacer>();
}

RecordingSession::~RecordingSession() {
    if (!thread_.joinable()) {
        return;
    }
    worker_->cancel.store(true, std::memory_order_release);
    bool stuck = false;
    {
        std::lock_guard<std::mutex> lock(worker_->mutex);
        stuck = stopTimedOut_ && !worker_->loopDone;
    }
    if (stuck) {
        LOG_WARN(log_, "Abandoning capture thread that did not stop; %s is "
                       "finalized only if it returns",
                 outputPath_.c_str());
        thread_.detach();
        return;
    }
    thread_.join();
    std::lock_guard<std::mutex> lock(worker_->mutex);
    reapLocked();
}

bool RecordingSession::start(const Region& region, int fps,
                             const std::string& outputPath,
                             SessionError& err) {
    std::lock_guard<std::mutex> lock(worker_->mutex);
    if (state_ != SessionState::NotStarted) {
        err = {ErrorKind::AlreadyStarted,
               std::string("session is ") + sessionStateName(state_)};
        LOG_WARN(log_, "start ignored: %s", err.message.c_str());
        return false;
    }
    if (fps <= 0) {
        err = {ErrorKind::InvalidFrameRate,
               "frame rate must be positive, got " + std::to_string(fps)};
        LOG_ERROR(log_, "Failed to start recording: %s", err.message.c_str());
        return false;
    }
    if (region.width() < 2 || region.height() < 2) {
        err = {ErrorKind::InvalidRegion,
               "region " + region.toString() + " is too small to encode"};
        LOG_ERROR(log_, "Failed to start recording: %s", err.message.c_str());
        return false;
    }
    if (!worker_->source) {
        err = {ErrorKind::SourceUnavailable, "no frame source"};
        LOG_ERROR(log_, "Failed to start recording: %s", err.message.c_str());
        return false;
    }

    const Region even = region.withEvenDimensions();

    std::unique_ptr<IFrameEncoder> encoder =
        encoderFactory_ ? encoderFactory_() : nullptr;
    if (!encoder) {
        err = {ErrorKind::EncoderInit, "no encoder available"};
        LOG_ERROR(log_, "Failed to start recording: %s", err.message.c_str());
        return false;
    }
    std::string openErr;
    if (!encoder->open(outputPath, even.width(), even.height(), fps,
                       openErr)) {
        encoder->close();
        err = {ErrorKind::EncoderInit,
               "cannot initialize video writer for " + outputPath + ": " +
                   openErr};
        LOG_ERROR(log_, "Failed to start recording: %s", err.message.c_str());
        return false;
    }

    Worker& worker = *worker_;
    worker.encoder = std::move(encoder);
    worker.loop = std::make_unique<CaptureLoop>(*worker.source, *worker.encoder,
                                                *worker.pacer, log_);
    worker.cancel.store(false, std::memory_order_release);
    worker.loopDone = false;
    region_ = even;
    fps_ = fps;
    outputPath_ = outputPath;
    stopTimedOut_ = false;
    state_ = SessionState::Running;

    thread_ = std::thread(&RecordingSession::threadMain, worker_, even, fps);
    LOG_INFO(log_, "Started recording to %s (%s @ %d fps)",
             outputPath.c_str(), even.toString().c_str(), fps);
    return true;
}

void RecordingSession::threadMain(std::shared_ptr<Worker> worker,
                                  Region region, int fps) {
    CaptureLoopResult result = worker->loop->run(region, fps, worker->cancel);
    {
        std::lock_guard<std::mutex> lock(worker->mutex);
        worker->result = std::move(result);
        worker->loopDone = true;
    }
    worker->doneCv.notify_all();
}

bool RecordingSession::stop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(worker_->mutex);
    if (state_ != SessionState::Running || !thread_.joinable()) {
        return true;
    }

    LOG_INFO(log_, "Stopping recording...");
    worker_->cancel.store(true, std::memory_order_release);

    Worker& worker = *worker_;
    if (!worker.doneCv.wait_for(lock, timeout,
                                [&worker] { return worker.loopDone; })) {
        stopTimedOut_ = true;
        LOG_WARN(log_,
                 "Recording thread did not stop within %lld ms; encoder "
                 "may still be held",
                 static_cast<long long>(timeout.count()));
        return false;
    }

    // threadMain has published its result and is about to return.
    lock.unlock();
    thread_.join();
    lock.lock();
    reapLocked();

    if (state_ == SessionState::Stopped) {
        LOG_INFO(log_, "Recording stopped successfully");
    }
    return true;
}

namespace {

SessionError loopFailure(const CaptureLoopResult& result) {
    SessionError error;
    switch (result.outcome) {
        case LoopOutcome::Cancelled:
            return error;
        case LoopOutcome::CaptureFailed:
            error.kind = ErrorKind::Capture;
            break;
        case LoopOutcome::ConvertFailed:
            error.kind = ErrorKind::Convert;
            break;
        case LoopOutcome::EncodeFailed:
            error.kind = ErrorKind::Encode;
            break;
    }
    error.message = result.error;
    return error;
}

}  // namespace

void RecordingSession::reapLocked() {
    worker_->loop.reset();
    worker_->encoder.reset();
    stopTimedOut_ = false;
    if (worker_->result.outcome == LoopOutcome::Cancelled) {
        state_ = SessionState::Stopped;
        return;
    }
    state_ = SessionState::Failed;
    failure_ = loopFailure(worker_->result);
}

SessionStatus RecordingSession::status() const {
    std::lock_guard<std::mutex> lock(worker_->mutex);
    const Worker& worker = *worker_;
    SessionStatus status;
    status.state = state_;
    status.stopTimedOut = stopTimedOut_;
    if (state_ == SessionState::Failed) {
        status.error = failure_;
    } else if (state_ == SessionState::Running && stopTimedOut_) {
        status.error = {ErrorKind::StopTimeout,
                        "capture thread did not acknowledge stop"};
    }

    if (state_ == SessionState::Running && worker.loopDone) {
        // Finished on its own (or after a timed-out stop) but not reaped yet.
        status.error = loopFailure(worker.result);
        status.state = worker.result.outcome == LoopOutcome::Cancelled
                           ? SessionState::Stopped
                           : SessionState::Failed;
    }

    if (worker.loopDone || !worker.loop) {
        status.framesWritten = worker.result.framesWritten;
    } else {
        status.framesWritten = worker.loop->framesWritten();
    }
    return status;
}

bool RecordingSession::isRunning() const {
    std::lock_guard<std::mutex> lock(worker_->mutex);
    return state_ == SessionState::Running && !worker_->loopDone;
}

std::optional<Region> RecordingSession::region() const {
    std::lock_guard<std::mutex> lock(worker_->mutex);
    return region_;
}

}  // namespace snarp
