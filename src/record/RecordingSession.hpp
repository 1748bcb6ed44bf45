#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "capture/IFrameSource.hpp"
#include "core/Region.hpp"
#include "encode/IFrameEncoder.hpp"
#include "platform/Log.hpp"
#include "record/Pacer.hpp"
#include "record/SessionError.hpp"

namespace snarp {

enum class SessionState { NotStarted, Running, Stopped, Failed };

const char* sessionStateName(SessionState state);

struct SessionStatus {
    SessionState state = SessionState::NotStarted;
    std::uint64_t framesWritten = 0;
    SessionError error;
    // Set once a stop() gave up waiting; the loop may still hold the
    // encoder and the capture thread.
    bool stopTimedOut = false;
};

using EncoderFactory = std::function<std::unique_ptr<IFrameEncoder>()>;

// One recording: NotStarted -> Running -> Stopped or Failed, exactly once.
// The capture loop runs on a thread owned by the session. start() and stop()
// must be called from one thread at a time.
//
// The destructor joins the thread, except after a stop() that timed out:
// then the thread is detached and keeps the source and encoder alive on its
// own, closing the encoder if it ever returns. The LogSink must outlive it,
// so callers end the process rather than return normally in that case.
class RecordingSession {
public:
    RecordingSession(std::unique_ptr<IFrameSource> source,
                     EncoderFactory encoderFactory, LogSink& log,
                     std::unique_ptr<IPacer> pacer = nullptr);
    ~RecordingSession();

    RecordingSession(const RecordingSession&) = delete;
    RecordingSession& operator=(const RecordingSession&) = delete;

    // Validates, opens the encoder at the even-dimension region size and
    // launches the capture thread. All failures are reported here, before
    // any frame is captured; the session then stays NotStarted.
    bool start(const Region& region, int fps, const std::string& outputPath,
               SessionError& err);

    // Requests cancellation and waits up to timeout for the loop to finish.
    // Returns false if it did not finish in time; the thread is not killed,
    // and a later stop() will reap it. No-op returning true when nothing is
    // running.
    bool stop(std::chrono::milliseconds timeout);

    SessionStatus status() const;
    bool isRunning() const;

    // The even-dimension region actually recorded, once started.
    std::optional<Region> region() const;
    int fps() const {
        return fps_;
    }
    const std::string& outputPath() const {
        return outputPath_;
    }

private:
    struct Worker;

    static void threadMain(std::shared_ptr<Worker> worker, Region region,
                           int fps);
    // Called with the thread joined; drops the loop and the encoder.
    void reapLocked();

    LogSink& log_;
    EncoderFactory encoderFactory_;
    std::shared_ptr<Worker> worker_;

    SessionState state_ = SessionState::NotStarted;
    bool stopTimedOut_ = false;
    SessionError failure_;

    std::optional<Region> region_;
    int fps_ = 0;
    std::string outputPath_;

    std::thread thread_;
};

}  // namespace snarp
