#include "app/App.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <memory>
#include <thread>
#include <utility>

#include "capture/CaptureTypes.hpp"
#include "capture/IFrameSource.hpp"
#include "capture/SourceFactory.hpp"
#include "encode/EncoderFFmpeg.hpp"
#include "image/ImageWriterPng.hpp"
#include "platform/FileUtil.hpp"
#include "platform/Time.hpp"
#include "record/RecordingSession.hpp"
#include "select/IRegionSelector.hpp"

namespace snarp {

namespace {

volatile std::sig_atomic_t g_stopSignal = 0;

void onStopSignal(int) {
    g_stopSignal = 1;
}

// Time for the compositor to take the overlay off screen before capturing.
constexpr auto kOverlayDismissDelay = std::chrono::milliseconds(100);
constexpr int kStopPollMs = 200;

bool regionInsideDesktop(IFrameSource& source, const Region& region) {
    int w = 0;
    int h = 0;
    if (!source.desktopSize(w, h)) {
        // Unknown here; the source reports it on capture.
        return true;
    }
    return region.right() <= w && region.bottom() <= h;
}

}  // namespace

void installStopSignalHandlers() {
    struct sigaction sa {};
    sa.sa_handler = onStopSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

bool stopSignalReceived() {
    return g_stopSignal != 0;
}

App::App(const CliOptions& options, LogSink& log)
    : options_(options), log_(log) {}

int App::run() {
    if (state_ != AppState::Idle) {
        LOG_WARN(log_, "already busy");
        return kExitFailed;
    }
    LOG_DEBUG(log_, "backend: %s, output dir: %s",
              sourceKindToString(options_.backend).c_str(),
              options_.outputDir.c_str());
    if (options_.command == Command::Record) {
        return record();
    }
    return takeScreenshot();
}

void App::setStatus(const std::string& message) {
    LOG_INFO(log_, "Status: %s", message.c_str());
    std::cout << message << std::endl;
}

std::optional<Region> App::obtainRegion(bool& interactive) {
    interactive = false;
    if (options_.region) {
        return options_.region;
    }

    auto selector = CreateRegionSelector(log_);
    if (!selector) {
        LOG_ERROR(log_,
                  "interactive selection is not available in this session; "
                  "pass --region x,y,w,h");
        return std::nullopt;
    }

    interactive = true;
    state_ = AppState::Selecting;
    setStatus("Select a region (Esc to cancel)");
    std::optional<Region> selected;
    selector->select(
        [&selected](std::optional<Region> region) { selected = region; });
    state_ = AppState::Idle;
    return selected;
}

int App::takeScreenshot() {
    bool interactive = false;
    auto region = obtainRegion(interactive);
    if (!region) {
        setStatus("Screenshot cancelled");
        return kExitCancelled;
    }
    if (interactive) {
        std::this_thread::sleep_for(kOverlayDismissDelay);
    }

    auto source = CreateFrameSource(options_.backend, log_, false);
    if (!source) {
        setStatus("Screenshot failed: no capture backend available");
        return kExitFailed;
    }

    std::string err;
    Image image;
    if (!regionInsideDesktop(*source, *region)) {
        err = "region " + region->toString() + " is outside the desktop";
    } else if (source->capture(*region, image, err)) {
        std::string path =
            makeOutputPath(options_.outputDir, "screenshot",
                           timestampForFilename(std::time(nullptr)), "png");
        if (writePng(path, image, err)) {
            setStatus("Screenshot saved: " + baseName(path));
            LOG_INFO(log_, "screenshot %dx%d written to %s", image.w, image.h,
                     path.c_str());
            return kExitSaved;
        }
    }
    LOG_ERROR(log_, "screenshot failed: %s", err.c_str());
    setStatus("Screenshot failed: " + err);
    return kExitFailed;
}

int App::record() {
    bool interactive = false;
    auto region = obtainRegion(interactive);
    if (!region) {
        setStatus("Recording cancelled");
        return kExitCancelled;
    }
    if (interactive) {
        std::this_thread::sleep_for(kOverlayDismissDelay);
    }

    auto source = CreateFrameSource(options_.backend, log_, true);
    if (!source) {
        setStatus("Recording failed to start: no capture backend can record");
        return kExitFailed;
    }
    if (!regionInsideDesktop(*source, *region)) {
        setStatus("Recording failed to start: region " + region->toString() +
                  " is outside the desktop");
        return kExitFailed;
    }

    LogSink& log = log_;
    RecordingSession session(
        std::move(source), [&log]() { return CreateEncoderFFmpeg(log); },
        log_);

    std::string path =
        makeOutputPath(options_.outputDir, "recording",
                       timestampForFilename(std::time(nullptr)), "mp4");
    SessionError startErr;
    if (!session.start(*region, options_.fps, path, startErr)) {
        setStatus(std::string("Recording failed to start (") +
                  errorKindName(startErr.kind) + "): " + startErr.message);
        return kExitFailed;
    }

    state_ = AppState::Recording;
    setStatus("Recording " + session.region()->toString() + " at " +
              std::to_string(options_.fps) +
              " fps (press Enter or Ctrl+C to stop)");
    StopTrigger trigger = waitForStop(session);
    switch (trigger) {
        case StopTrigger::Enter:
            LOG_DEBUG(log_, "stop requested from the terminal");
            break;
        case StopTrigger::Duration:
            LOG_DEBUG(log_, "recording duration reached");
            break;
        case StopTrigger::Signal:
            LOG_INFO(log_, "stop signal received");
            break;
        case StopTrigger::LoopEnded:
            LOG_DEBUG(log_, "recording loop ended on its own");
            break;
    }

    bool stopped =
        session.stop(std::chrono::milliseconds(options_.stopTimeoutMs));
    state_ = AppState::Idle;
    SessionStatus status = session.status();
    if (!stopped) {
        setStatus("Recording stop timed out after " +
                  std::to_string(options_.stopTimeoutMs) +
                  " ms; " + baseName(path) + " may be incomplete");
        // The session detaches the stuck thread; main ends the process.
        return kExitStopTimeout;
    }
    if (status.state == SessionState::Failed) {
        setStatus(std::string("Recording failed (") +
                  errorKindName(status.error.kind) + " error) after " +
                  std::to_string(status.framesWritten) +
                  " frames: " + status.error.message + "; partial file kept: " +
                  baseName(path));
        return kExitFailed;
    }
    setStatus("Recording saved: " + baseName(path) + " (" +
              std::to_string(status.framesWritten) + " frames)");
    return kExitSaved;
}

App::StopTrigger App::waitForStop(RecordingSession& session) {
    using clock = std::chrono::steady_clock;
    auto started = clock::now();
    bool watchStdin = true;
    long long shownSeconds = -1;

    for (;;) {
        if (stopSignalReceived()) {
            std::cerr << std::endl;
            return StopTrigger::Signal;
        }
        if (!session.isRunning() ||
            session.status().state == SessionState::Failed) {
            std::cerr << std::endl;
            return StopTrigger::LoopEnded;
        }

        long long elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                                clock::now() - started)
                                .count();
        if (options_.durationSeconds && elapsed >= *options_.durationSeconds) {
            std::cerr << std::endl;
            return StopTrigger::Duration;
        }
        if (elapsed != shownSeconds) {
            shownSeconds = elapsed;
            std::cerr << "\rRecording " << formatElapsed(elapsed)
                      << std::flush;
        }

        if (!watchStdin) {
            std::this_thread::sleep_for(std::chrono::milliseconds(kStopPollMs));
            continue;
        }
        pollfd pfd{};
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, kStopPollMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN(log_, "poll on stdin failed, Enter will not stop");
            watchStdin = false;
            continue;
        }
        if (ready == 0) {
            continue;
        }
        char buf[256];
        ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
        if (n <= 0) {
            if (n < 0 && errno == EINTR) {
                continue;
            }
            // Closed or redirected from an empty file.
            LOG_DEBUG(log_, "stdin closed, Enter will not stop");
            watchStdin = false;
            continue;
        }
        for (ssize_t i = 0; i < n; ++i) {
            if (buf[i] == '\n') {
                return StopTrigger::Enter;
            }
        }
    }
}

}  // namespace snarp
