#pragma once

#include <optional>
#include <string>

#include "app/cli.hpp"
#include "core/Region.hpp"
#include "platform/Log.hpp"

namespace snarp {

enum class AppState { Idle, Selecting, Recording };

enum ExitCode {
    kExitSaved = 0,
    kExitFailed = 1,
    kExitCancelled = 2,
    kExitStopTimeout = 3,
};

// SIGINT and SIGTERM request a graceful stop instead of killing the process.
void installStopSignalHandlers();
bool stopSignalReceived();

class RecordingSession;

class App {
public:
    App(const CliOptions& options, LogSink& log);

    int run();

    AppState state() const {
        return state_;
    }

private:
    enum class StopTrigger { Enter, Duration, Signal, LoopEnded };

    int takeScreenshot();
    int record();

    // --region if given, otherwise the interactive selector. nullopt means
    // cancelled or no way to select.
    std::optional<Region> obtainRegion(bool& interactive);
    StopTrigger waitForStop(RecordingSession& session);
    void setStatus(const std::string& message);

    CliOptions options_;
    LogSink& log_;
    AppState state_ = AppState::Idle;
};

}  // namespace snarp
