#include <cstdio>
#include <cstdlib>
#include <string>

#include "app/App.hpp"
#include "app/cli.hpp"
#include "platform/FileUtil.hpp"
#include "platform/Log.hpp"

int main(int argc, char** argv) {
    using namespace snarp;

    ConsoleLogSink log;

    CliOptions options;
    std::string err;
    if (!parseCli(argc, argv, options, err)) {
        LOG_ERROR(log, "%s", err.c_str());
        printUsage(argv[0]);
        return kExitFailed;
    }
    if (options.help) {
        printUsage(argv[0]);
        return kExitSaved;
    }

    log.setDebugLogging(options.debug);

    std::string logFile = options.logFile;
    if (logFile.empty()) {
        const char* envPath = std::getenv("SNARP_LOG_FILE");
        if (envPath && envPath[0] != '\0') {
            logFile = envPath;
        }
    }
    if (!logFile.empty() && !log.openLogFile(logFile)) {
        LOG_WARN(log, "cannot open log file %s, logging to stderr only",
                 logFile.c_str());
    }

    if (!isWritableDirectory(options.outputDir, &err)) {
        LOG_ERROR(log, "%s", err.c_str());
        log.closeLogFile();
        return kExitFailed;
    }

    installStopSignalHandlers();

    App app(options, log);
    int code = app.run();
    log.closeLogFile();
    if (code == kExitStopTimeout) {
        // A detached capture thread may still be running and logging; skip
        // static destruction so it cannot touch freed state.
        std::fflush(nullptr);
        std::_Exit(code);
    }
    return code;
}
