#pragma once

#include <cstdio>
#include <mutex>
#include <string>

namespace snarp {

enum class LogLevel { Info, Warn, Error, Debug };

const char* logLevelTag(LogLevel level);

// Destination for diagnostics. Passed by reference to every component that
// logs, so a test can capture what a session or loop reports.
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(LogLevel level, const std::string& message) = 0;
};

// Writes "[TAG] message" lines to stderr and, when a log file was opened, to
// that file as well. Debug lines are dropped unless enabled.
class ConsoleLogSink final : public LogSink {
public:
    ConsoleLogSink() = default;
    ~ConsoleLogSink() override;

    ConsoleLogSink(const ConsoleLogSink&) = delete;
    ConsoleLogSink& operator=(const ConsoleLogSink&) = delete;

    void setDebugLogging(bool enabled);
    bool openLogFile(const std::string& path);
    void closeLogFile();

    void write(LogLevel level, const std::string& message) override;

private:
    std::mutex mutex_;
    bool debugEnabled_ = false;
    std::FILE* file_ = nullptr;
};

#if defined(__GNUC__)
__attribute__((format(printf, 3, 4)))
#endif
void logFormat(LogSink& sink, LogLevel level, const char* fmt, ...);

}  // namespace snarp

#define LOG_INFO(sink, ...) \
    ::snarp::logFormat((sink), ::snarp::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(sink, ...) \
    ::snarp::logFormat((sink), ::snarp::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(sink, ...) \
    ::snarp::logFormat((sink), ::snarp::LogLevel::Error, __VA_ARGS__)
#define LOG_DEBUG(sink, ...) \
    ::snarp::logFormat((sink), ::snarp::LogLevel::Debug, __VA_ARGS__)
