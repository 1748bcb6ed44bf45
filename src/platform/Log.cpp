#include "platform/Log.hpp"

#include <cstdarg>
#include <vector>

namespace snarp {

const char* logLevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Debug:
            return "DEBUG";
    }
    return "INFO";
}

ConsoleLogSink::~ConsoleLogSink() {
    closeLogFile();
}

void ConsoleLogSink::setDebugLogging(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    debugEnabled_ = enabled;
}

bool ConsoleLogSink::openLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
    file_ = std::fopen(path.c_str(), "a");
    if (!file_) {
        return false;
    }
    std::fprintf(file_, "\n=== snarp started ===\n");
    std::fflush(file_);
    return true;
}

void ConsoleLogSink::closeLogFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
}

void ConsoleLogSink::write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level == LogLevel::Debug && !debugEnabled_) {
        return;
    }
    const char* tag = logLevelTag(level);

    std::fprintf(stderr, "[%s] %s\n", tag, message.c_str());

    if (file_) {
        std::fprintf(file_, "[%s] %s\n", tag, message.c_str());
        std::fflush(file_);
    }
}

void logFormat(LogSink& sink, LogLevel level, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    va_list args_copy;
    va_copy(args_copy, args);
    int len = std::vsnprintf(nullptr, 0, fmt, args_copy);
    va_end(args_copy);

    std::string message;
    if (len > 0) {
        std::vector<char> buf(static_cast<size_t>(len) + 1u);
        std::vsnprintf(buf.data(), buf.size(), fmt, args);
        message.assign(buf.data(), static_cast<size_t>(len));
    }
    va_end(args);

    sink.write(level, message);
}

}  // namespace snarp
