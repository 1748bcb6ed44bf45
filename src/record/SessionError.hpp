#pragma once

#include <string>

namespace snarp {

enum class ErrorKind {
    None,
    InvalidRegion,
    InvalidFrameRate,
    AlreadyStarted,
    SourceUnavailable,
    EncoderInit,
    Capture,
    Convert,
    Encode,
    StopTimeout,
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::InvalidRegion:
            return "invalid region";
        case ErrorKind::InvalidFrameRate:
            return "invalid frame rate";
        case ErrorKind::AlreadyStarted:
            return "already started";
        case ErrorKind::SourceUnavailable:
            return "source unavailable";
        case ErrorKind::EncoderInit:
            return "encoder init";
        case ErrorKind::Capture:
            return "capture";
        case ErrorKind::Convert:
            return "conversion";
        case ErrorKind::Encode:
            return "encode";
        case ErrorKind::StopTimeout:
            return "stop timeout";
    }
    return "unknown";
}

struct SessionError {
    ErrorKind kind = ErrorKind::None;
    std::string message;
};

}  // namespace snarp
