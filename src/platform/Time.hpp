#pragma once

#include <cstdio>
#include <ctime>
#include <string>

namespace snarp {

// "HH:MM:SS" for the recording timer. Hours are not wrapped at 24.
inline std::string formatElapsed(long long totalSeconds) {
    if (totalSeconds < 0) {
        totalSeconds = 0;
    }
    long long hours = totalSeconds / 3600;
    long long minutes = (totalSeconds % 3600) / 60;
    long long seconds = totalSeconds % 60;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld", hours, minutes,
                  seconds);
    return buf;
}

// Local wall-clock time as "YYYYmmdd_HHMMSS", used in output file names.
inline std::string timestampForFilename(std::time_t when) {
    std::tm local{};
    localtime_r(&when, &local);
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &local) == 0) {
        return "00000000_000000";
    }
    return buf;
}

}  // namespace snarp
