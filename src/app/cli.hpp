#pragma once

#include <optional>
#include <string>

#include "capture/SourceFactory.hpp"
#include "core/Region.hpp"

namespace snarp {

enum class Command { None, Screenshot, Record };

// Frame rates offered to the user. The recording core itself accepts any
// positive rate.
inline constexpr int kFrameRateChoices[] = {15, 24, 30, 60};

struct CliOptions {
    Command command = Command::None;
    SourceKind backend = SourceKind::Auto;
    int fps = 30;
    std::string outputDir = ".";
    std::optional<Region> region;
    std::optional<int> durationSeconds;
    int stopTimeoutMs = 5000;
    std::string logFile;
    bool debug = false;
    bool help = false;
};

bool parseCli(int argc, char** argv, CliOptions& out, std::string& err);
void printUsage(const char* exe);
std::string sourceKindToString(SourceKind kind);

}  // namespace snarp
