#include "app/cli.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <iostream>

namespace snarp {

namespace {

bool parseInt(const std::string& text, int& out) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || !end || *end != '\0' || value < INT_MIN ||
        value > INT_MAX) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool isFrameRateChoice(int fps) {
    for (int choice : kFrameRateChoices) {
        if (choice == fps) {
            return true;
        }
    }
    return false;
}

}  // namespace

void printUsage(const char* exe) {
    std::cerr << "Usage: " << exe << " <screenshot|record> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  screenshot             Capture a region to a PNG file\n"
              << "  record                 Record a region to an MP4 file\n"
              << "\n"
              << "Options:\n"
              << "  --region <x,y,w,h>     Capture this region instead of "
                 "selecting it interactively\n"
              << "  --fps <15|24|30|60>    Recording frame rate (default: 30)\n"
              << "  --duration <seconds>   Stop recording automatically\n"
              << "  --output-dir <dir>     Where files are written "
                 "(default: .)\n"
              << "  --stop-timeout <ms>    How long to wait for the recorder "
                 "to stop (default: 5000)\n"
              << "  --backend <mode>       Capture backend: "
                 "auto|x11|wlr|portal (default: auto)\n"
              << "  --log-file <path>      Append log output to a file "
                 "(default: $SNARP_LOG_FILE)\n"
              << "  --debug                Enable debug logging\n"
              << "  --help, -h             Show this help message\n"
              << "\n"
              << "While selecting:\n"
              << "  Drag with left button: select region (min 10x10)\n"
              << "  Esc, Q or right click: cancel\n"
              << "\n"
              << "While recording:\n"
              << "  Enter or Ctrl+C: stop and save\n"
              << "\n"
              << "Exit status: 0 saved, 1 failed, 2 cancelled, "
                 "3 stop timed out\n";
}

std::string sourceKindToString(SourceKind kind) {
    switch (kind) {
        case SourceKind::Auto:
            return "auto";
        case SourceKind::X11:
            return "x11";
        case SourceKind::Wlr:
            return "wlr";
        case SourceKind::Portal:
            return "portal";
    }
    return "auto";
}

bool parseCli(int argc, char** argv, CliOptions& out, std::string& err) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "screenshot" || arg == "record") {
            if (out.command != Command::None) {
                err = "more than one command given";
                return false;
            }
            out.command =
                arg == "record" ? Command::Record : Command::Screenshot;
        } else if (arg == "--backend") {
            if (i + 1 >= argc) {
                err = "--backend requires a value";
                return false;
            }
            std::string val = argv[++i];
            if (val == "auto") {
                out.backend = SourceKind::Auto;
            } else if (val == "x11") {
                out.backend = SourceKind::X11;
            } else if (val == "wlr") {
                out.backend = SourceKind::Wlr;
            } else if (val == "portal") {
                out.backend = SourceKind::Portal;
            } else {
                err = "unknown backend: " + val;
                return false;
            }
        } else if (arg == "--fps") {
            if (i + 1 >= argc) {
                err = "--fps requires a value";
                return false;
            }
            std::string val = argv[++i];
            int fps = 0;
            if (!parseInt(val, fps) || !isFrameRateChoice(fps)) {
                err = "--fps must be one of 15, 24, 30, 60: " + val;
                return false;
            }
            out.fps = fps;
        } else if (arg == "--region") {
            if (i + 1 >= argc) {
                err = "--region requires x,y,w,h";
                return false;
            }
            std::string regionErr;
            auto region = parseRegion(argv[++i], &regionErr);
            if (!region) {
                err = "--region: " + regionErr;
                return false;
            }
            out.region = region;
        } else if (arg == "--duration") {
            if (i + 1 >= argc) {
                err = "--duration requires a value";
                return false;
            }
            std::string val = argv[++i];
            int seconds = 0;
            if (!parseInt(val, seconds) || seconds <= 0) {
                err = "--duration must be a positive number of seconds: " +
                      val;
                return false;
            }
            out.durationSeconds = seconds;
        } else if (arg == "--output-dir") {
            if (i + 1 >= argc) {
                err = "--output-dir requires a path";
                return false;
            }
            out.outputDir = argv[++i];
        } else if (arg == "--stop-timeout") {
            if (i + 1 >= argc) {
                err = "--stop-timeout requires a value";
                return false;
            }
            std::string val = argv[++i];
            int ms = 0;
            if (!parseInt(val, ms) || ms < 0) {
                err = "--stop-timeout must be a non-negative number of "
                      "milliseconds: " +
                      val;
                return false;
            }
            out.stopTimeoutMs = ms;
        } else if (arg == "--log-file") {
            if (i + 1 >= argc) {
                err = "--log-file requires a path";
                return false;
            }
            out.logFile = argv[++i];
        } else if (arg == "--debug") {
            out.debug = true;
        } else if (arg == "-h" || arg == "--help") {
            out.help = true;
        } else {
            err = "unknown argument: " + arg;
            return false;
        }
    }
    if (!out.help && out.command == Command::None) {
        err = "missing command (screenshot or record)";
        return false;
    }
    return true;
}

}  // namespace snarp
