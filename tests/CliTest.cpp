#include <gtest/gtest.h>

#include <initializer_list>
#include <string>
#include <vector>

#include "app/cli.hpp"

namespace snarp {
namespace {

bool parse(std::initializer_list<const char*> args, CliOptions& out,
           std::string& err) {
    std::vector<std::string> storage{"snarp"};
    for (const char* arg : args) {
        storage.emplace_back(arg);
    }
    std::vector<char*> argv;
    for (auto& s : storage) {
        argv.push_back(s.data());
    }
    return parseCli(static_cast<int>(argv.size()), argv.data(), out, err);
}

TEST(CliTest, Defaults) {
    CliOptions opts;
    std::string err;
    ASSERT_TRUE(parse({"record"}, opts, err)) << err;
    EXPECT_EQ(opts.command, Command::Record);
    EXPECT_EQ(opts.fps, 30);
    EXPECT_EQ(opts.outputDir, ".");
    EXPECT_EQ(opts.stopTimeoutMs, 5000);
    EXPECT_EQ(opts.backend, SourceKind::Auto);
    EXPECT_FALSE(opts.region);
    EXPECT_FALSE(opts.durationSeconds);
    EXPECT_FALSE(opts.debug);
}

TEST(CliTest, AllOptions) {
    CliOptions opts;
    std::string err;
    ASSERT_TRUE(parse({"record", "--fps", "60", "--region", "5,6,320,240",
                       "--duration", "10", "--output-dir", "/tmp",
                       "--stop-timeout", "250", "--backend", "wlr",
                       "--log-file", "snarp.log", "--debug"},
                      opts, err))
        << err;
    EXPECT_EQ(opts.fps, 60);
    ASSERT_TRUE(opts.region);
    EXPECT_EQ(*opts.region, *Region::create(5, 6, 320, 240));
    EXPECT_EQ(opts.durationSeconds, 10);
    EXPECT_EQ(opts.outputDir, "/tmp");
    EXPECT_EQ(opts.stopTimeoutMs, 250);
    EXPECT_EQ(opts.backend, SourceKind::Wlr);
    EXPECT_EQ(opts.logFile, "snarp.log");
    EXPECT_TRUE(opts.debug);
}

TEST(CliTest, FrameRateMustBeOfferedChoice) {
    for (const char* fps : {"15", "24", "30", "60"}) {
        CliOptions opts;
        std::string err;
        EXPECT_TRUE(parse({"record", "--fps", fps}, opts, err)) << fps;
    }
    for (const char* fps : {"25", "0", "-30", "thirty", ""}) {
        CliOptions opts;
        std::string err;
        EXPECT_FALSE(parse({"record", "--fps", fps}, opts, err)) << fps;
        EXPECT_FALSE(err.empty());
    }
}

TEST(CliTest, RejectsBadValues) {
    CliOptions opts;
    std::string err;
    EXPECT_FALSE(parse({"record", "--region", "1,2,3"}, opts, err));
    EXPECT_FALSE(parse({"record", "--duration", "0"}, opts, err));
    EXPECT_FALSE(parse({"record", "--stop-timeout", "-1"}, opts, err));
    EXPECT_FALSE(parse({"record", "--backend", "gdi"}, opts, err));
    EXPECT_EQ(err, "unknown backend: gdi");
    EXPECT_FALSE(parse({"record", "--fps"}, opts, err));
    EXPECT_EQ(err, "--fps requires a value");
}

TEST(CliTest, CommandHandling) {
    {
        CliOptions opts;
        std::string err;
        EXPECT_FALSE(parse({}, opts, err));
        EXPECT_EQ(err, "missing command (screenshot or record)");
    }
    {
        CliOptions opts;
        std::string err;
        EXPECT_FALSE(parse({"record", "screenshot"}, opts, err));
    }
    {
        CliOptions opts;
        std::string err;
        EXPECT_FALSE(parse({"screenshot", "--zoom"}, opts, err));
        EXPECT_EQ(err, "unknown argument: --zoom");
    }
    {
        CliOptions opts;
        std::string err;
        ASSERT_TRUE(parse({"screenshot", "--backend", "portal"}, opts, err));
        EXPECT_EQ(opts.command, Command::Screenshot);
        EXPECT_EQ(opts.backend, SourceKind::Portal);
    }
}

TEST(CliTest, HelpNeedsNoCommand) {
    CliOptions opts;
    std::string err;
    ASSERT_TRUE(parse({"-h"}, opts, err));
    EXPECT_TRUE(opts.help);
}

TEST(CliTest, SourceKindNames) {
    EXPECT_EQ(sourceKindToString(SourceKind::Auto), "auto");
    EXPECT_EQ(sourceKindToString(SourceKind::X11), "x11");
    EXPECT_EQ(sourceKindToString(SourceKind::Wlr), "wlr");
    EXPECT_EQ(sourceKindToString(SourceKind::Portal), "portal");
}

}  // namespace
}  // namespace snarp
