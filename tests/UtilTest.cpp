#include <gtest/gtest.h>

#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

#include "platform/FileUtil.hpp"
#include "platform/Log.hpp"
#include "platform/Time.hpp"

namespace snarp {
namespace {

TEST(TimeTest, FormatElapsed) {
    EXPECT_EQ(formatElapsed(0), "00:00:00");
    EXPECT_EQ(formatElapsed(59), "00:00:59");
    EXPECT_EQ(formatElapsed(61), "00:01:01");
    EXPECT_EQ(formatElapsed(3661), "01:01:01");
    EXPECT_EQ(formatElapsed(90000), "25:00:00");
    EXPECT_EQ(formatElapsed(-3), "00:00:00");
}

TEST(TimeTest, TimestampForFilename) {
    std::string stamp = timestampForFilename(std::time(nullptr));
    ASSERT_EQ(stamp.size(), 15u);
    EXPECT_EQ(stamp[8], '_');
    for (size_t i = 0; i < stamp.size(); ++i) {
        if (i != 8) {
            EXPECT_TRUE(stamp[i] >= '0' && stamp[i] <= '9') << stamp;
        }
    }
}

TEST(FileUtilTest, MakeOutputPath) {
    EXPECT_EQ(makeOutputPath("out", "recording", "20240131_235959", "mp4"),
              "out/recording_20240131_235959.mp4");
    EXPECT_EQ(makeOutputPath("/tmp/", "screenshot", "20240101_000000", "png"),
              "/tmp/screenshot_20240101_000000.png");
    EXPECT_EQ(makeOutputPath("", "screenshot", "20240101_000000", "png"),
              "./screenshot_20240101_000000.png");
}

TEST(FileUtilTest, BaseName) {
    EXPECT_EQ(baseName("/a/b/c.mp4"), "c.mp4");
    EXPECT_EQ(baseName("c.mp4"), "c.mp4");
}

TEST(FileUtilTest, FileUrlToPath) {
    EXPECT_EQ(fileUrlToPath("file:///tmp/Screen%20Shot.png"),
              "/tmp/Screen Shot.png");
    EXPECT_EQ(fileUrlToPath("file://localhost/tmp/a.png"), "/tmp/a.png");
    EXPECT_EQ(fileUrlToPath("/already/a/path"), "/already/a/path");
}

TEST(FileUtilTest, WritableDirectory) {
    std::string err;
    const char* tmp = std::getenv("TMPDIR");
    std::string dir = tmp && tmp[0] ? tmp : "/tmp";
    EXPECT_TRUE(isWritableDirectory(dir, &err)) << err;

    EXPECT_FALSE(isWritableDirectory("/definitely/not/here", &err));
    EXPECT_EQ(err, "directory does not exist: /definitely/not/here");
}

TEST(LogTest, FileMirrorsTaggedLinesAndFiltersDebug) {
    const char* tmp = std::getenv("TMPDIR");
    std::string path = std::string(tmp && tmp[0] ? tmp : "/tmp") +
                       "/snarp_log_test_" + std::to_string(::getpid()) +
                       ".log";
    std::remove(path.c_str());

    ConsoleLogSink sink;
    ASSERT_TRUE(sink.openLogFile(path));
    LOG_INFO(sink, "saved %d frames", 42);
    LOG_DEBUG(sink, "hidden");
    sink.setDebugLogging(true);
    LOG_DEBUG(sink, "shown");
    LOG_ERROR(sink, "boom: %s", "disk full");
    sink.closeLogFile();

    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    std::string text = contents.str();
    EXPECT_NE(text.find("=== snarp started ==="), std::string::npos);
    EXPECT_NE(text.find("[INFO] saved 42 frames"), std::string::npos);
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("[DEBUG] shown"), std::string::npos);
    EXPECT_NE(text.find("[ERROR] boom: disk full"), std::string::npos);
    std::remove(path.c_str());
}

TEST(LogTest, OpenLogFileFailsForMissingDirectory) {
    ConsoleLogSink sink;
    EXPECT_FALSE(sink.openLogFile("/definitely/not/here/snarp.log"));
}

}  // namespace
}  // namespace snarp
