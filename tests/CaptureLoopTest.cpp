#include <gtest/gtest.h>

#include <memory>

#include "Fakes.hpp"
#include "record/CaptureLoop.hpp"

namespace snarp {
namespace {

using std::chrono::milliseconds;
using test::CapturingLogSink;
using test::EncoderProbe;
using test::FakeEncoder;
using test::FakePacer;
using test::FakeSource;

class CaptureLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        probe = std::make_shared<EncoderProbe>();
        encoder = std::make_unique<FakeEncoder>(probe);
        std::string err;
        ASSERT_TRUE(encoder->open("out.mp4", 64, 48, 10, err));
        source.clock = &pacer;
    }

    Region region() const {
        return *Region::create(0, 0, 64, 48);
    }

    CapturingLogSink log;
    FakePacer pacer;
    FakeSource source;
    std::shared_ptr<EncoderProbe> probe;
    std::unique_ptr<FakeEncoder> encoder;
    std::atomic<bool> cancel{false};
};

TEST_F(CaptureLoopTest, PacesAtFixedInterval) {
    pacer.cancel = &cancel;
    pacer.cancelAfterSleeps = 5;

    CaptureLoop loop(source, *encoder, pacer, log);
    CaptureLoopResult result = loop.run(region(), 10, cancel);

    EXPECT_EQ(result.outcome, LoopOutcome::Cancelled);
    EXPECT_EQ(result.framesWritten, 5u);
    EXPECT_EQ(loop.framesWritten(), 5u);
    ASSERT_EQ(pacer.sleeps.size(), 5u);
    for (size_t i = 0; i < pacer.sleeps.size(); ++i) {
        EXPECT_EQ(pacer.sleeps[i],
                  pacer.start() + milliseconds(100) * static_cast<int>(i + 1));
    }
    EXPECT_EQ(probe->closes.load(), 1);
}

TEST_F(CaptureLoopTest, SlowCaptureSkipsInsteadOfQueueing) {
    // Two captures overrun the 100 ms budget, then the source is fast again.
    source.costs = {milliseconds(250), milliseconds(250)};
    probe->cancel = &cancel;
    probe->cancelAfterFrames = 5;

    CaptureLoop loop(source, *encoder, pacer, log);
    CaptureLoopResult result = loop.run(region(), 10, cancel);

    EXPECT_EQ(result.outcome, LoopOutcome::Cancelled);
    EXPECT_EQ(result.framesWritten, 5u);
    ASSERT_EQ(source.captureTimes.size(), 5u);
    const auto t0 = pacer.start();
    EXPECT_EQ(source.captureTimes[0], t0);
    EXPECT_EQ(source.captureTimes[1], t0 + milliseconds(250));
    EXPECT_EQ(source.captureTimes[2], t0 + milliseconds(500));
    // No burst to catch up: pacing resumes one interval after the late frame.
    EXPECT_EQ(source.captureTimes[3], t0 + milliseconds(600));
    EXPECT_EQ(source.captureTimes[4], t0 + milliseconds(700));
}

TEST_F(CaptureLoopTest, CancelledBeforeFirstFrameStillCloses) {
    cancel = true;
    CaptureLoop loop(source, *encoder, pacer, log);
    CaptureLoopResult result = loop.run(region(), 30, cancel);

    EXPECT_EQ(result.outcome, LoopOutcome::Cancelled);
    EXPECT_EQ(result.framesWritten, 0u);
    EXPECT_EQ(source.captures.load(), 0u);
    EXPECT_EQ(probe->closes.load(), 1);
    EXPECT_TRUE(log.contains("frames recorded: 0"));
}

TEST_F(CaptureLoopTest, CaptureFailureEndsLoop) {
    source.failAt = 3;
    CaptureLoop loop(source, *encoder, pacer, log);
    CaptureLoopResult result = loop.run(region(), 30, cancel);

    EXPECT_EQ(result.outcome, LoopOutcome::CaptureFailed);
    EXPECT_EQ(result.framesWritten, 3u);
    EXPECT_EQ(result.error, "display went away");
    EXPECT_EQ(probe->frames.load(), 3u);
    EXPECT_EQ(probe->closes.load(), 1);
    EXPECT_EQ(log.count(LogLevel::Error), 1u);
}

TEST_F(CaptureLoopTest, ConversionFailureIsNotACaptureFailure) {
    source.truncateAt = 1;
    CaptureLoop loop(source, *encoder, pacer, log);
    CaptureLoopResult result = loop.run(region(), 30, cancel);

    EXPECT_EQ(result.outcome, LoopOutcome::ConvertFailed);
    EXPECT_EQ(result.framesWritten, 1u);
    EXPECT_EQ(result.error, "captured frame is empty or truncated");
    EXPECT_EQ(probe->closes.load(), 1);
    EXPECT_TRUE(log.contains("frame conversion failed after 1 frames"));
}

TEST_F(CaptureLoopTest, EncodeFailureEndsLoop) {
    probe->failAtFrame = 2;
    CaptureLoop loop(source, *encoder, pacer, log);
    CaptureLoopResult result = loop.run(region(), 30, cancel);

    EXPECT_EQ(result.outcome, LoopOutcome::EncodeFailed);
    EXPECT_EQ(result.framesWritten, 2u);
    EXPECT_EQ(result.error, "disk full");
    EXPECT_EQ(probe->closes.load(), 1);
}

TEST_F(CaptureLoopTest, FramesAreConvertedToEncoderLayout) {
    // A HiDPI output delivers twice the logical size in RGB; the encoder
    // wants BGR at exactly the region size.
    source.frameW = 128;
    source.frameH = 96;
    probe->cancel = &cancel;
    probe->cancelAfterFrames = 2;

    CaptureLoop loop(source, *encoder, pacer, log);
    CaptureLoopResult result = loop.run(region(), 30, cancel);

    EXPECT_EQ(result.outcome, LoopOutcome::Cancelled);
    EXPECT_EQ(result.framesWritten, 2u);
    EXPECT_NEAR(probe->firstPixel[0], 30, 2);
    EXPECT_NEAR(probe->firstPixel[1], 20, 2);
    EXPECT_NEAR(probe->firstPixel[2], 10, 2);
}

}  // namespace
}  // namespace snarp
