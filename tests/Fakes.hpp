#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "capture/IFrameSource.hpp"
#include "encode/IFrameEncoder.hpp"
#include "platform/Log.hpp"
#include "record/Pacer.hpp"

namespace snarp::test {

class CapturingLogSink final : public LogSink {
public:
    void write(LogLevel level, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.emplace_back(level, message);
    }

    bool contains(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& line : lines_) {
            if (line.second.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    size_t count(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& line : lines_) {
            if (line.first == level) {
                ++n;
            }
        }
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<LogLevel, std::string>> lines_;
};

// Virtual clock. sleepUntil jumps straight to the deadline and records it.
class FakePacer final : public IPacer {
public:
    TimePoint now() override {
        return now_;
    }
    void sleepUntil(TimePoint deadline) override {
        sleeps.push_back(deadline);
        if (deadline > now_) {
            now_ = deadline;
        }
        if (cancel && sleeps.size() >= cancelAfterSleeps) {
            cancel->store(true);
        }
    }
    void advance(std::chrono::milliseconds by) {
        now_ += by;
    }
    TimePoint start() const {
        return start_;
    }

    std::vector<TimePoint> sleeps;
    std::atomic<bool>* cancel = nullptr;
    size_t cancelAfterSleeps = 0;

private:
    TimePoint start_ = TimePoint(std::chrono::seconds(1000));
    TimePoint now_ = start_;
};

// Blocks captures while closed, so a test can hold the loop mid-cycle.
struct CaptureGate {
    std::mutex mutex;
    std::condition_variable cv;
    bool open = true;
    int entered = 0;

    void close() {
        std::lock_guard<std::mutex> lock(mutex);
        open = false;
    }
    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            open = true;
        }
        cv.notify_all();
    }
    bool waitEntered(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [this] { return entered > 0; });
    }
    void pass() {
        std::unique_lock<std::mutex> lock(mutex);
        ++entered;
        cv.notify_all();
        cv.wait(lock, [this] { return open; });
    }
};

// Solid-colour RGB frames of the region size, or of a fixed size when set.
class FakeSource final : public IFrameSource {
public:
    std::string name() const override {
        return "fake";
    }
    bool isAvailable() const override {
        return true;
    }
    bool supportsContinuous() const override {
        return true;
    }
    bool capture(const Region& region, Image& out,
                 std::string& err) override {
        size_t index = captures.fetch_add(1);
        if (clock) {
            captureTimes.push_back(clock->now());
            if (index < costs.size()) {
                clock->advance(costs[index]);
            }
        }
        if (gate) {
            gate->pass();
        }
        if (failAt >= 0 && index >= static_cast<size_t>(failAt)) {
            err = "display went away";
            return false;
        }
        out.w = frameW > 0 ? frameW : region.width();
        out.h = frameH > 0 ? frameH : region.height();
        out.order = PixelOrder::RGB;
        out.pixels.assign(out.expectedSize(), 0);
        for (size_t i = 0; i + 2 < out.pixels.size(); i += 3) {
            out.pixels[i] = r;
            out.pixels[i + 1] = g;
            out.pixels[i + 2] = b;
        }
        if (truncateAt >= 0 && index >= static_cast<size_t>(truncateAt)) {
            out.pixels.resize(out.pixels.size() / 2);
        }
        return true;
    }
    bool desktopSize(int& width, int& height) override {
        width = 1920;
        height = 1080;
        return true;
    }

    std::atomic<size_t> captures{0};
    int failAt = -1;
    // From this capture on, frames carry only half their pixel bytes.
    int truncateAt = -1;
    int frameW = 0;
    int frameH = 0;
    std::uint8_t r = 10;
    std::uint8_t g = 20;
    std::uint8_t b = 30;
    FakePacer* clock = nullptr;
    std::vector<std::chrono::milliseconds> costs;
    std::vector<IPacer::TimePoint> captureTimes;
    CaptureGate* gate = nullptr;
};

// Shared with the test so it outlives the encoder a session owns.
struct EncoderProbe {
    std::atomic<int> opens{0};
    std::atomic<int> closes{0};
    std::atomic<std::uint64_t> frames{0};
    bool failOpen = false;
    int failAtFrame = -1;
    std::atomic<bool>* cancel = nullptr;
    std::uint64_t cancelAfterFrames = 0;

    std::mutex mutex;
    std::string path;
    int width = 0;
    int height = 0;
    int fps = 0;
    std::uint8_t firstPixel[3] = {0, 0, 0};
};

// Accepts BGR frames of exactly the opened size.
class FakeEncoder final : public IFrameEncoder {
public:
    explicit FakeEncoder(std::shared_ptr<EncoderProbe> probe)
        : probe_(std::move(probe)) {}

    bool open(const std::string& path, int width, int height, int fps,
              std::string& err) override {
        probe_->opens++;
        if (probe_->failOpen) {
            err = "cannot create file";
            return false;
        }
        std::lock_guard<std::mutex> lock(probe_->mutex);
        probe_->path = path;
        probe_->width = width;
        probe_->height = height;
        probe_->fps = fps;
        open_ = true;
        return true;
    }

    bool writeFrame(const Image& frame, std::string& err) override {
        if (!open_) {
            err = "not open";
            return false;
        }
        std::lock_guard<std::mutex> lock(probe_->mutex);
        if (probe_->failAtFrame >= 0 &&
            probe_->frames.load() >= static_cast<std::uint64_t>(
                                         probe_->failAtFrame)) {
            err = "disk full";
            return false;
        }
        if (frame.w != probe_->width || frame.h != probe_->height ||
            frame.order != PixelOrder::BGR ||
            frame.pixels.size() != frame.expectedSize()) {
            err = "unexpected frame layout";
            return false;
        }
        for (int i = 0; i < 3; ++i) {
            probe_->firstPixel[i] = frame.pixels[i];
        }
        std::uint64_t written = ++probe_->frames;
        if (probe_->cancel && written >= probe_->cancelAfterFrames) {
            probe_->cancel->store(true);
        }
        return true;
    }

    void close() override {
        probe_->closes++;
        open_ = false;
    }

    PixelOrder inputOrder() const override {
        return PixelOrder::BGR;
    }

    std::uint64_t framesWritten() const override {
        return probe_->frames.load();
    }

private:
    std::shared_ptr<EncoderProbe> probe_;
    bool open_ = false;
};

}  // namespace snarp::test
