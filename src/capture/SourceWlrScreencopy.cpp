#include "capture/SourceWlrScreencopy.hpp"

#include <sys/mman.h>
#include <unistd.h>
#include <wayland-client.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "wlr-screencopy-unstable-v1-client-protocol.h"
#include "xdg-output-unstable-v1-client-protocol.h"

namespace snarp {

namespace {

// Anonymous shared memory handed to the compositor as a wl_buffer. Kept
// across frames and only reallocated when the announced layout changes.
class ShmBuffer {
public:
    ShmBuffer() = default;
    ~ShmBuffer() {
        reset();
    }
    ShmBuffer(const ShmBuffer&) = delete;
    ShmBuffer& operator=(const ShmBuffer&) = delete;

    bool matches(uint32_t format, int width, int height, int stride) const {
        return buffer_ && format_ == format && width_ == width &&
               height_ == height && stride_ == stride;
    }

    bool allocate(wl_shm* shm, uint32_t format, int width, int height,
                  int stride) {
        reset();
        const size_t size = static_cast<size_t>(stride) * height;
        int fd = memfd_create("snarp-screencopy", MFD_CLOEXEC);
        if (fd < 0) {
            return false;
        }
        if (ftruncate(fd, static_cast<off_t>(size)) != 0) {
            ::close(fd);
            return false;
        }
        void* data = mmap(nullptr, size, PROT_READ | PROT_WRITE, MAP_SHARED,
                          fd, 0);
        if (data == MAP_FAILED) {
            ::close(fd);
            return false;
        }
        wl_shm_pool* pool = wl_shm_create_pool(shm, fd, static_cast<int>(size));
        buffer_ = wl_shm_pool_create_buffer(pool, 0, width, height, stride,
                                            format);
        wl_shm_pool_destroy(pool);
        ::close(fd);
        if (!buffer_) {
            munmap(data, size);
            return false;
        }
        data_ = data;
        size_ = size;
        format_ = format;
        width_ = width;
        height_ = height;
        stride_ = stride;
        return true;
    }

    void reset() {
        if (buffer_) {
            wl_buffer_destroy(buffer_);
            buffer_ = nullptr;
        }
        if (data_) {
            munmap(data_, size_);
            data_ = nullptr;
        }
        size_ = 0;
    }

    wl_buffer* handle() const {
        return buffer_;
    }
    const uint8_t* row(int y) const {
        return static_cast<const uint8_t*>(data_) +
               static_cast<size_t>(stride_) * y;
    }

private:
    wl_buffer* buffer_ = nullptr;
    void* data_ = nullptr;
    size_t size_ = 0;
    uint32_t format_ = 0;
    int width_ = 0;
    int height_ = 0;
    int stride_ = 0;
};

struct Output {
    wl_output* output = nullptr;
    zxdg_output_v1* xdg = nullptr;
    OutputInfo info;
};

const wl_output_listener kOutputListener = {
    // geometry: physical position, replaced by xdg-output when available.
    [](void* data, wl_output*, int32_t x, int32_t y, int32_t, int32_t,
       int32_t, const char*, const char*, int32_t) {
        auto* out = static_cast<Output*>(data);
        out->info.x = x;
        out->info.y = y;
    },
    [](void* data, wl_output*, uint32_t flags, int32_t width, int32_t height,
       int32_t) {
        if (flags & WL_OUTPUT_MODE_CURRENT) {
            auto* out = static_cast<Output*>(data);
            out->info.w = width;
            out->info.h = height;
        }
    },
    [](void*, wl_output*) {},
    [](void* data, wl_output*, int32_t factor) {
        static_cast<Output*>(data)->info.scale = static_cast<float>(factor);
    },
    [](void* data, wl_output*, const char* name) {
        if (name) {
            static_cast<Output*>(data)->info.name = name;
        }
    },
    [](void*, wl_output*, const char*) {},
};

// Logical geometry, the coordinate space capture_output_region works in.
const zxdg_output_v1_listener kXdgOutputListener = {
    [](void* data, zxdg_output_v1*, int32_t x, int32_t y) {
        auto* out = static_cast<Output*>(data);
        out->info.x = x;
        out->info.y = y;
    },
    [](void* data, zxdg_output_v1*, int32_t width, int32_t height) {
        auto* out = static_cast<Output*>(data);
        out->info.w = width;
        out->info.h = height;
    },
    [](void*, zxdg_output_v1*) {},
    [](void* data, zxdg_output_v1*, const char* name) {
        if (name) {
            static_cast<Output*>(data)->info.name = name;
        }
    },
    [](void*, zxdg_output_v1*, const char*) {},
};

// Globals of one Wayland connection.
class Connection {
public:
    Connection() = default;
    ~Connection() {
        for (auto& out : outputs) {
            if (out->xdg) {
                zxdg_output_v1_destroy(out->xdg);
            }
            if (out->output) {
                wl_output_destroy(out->output);
            }
        }
        if (xdgOutputManager) {
            zxdg_output_manager_v1_destroy(xdgOutputManager);
        }
        if (screencopy) {
            zwlr_screencopy_manager_v1_destroy(screencopy);
        }
        if (shm) {
            wl_shm_destroy(shm);
        }
        if (registry_) {
            wl_registry_destroy(registry_);
        }
        if (display) {
            wl_display_disconnect(display);
        }
    }
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    bool open() {
        display = wl_display_connect(nullptr);
        if (!display) {
            return false;
        }
        registry_ = wl_display_get_registry(display);
        wl_registry_add_listener(registry_, &kRegistryListener, this);
        // Globals, then the events of the outputs just bound.
        wl_display_roundtrip(display);
        wl_display_roundtrip(display);
        if (xdgOutputManager) {
            for (auto& out : outputs) {
                out->xdg = zxdg_output_manager_v1_get_xdg_output(
                    xdgOutputManager, out->output);
                zxdg_output_v1_add_listener(out->xdg, &kXdgOutputListener,
                                            out.get());
            }
            wl_display_roundtrip(display);
        }
        return true;
    }

    bool canCapture() const {
        return screencopy && shm;
    }

    const Output* outputContaining(const Region& region) const {
        for (const auto& out : outputs) {
            const OutputInfo& info = out->info;
            if (region.x() >= info.x && region.y() >= info.y &&
                region.right() <= info.x + info.w &&
                region.bottom() <= info.y + info.h) {
                return out.get();
            }
        }
        return nullptr;
    }

    wl_display* display = nullptr;
    wl_shm* shm = nullptr;
    zwlr_screencopy_manager_v1* screencopy = nullptr;
    zxdg_output_manager_v1* xdgOutputManager = nullptr;
    std::vector<std::unique_ptr<Output>> outputs;

private:
    static void onGlobal(void* data, wl_registry* registry, uint32_t id,
                         const char* iface, uint32_t version) {
        auto* self = static_cast<Connection*>(data);
        if (std::strcmp(iface, wl_shm_interface.name) == 0) {
            self->shm = static_cast<wl_shm*>(
                wl_registry_bind(registry, id, &wl_shm_interface, 1));
        } else if (std::strcmp(iface, wl_output_interface.name) == 0) {
            auto out = std::make_unique<Output>();
            out->output = static_cast<wl_output*>(wl_registry_bind(
                registry, id, &wl_output_interface, std::min(version, 4u)));
            wl_output_add_listener(out->output, &kOutputListener, out.get());
            self->outputs.push_back(std::move(out));
        } else if (std::strcmp(iface,
                               zwlr_screencopy_manager_v1_interface.name) ==
                   0) {
            self->screencopy = static_cast<zwlr_screencopy_manager_v1*>(
                wl_registry_bind(registry, id,
                                 &zwlr_screencopy_manager_v1_interface,
                                 std::min(version, 3u)));
        } else if (std::strcmp(iface,
                               zxdg_output_manager_v1_interface.name) == 0) {
            self->xdgOutputManager = static_cast<zxdg_output_manager_v1*>(
                wl_registry_bind(registry, id,
                                 &zxdg_output_manager_v1_interface,
                                 std::min(version, 3u)));
        }
    }

    static const wl_registry_listener kRegistryListener;

    wl_registry* registry_ = nullptr;
};

const wl_registry_listener Connection::kRegistryListener = {
    &Connection::onGlobal, [](void*, wl_registry*, uint32_t) {}};

// State of one zwlr_screencopy_frame_v1 from request to ready or failed.
// Version 3 frames announce every buffer type and then buffer_done; older
// ones only send buffer, so the copy is issued right away.
class FrameRequest {
public:
    FrameRequest(wl_shm* shm, ShmBuffer& buffer,
                 zwlr_screencopy_frame_v1* frame)
        : shm_(shm), buffer_(buffer), frame_(frame) {
        zwlr_screencopy_frame_v1_add_listener(frame_, &kListener, this);
    }
    ~FrameRequest() {
        zwlr_screencopy_frame_v1_destroy(frame_);
    }
    FrameRequest(const FrameRequest&) = delete;
    FrameRequest& operator=(const FrameRequest&) = delete;

    bool finished() const {
        return ready || failed;
    }

    bool ready = false;
    bool failed = false;
    bool yInvert = false;
    uint32_t format = 0;
    int width = 0;
    int height = 0;
    int stride = 0;

private:
    void onBuffer(uint32_t fmt, uint32_t w, uint32_t h, uint32_t s) {
        format = fmt;
        width = static_cast<int>(w);
        height = static_cast<int>(h);
        stride = static_cast<int>(s);
        haveLayout_ = true;
        if (zwlr_screencopy_frame_v1_get_version(frame_) < 3) {
            copy();
        }
    }

    void copy() {
        if (copied_) {
            return;
        }
        if (!buffer_.matches(format, width, height, stride) &&
            !buffer_.allocate(shm_, format, width, height, stride)) {
            failed = true;
            return;
        }
        zwlr_screencopy_frame_v1_copy(frame_, buffer_.handle());
        copied_ = true;
    }

    static FrameRequest* self(void* data) {
        return static_cast<FrameRequest*>(data);
    }

    static const zwlr_screencopy_frame_v1_listener kListener;

    wl_shm* shm_;
    ShmBuffer& buffer_;
    zwlr_screencopy_frame_v1* frame_;
    bool haveLayout_ = false;
    bool copied_ = false;
};

const zwlr_screencopy_frame_v1_listener FrameRequest::kListener = {
    [](void* data, zwlr_screencopy_frame_v1*, uint32_t fmt, uint32_t w,
       uint32_t h, uint32_t s) { self(data)->onBuffer(fmt, w, h, s); },
    [](void* data, zwlr_screencopy_frame_v1*, uint32_t flags) {
        self(data)->yInvert =
            (flags & ZWLR_SCREENCOPY_FRAME_V1_FLAGS_Y_INVERT) != 0;
    },
    [](void* data, zwlr_screencopy_frame_v1*, uint32_t, uint32_t,
       uint32_t) { self(data)->ready = true; },
    [](void* data, zwlr_screencopy_frame_v1*) {
        self(data)->failed = true;
    },
    [](void*, zwlr_screencopy_frame_v1*, uint32_t, uint32_t, uint32_t,
       uint32_t) {},
    [](void*, zwlr_screencopy_frame_v1*, uint32_t, uint32_t, uint32_t) {},
    [](void* data, zwlr_screencopy_frame_v1*) {
        if (self(data)->haveLayout_) {
            self(data)->copy();
        }
    },
};

// XRGB/ARGB little-endian words to packed RGB, honouring y-invert.
void unpackXrgb(const ShmBuffer& buffer, const FrameRequest& req, Image& out) {
    out.w = req.width;
    out.h = req.height;
    out.order = PixelOrder::RGB;
    out.pixels.resize(out.expectedSize());
    uint8_t* dst = out.pixels.data();
    for (int y = 0; y < req.height; ++y) {
        const auto* src = reinterpret_cast<const uint32_t*>(
            buffer.row(req.yInvert ? req.height - 1 - y : y));
        for (int x = 0; x < req.width; ++x) {
            const uint32_t px = src[x];
            *dst++ = static_cast<uint8_t>(px >> 16);
            *dst++ = static_cast<uint8_t>(px >> 8);
            *dst++ = static_cast<uint8_t>(px);
        }
    }
}

}  // namespace

// Captures one region per frame with capture_output_region on a connection
// kept open for the lifetime of the source.
class WlrScreencopySource final : public IFrameSource {
public:
    explicit WlrScreencopySource(LogSink& log) : log_(log) {}

    ~WlrScreencopySource() override {
        // The buffer belongs to the connection's wl_shm.
        buffer_.reset();
        conn_.reset();
    }

    std::string name() const override {
        return "wlr-screencopy";
    }

    bool isAvailable() const override {
        if (!std::getenv("WAYLAND_DISPLAY")) {
            return false;
        }
        Connection probe;
        return probe.open() && probe.canCapture();
    }

    bool supportsContinuous() const override {
        return true;
    }

    bool desktopSize(int& width, int& height) override {
        if (!connect()) {
            return false;
        }
        width = 0;
        height = 0;
        for (const auto& out : conn_->outputs) {
            width = std::max(width, out->info.x + out->info.w);
            height = std::max(height, out->info.y + out->info.h);
        }
        return width > 0 && height > 0;
    }

    bool capture(const Region& region, Image& out, std::string& err) override {
        if (!connect()) {
            err = "wlr: failed to connect to Wayland display";
            return false;
        }
        if (!conn_->canCapture()) {
            err = "wlr: compositor lacks screencopy manager or shm";
            return false;
        }
        const Output* target = conn_->outputContaining(region);
        if (!target) {
            err = "wlr: region " + region.toString() +
                  " does not lie within a single output";
            return false;
        }

        FrameRequest req(
            conn_->shm, buffer_,
            zwlr_screencopy_manager_v1_capture_output_region(
                conn_->screencopy, 0, target->output,
                region.x() - target->info.x, region.y() - target->info.y,
                region.width(), region.height()));
        while (!req.finished()) {
            if (wl_display_dispatch(conn_->display) < 0) {
                err = "wlr: lost connection to compositor";
                return false;
            }
        }
        if (req.failed) {
            err = "wlr: compositor failed the copy";
            return false;
        }
        if (req.format != WL_SHM_FORMAT_ARGB8888 &&
            req.format != WL_SHM_FORMAT_XRGB8888) {
            err = "wlr: unsupported shm format " + std::to_string(req.format);
            return false;
        }
        // On scaled outputs the buffer is in physical pixels; the capture
        // loop resizes to the logical region.
        unpackXrgb(buffer_, req, out);
        return true;
    }

private:
    bool connect() {
        if (conn_) {
            return true;
        }
        auto conn = std::make_unique<Connection>();
        if (!conn->open()) {
            LOG_ERROR(log_, "wlr: failed to connect to Wayland display");
            return false;
        }
        for (const auto& out : conn->outputs) {
            LOG_DEBUG(log_, "wlr: output %s at %d,%d %dx%d scale %.0f",
                      out->info.name.c_str(), out->info.x, out->info.y,
                      out->info.w, out->info.h, out->info.scale);
        }
        conn_ = std::move(conn);
        return true;
    }

    LogSink& log_;
    std::unique_ptr<Connection> conn_;
    ShmBuffer buffer_;
};

std::unique_ptr<IFrameSource> CreateSourceWlrScreencopy(LogSink& log) {
    return std::make_unique<WlrScreencopySource>(log);
}

}  // namespace snarp
