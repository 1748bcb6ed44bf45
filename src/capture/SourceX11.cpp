#include "capture/SourceX11.hpp"

#include <X11/Xlib.h>
#include <X11/Xutil.h>

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>

namespace snarp {

namespace {

struct XImageDestroy {
    void operator()(XImage* image) const {
        XDestroyImage(image);
    }
};
using XImagePtr = std::unique_ptr<XImage, XImageDestroy>;

// One colour channel of a TrueColor visual, scaled to 8 bits.
struct Channel {
    explicit Channel(unsigned long m)
        : mask(m), shift(m ? __builtin_ctzl(m) : 0), max(m >> shift) {}

    std::uint8_t extract(unsigned long pixel) const {
        return static_cast<std::uint8_t>(
            max ? ((pixel & mask) >> shift) * 255ul / max : 0);
    }

    unsigned long mask;
    int shift;
    unsigned long max;
};

// 32bpp little-endian 0x00RRGGBB, the layout of nearly every X server.
bool isPackedXrgb(const XImage& image) {
    return image.bits_per_pixel == 32 && image.byte_order == LSBFirst &&
           image.red_mask == 0xff0000ul && image.green_mask == 0x00ff00ul &&
           image.blue_mask == 0x0000fful;
}

void copyPackedXrgb(const XImage& image, std::uint8_t* dst) {
    for (int y = 0; y < image.height; ++y) {
        const auto* src = reinterpret_cast<const std::uint8_t*>(
            image.data + static_cast<size_t>(y) * image.bytes_per_line);
        for (int x = 0; x < image.width; ++x, src += 4) {
            // B, G, R, X in memory.
            *dst++ = src[2];
            *dst++ = src[1];
            *dst++ = src[0];
        }
    }
}

void copyMasked(XImage& image, std::uint8_t* dst) {
    const Channel red(image.red_mask);
    const Channel green(image.green_mask);
    const Channel blue(image.blue_mask);
    for (int y = 0; y < image.height; ++y) {
        for (int x = 0; x < image.width; ++x) {
            const unsigned long pixel = XGetPixel(&image, x, y);
            *dst++ = red.extract(pixel);
            *dst++ = green.extract(pixel);
            *dst++ = blue.extract(pixel);
        }
    }
}

}  // namespace

class X11FrameSource final : public IFrameSource {
public:
    explicit X11FrameSource(LogSink& log) : log_(log) {}

    ~X11FrameSource() override {
        if (display_) {
            XCloseDisplay(display_);
        }
    }

    std::string name() const override {
        return "x11";
    }

    bool isAvailable() const override {
        if (!std::getenv("DISPLAY")) {
            return false;
        }
        Display* probe = XOpenDisplay(nullptr);
        if (probe) {
            XCloseDisplay(probe);
        }
        return probe != nullptr;
    }

    bool supportsContinuous() const override {
        return true;
    }

    bool desktopSize(int& width, int& height) override {
        if (!ensureDisplay()) {
            return false;
        }
        int screen = DefaultScreen(display_);
        width = DisplayWidth(display_, screen);
        height = DisplayHeight(display_, screen);
        return true;
    }

    bool capture(const Region& region, Image& out, std::string& err) override {
        if (!ensureDisplay()) {
            err = "X11: failed to open display";
            return false;
        }

        // XGetImage raises a fatal BadMatch for rectangles outside the root
        // window, so reject them up front.
        int screenW = 0;
        int screenH = 0;
        desktopSize(screenW, screenH);
        if (region.right() > screenW || region.bottom() > screenH) {
            err = "X11: region " + region.toString() +
                  " exceeds screen " + std::to_string(screenW) + "x" +
                  std::to_string(screenH);
            return false;
        }

        XImagePtr image(XGetImage(display_, DefaultRootWindow(display_),
                                  region.x(), region.y(),
                                  static_cast<unsigned int>(region.width()),
                                  static_cast<unsigned int>(region.height()),
                                  AllPlanes, ZPixmap));
        if (!image) {
            err = "X11: XGetImage failed (permissions or remote session?)";
            return false;
        }

        out.w = image->width;
        out.h = image->height;
        out.order = PixelOrder::RGB;
        out.pixels.resize(out.expectedSize());
        if (isPackedXrgb(*image)) {
            copyPackedXrgb(*image, out.pixels.data());
        } else {
            copyMasked(*image, out.pixels.data());
        }
        return true;
    }

private:
    // Opened lazily. Never used by two threads at once: while recording, only
    // the capture thread touches the source.
    bool ensureDisplay() {
        if (display_) {
            return true;
        }
        display_ = XOpenDisplay(nullptr);
        if (!display_) {
            LOG_ERROR(log_, "X11: failed to open display for capture");
            return false;
        }
        return true;
    }

    LogSink& log_;
    Display* display_ = nullptr;
};

std::unique_ptr<IFrameSource> CreateSourceX11(LogSink& log) {
    return std::make_unique<X11FrameSource>(log);
}

}  // namespace snarp
