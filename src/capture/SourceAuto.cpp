#include <cstdlib>
#include <memory>
#include <string>
#include <utility>

#include "capture/SourceFactory.hpp"

#if defined(SNARP_HAS_X11)
#include "capture/SourceX11.hpp"
#endif
#if defined(SNARP_HAS_WAYLAND)
#include "capture/SourceWlrScreencopy.hpp"
#endif
#if defined(SNARP_HAS_PORTAL)
#include "capture/SourcePortalScreenshot.hpp"
#endif

namespace snarp {

namespace {

std::unique_ptr<IFrameSource> createX11(LogSink& log) {
#if defined(SNARP_HAS_X11)
    return CreateSourceX11(log);
#else
    (void)log;
    return nullptr;
#endif
}

std::unique_ptr<IFrameSource> createWlr(LogSink& log) {
#if defined(SNARP_HAS_WAYLAND)
    return CreateSourceWlrScreencopy(log);
#else
    (void)log;
    return nullptr;
#endif
}

std::unique_ptr<IFrameSource> createPortal(LogSink& log) {
#if defined(SNARP_HAS_PORTAL)
    return CreateSourcePortalScreenshot(log);
#else
    (void)log;
    return nullptr;
#endif
}

}  // namespace

// Resolves to a concrete source on first use and forwards to it afterwards.
class SourceAuto final : public IFrameSource {
public:
    SourceAuto(LogSink& log, bool needContinuous)
        : log_(log), needContinuous_(needContinuous) {}

    std::string name() const override {
        auto source = selectSource();
        return source ? source->name() : "auto";
    }

    bool isAvailable() const override {
        return selectSource() != nullptr;
    }

    bool supportsContinuous() const override {
        auto source = selectSource();
        return source && source->supportsContinuous();
    }

    bool desktopSize(int& width, int& height) override {
        auto source = selectSource();
        return source && source->desktopSize(width, height);
    }

    bool capture(const Region& region, Image& out, std::string& err) override {
        auto source = selectSource();
        if (!source) {
            err = "no capture source available";
            return false;
        }
        return source->capture(region, out, err);
    }

private:
    IFrameSource* selectSource() const {
        if (selected_) {
            return selected_.get();
        }
        bool hasWayland = std::getenv("WAYLAND_DISPLAY") != nullptr;
        bool hasX11 = std::getenv("DISPLAY") != nullptr;

        if (hasX11 && !hasWayland) {
            if (adopt(createX11(log_), "x11")) {
                return selected_.get();
            }
        }

        if (hasWayland) {
            if (adopt(createWlr(log_), "wlr-screencopy")) {
                return selected_.get();
            }
            if (needContinuous_) {
                LOG_INFO(log_,
                         "compositor lacks wlr-screencopy; portal cannot "
                         "record video");
            } else {
                LOG_INFO(log_,
                         "compositor lacks wlr-screencopy, trying portal");
                if (adopt(createPortal(log_), "portal")) {
                    return selected_.get();
                }
                LOG_WARN(log_,
                         "Neither wlr-screencopy nor portal source is "
                         "available");
            }
        }

        if (hasX11) {
            if (adopt(createX11(log_), "x11 (fallback)")) {
                return selected_.get();
            }
        }

        LOG_ERROR(log_, "auto source selection failed: no available source");
        return nullptr;
    }

    bool adopt(std::unique_ptr<IFrameSource> source, const char* label) const {
        if (!source || !source->isAvailable()) {
            return false;
        }
        if (needContinuous_ && !source->supportsContinuous()) {
            return false;
        }
        selected_ = std::move(source);
        LOG_DEBUG(log_, "auto source selected: %s", label);
        return true;
    }

    LogSink& log_;
    bool needContinuous_ = false;
    mutable std::unique_ptr<IFrameSource> selected_;
};

std::unique_ptr<IFrameSource> CreateFrameSource(SourceKind kind, LogSink& log,
                                                bool needContinuous) {
    std::unique_ptr<IFrameSource> source;
    switch (kind) {
        case SourceKind::Auto:
            return std::make_unique<SourceAuto>(log, needContinuous);
        case SourceKind::X11:
            source = createX11(log);
            if (!source) {
                LOG_ERROR(log, "x11 source disabled at build time");
            }
            break;
        case SourceKind::Wlr:
            source = createWlr(log);
            if (!source) {
                LOG_ERROR(log, "wlr source disabled at build time");
            }
            break;
        case SourceKind::Portal:
            source = createPortal(log);
            if (!source) {
                LOG_ERROR(log, "portal source disabled at build time");
            }
            break;
    }
    if (source && needContinuous && !source->supportsContinuous()) {
        LOG_ERROR(log, "%s source cannot record video",
                  source->name().c_str());
        return nullptr;
    }
    return source;
}

}  // namespace snarp
