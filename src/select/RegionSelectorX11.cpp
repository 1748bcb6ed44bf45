#include "select/RegionSelectorX11.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "capture/IFrameSource.hpp"
#include "capture/SourceX11.hpp"
#include "render/RendererGL.hpp"
#include "select/SelectionGesture.hpp"
#include "window/X11WindowGlx.hpp"

namespace snarp {

// Full-screen overlay showing a frozen, dimmed snapshot of the desktop. The
// dragged rectangle is shown undimmed with a dashed border.
class RegionSelectorX11 final : public IRegionSelector {
public:
    explicit RegionSelectorX11(LogSink& log) : log_(log) {}

    void select(const SelectionCallback& done) override {
        std::optional<Region> outcome = runOverlay();
        done(outcome);
    }

private:
    // Everything UI-related lives in this scope and is destroyed on return,
    // so the overlay is gone before the caller sees the outcome.
    std::optional<Region> runOverlay() {
        auto source = CreateSourceX11(log_);
        int screenW = 0;
        int screenH = 0;
        if (!source->desktopSize(screenW, screenH)) {
            LOG_ERROR(log_, "Failed to start selection: no X11 display");
            return std::nullopt;
        }

        std::string err;
        auto full = Region::create(0, 0, screenW, screenH, &err);
        Image snapshot;
        if (!full || !source->capture(*full, snapshot, err)) {
            LOG_ERROR(log_, "Failed to start selection: %s", err.c_str());
            return std::nullopt;
        }

        WindowConfig cfg;
        cfg.width = screenW;
        cfg.height = screenH;
        cfg.overlay = true;
        cfg.title = "snarp - select region";
        auto window = CreateX11WindowGlx(cfg, log_);
        if (!window) {
            LOG_ERROR(log_, "Failed to start selection: cannot create overlay");
            return std::nullopt;
        }

        // Declared after the window so it is destroyed first, while its GL
        // context is still current.
        RendererGL renderer(log_);
        if (!renderer.initGL() || !renderer.uploadSnapshotTexture(snapshot)) {
            LOG_ERROR(log_, "Failed to start selection: renderer init failed");
            return std::nullopt;
        }

        SelectionGesture gesture;
        bool prevLeft = false;
        for (;;) {
            window->pollEvents();
            InputState input = window->input();

            if (window->shouldClose() || input.keyEscape || input.keyQ ||
                input.mouseRight) {
                LOG_INFO(log_, "selection cancelled");
                return std::nullopt;
            }

            if (input.mouseLeft && !prevLeft) {
                gesture.press(input.mouseX, input.mouseY);
            } else if (input.mouseLeft) {
                gesture.drag(input.mouseX, input.mouseY);
            } else if (prevLeft) {
                std::string why;
                auto region =
                    gesture.release(input.mouseX, input.mouseY, why);
                if (!region) {
                    LOG_WARN(log_, "Invalid selection: %s", why.c_str());
                } else {
                    LOG_DEBUG(log_, "selected %s",
                              region->toString().c_str());
                }
                return region;
            }
            prevLeft = input.mouseLeft;

            SelectionOverlayState state;
            state.screenW = window->width();
            state.screenH = window->height();
            if (auto rect = gesture.current()) {
                state.hasSelection = true;
                state.x = static_cast<float>(rect->x);
                state.y = static_cast<float>(rect->y);
                state.w = static_cast<float>(rect->w);
                state.h = static_cast<float>(rect->h);
            }
            renderer.renderFrame(state);
            window->swap();

            std::this_thread::sleep_for(std::chrono::milliseconds(8));
        }
    }

    LogSink& log_;
};

std::unique_ptr<IRegionSelector> CreateRegionSelectorX11(LogSink& log) {
    return std::make_unique<RegionSelectorX11>(log);
}

}  // namespace snarp
