#include <cstdlib>

#include "select/IRegionSelector.hpp"

#if defined(SNARP_HAS_X11)
#include "select/RegionSelectorX11.hpp"
#endif

namespace snarp {

std::unique_ptr<IRegionSelector> CreateRegionSelector(LogSink& log) {
    bool hasWayland = std::getenv("WAYLAND_DISPLAY") != nullptr;
    bool hasX11 = std::getenv("DISPLAY") != nullptr;
    if (hasWayland) {
        // An XWayland overlay would only see X clients, not the desktop.
        LOG_DEBUG(log, "interactive selection unavailable on Wayland");
        return nullptr;
    }
#if defined(SNARP_HAS_X11)
    if (hasX11) {
        return CreateRegionSelectorX11(log);
    }
#else
    (void)hasX11;
    LOG_DEBUG(log, "X11 selection disabled at build time");
#endif
    return nullptr;
}

}  // namespace snarp
