#pragma once

#include <functional>
#include <memory>
#include <optional>

#include "core/Region.hpp"
#include "platform/Log.hpp"

namespace snarp {

// Receives the outcome of a selection: a region, or nullopt if cancelled.
using SelectionCallback = std::function<void(std::optional<Region>)>;

class IRegionSelector {
public:
    virtual ~IRegionSelector() = default;
    // Runs the interactive selection. done is invoked exactly once, after
    // all selection UI has been torn down.
    virtual void select(const SelectionCallback& done) = 0;
};

// nullptr when no interactive selector can run in this session (e.g.
// Wayland, or X11 support disabled at build time).
std::unique_ptr<IRegionSelector> CreateRegionSelector(LogSink& log);

}  // namespace snarp
