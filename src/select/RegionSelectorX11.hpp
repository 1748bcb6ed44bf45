#pragma once

#include <memory>

#include "platform/Log.hpp"
#include "select/IRegionSelector.hpp"

namespace snarp {

std::unique_ptr<IRegionSelector> CreateRegionSelectorX11(LogSink& log);

}  // namespace snarp
