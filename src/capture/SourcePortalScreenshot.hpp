#pragma once

#include <memory>

#include "capture/IFrameSource.hpp"
#include "platform/Log.hpp"

namespace snarp {

std::unique_ptr<IFrameSource> CreateSourcePortalScreenshot(LogSink& log);

}  // namespace snarp
