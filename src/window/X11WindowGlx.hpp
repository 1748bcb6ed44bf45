#pragma once

#include <memory>

#include "platform/Log.hpp"
#include "window/IWindow.hpp"

namespace snarp {

std::unique_ptr<IWindow> CreateX11WindowGlx(const WindowConfig& config,
                                            LogSink& log);

}  // namespace snarp
