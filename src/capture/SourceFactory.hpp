#pragma once

#include <memory>

#include "capture/IFrameSource.hpp"
#include "platform/Log.hpp"

namespace snarp {

enum class SourceKind { Auto, X11, Wlr, Portal };

// Auto picks by session type. With needContinuous set it never settles on a
// source that cannot stream frames.
std::unique_ptr<IFrameSource> CreateFrameSource(SourceKind kind, LogSink& log,
                                                bool needContinuous);

}  // namespace snarp
