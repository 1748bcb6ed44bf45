#pragma once

#include <memory>

#include "encode/IFrameEncoder.hpp"
#include "platform/Log.hpp"

namespace snarp {

// MPEG-4 Part 2 video in an MP4 container, yuv420p, constant frame rate.
std::unique_ptr<IFrameEncoder> CreateEncoderFFmpeg(LogSink& log);

}  // namespace snarp
