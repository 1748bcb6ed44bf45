#pragma once

#include <string>

#include "capture/CaptureTypes.hpp"

namespace snarp {

// Writes an RGB PNG. BGR input is converted on a copy; the caller's image is
// left untouched.
bool writePng(const std::string& path, const Image& image, std::string& err);

}  // namespace snarp
