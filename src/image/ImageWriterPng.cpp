#include "image/ImageWriterPng.hpp"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include "image/FrameConverter.hpp"

namespace snarp {

bool writePng(const std::string& path, const Image& image, std::string& err) {
    if (image.empty() || image.pixels.size() < image.expectedSize()) {
        err = "cannot write an empty image";
        return false;
    }

    const Image* rgb = &image;
    Image converted;
    if (image.order != PixelOrder::RGB) {
        converted = image;
        convertChannelOrder(converted, PixelOrder::RGB);
        rgb = &converted;
    }

    if (!stbi_write_png(path.c_str(), rgb->w, rgb->h, 3, rgb->pixels.data(),
                        rgb->w * 3)) {
        err = "failed to write PNG: " + path;
        return false;
    }
    return true;
}

}  // namespace snarp
