#include "io/image_loader.h"

#include <cstring>

// stb_image implementation must live in exactly one translation unit.
#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h>

namespace image_loader
{
bool LoadImageAsRgba32(const std::string& path, imagen::palette::ImageRgba& out, std::string& err)
{
    err.clear();
    out = imagen::palette::ImageRgba{};

    int w = 0;
    int h = 0;
    int channels_in_file = 0;

    // Force 4 channels so we always get RGBA8.
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &channels_in_file, 4);
    if (!data)
    {
        err = std::string("Failed to load image: ") + (stbi_failure_reason() ? stbi_failure_reason() : "unknown error");
        return false;
    }

    if (w <= 0 || h <= 0)
    {
        stbi_image_free(data);
        err = "Invalid image dimensions.";
        return false;
    }

    out.width = w;
    out.height = h;

    const size_t pixel_bytes = static_cast<size_t>(w) * static_cast<size_t>(h) * 4u;
    out.pixels.resize(pixel_bytes);
    std::memcpy(out.pixels.data(), data, pixel_bytes);

    stbi_image_free(data);
    return true;
}
} // namespace image_loader
