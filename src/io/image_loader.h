#pragma once

#include "core/palette/quantize.h"

#include <string>

namespace image_loader
{
// Load an image from disk into an RGBA8 buffer using stb_image.
// - supports common formats (PNG/JPG/GIF/BMP/...)
// - output pixels are row-major, width * height * 4 bytes.
bool LoadImageAsRgba32(const std::string& path, imagen::palette::ImageRgba& out, std::string& err);
} // namespace image_loader
