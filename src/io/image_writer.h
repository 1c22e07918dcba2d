#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace image_writer
{
// Writes an RGBA8 buffer to a PNG file.
// Returns false on error and sets `err`.
bool WritePngFromRgba32(const std::string& path,
                        int width,
                        int height,
                        const std::vector<std::uint8_t>& rgba,
                        std::string& err);
} // namespace image_writer
