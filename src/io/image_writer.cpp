#include "io/image_writer.h"

// stb_image_write implementation must live in exactly one translation unit.
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image_write.h>

namespace image_writer
{
bool WritePngFromRgba32(const std::string& path,
                        int width,
                        int height,
                        const std::vector<std::uint8_t>& rgba,
                        std::string& err)
{
    err.clear();
    if (width <= 0 || height <= 0)
    {
        err = "Invalid image dimensions.";
        return false;
    }
    const size_t need = (size_t)width * (size_t)height * 4u;
    if (rgba.size() < need)
    {
        err = "Invalid RGBA buffer size.";
        return false;
    }

    const int ok = stbi_write_png(path.c_str(), width, height, 4, rgba.data(), width * 4);
    if (!ok)
    {
        err = "stbi_write_png() failed.";
        return false;
    }
    return true;
}
} // namespace image_writer
