#include "io/convert/preview_convert.h"

#include "io/image_writer.h"

#include <algorithm>
#include <cstdint>
#include <cstdlib>

namespace preview_convert
{
bool Downscale(const ImageRgba& src, int scale, ImageRgba& out, std::string& err)
{
    err.clear();
    out = ImageRgba{};

    if (scale < 1)
    {
        err = "Preview scale must be at least 1.";
        return false;
    }
    if (src.width <= 0 || src.height <= 0 ||
        src.pixels.size() < (size_t)src.width * (size_t)src.height * 4u)
    {
        err = "Invalid source image.";
        return false;
    }

    // Boxes never need to be larger than the image itself.
    scale = std::min(scale, std::max(src.width, src.height));

    out.width = std::max(1, src.width / scale);
    out.height = std::max(1, src.height / scale);
    out.pixels.resize((size_t)out.width * (size_t)out.height * 4u);

    for (int y = 0; y < out.height; ++y)
    {
        const int y0 = y * scale;
        const int y1 = std::min(src.height, y0 + scale);
        for (int x = 0; x < out.width; ++x)
        {
            const int x0 = x * scale;
            const int x1 = std::min(src.width, x0 + scale);

            std::uint64_t sum[4] = {0, 0, 0, 0};
            std::uint64_t n = 0;
            for (int sy = y0; sy < y1; ++sy)
            {
                for (int sx = x0; sx < x1; ++sx)
                {
                    const std::uint8_t* p = &src.pixels[((size_t)sy * (size_t)src.width + (size_t)sx) * 4u];
                    for (int k = 0; k < 4; ++k)
                        sum[k] += p[k];
                    ++n;
                }
            }

            std::uint8_t* d = &out.pixels[((size_t)y * (size_t)out.width + (size_t)x) * 4u];
            for (int k = 0; k < 4; ++k)
                d[k] = (std::uint8_t)(n ? sum[k] / n : 0);
        }
    }
    return true;
}

Rgb8 NearestColour(const Rgb8& c, std::span<const Rgb8> palette)
{
    Rgb8 best = palette[0];
    int best_d = -1;
    for (const Rgb8& p : palette)
    {
        const int d = std::abs((int)c.r - (int)p.r) + std::abs((int)c.g - (int)p.g) + std::abs((int)c.b - (int)p.b);
        if (best_d < 0 || d < best_d)
        {
            best_d = d;
            best = p;
        }
    }
    return best;
}

std::vector<Rgb8> UniqueColours(const imagen::palette::PaletteAssignment& assignment)
{
    std::vector<Rgb8> out;
    for (const auto& e : assignment.entries)
        if (std::find(out.begin(), out.end(), e.colour) == out.end())
            out.push_back(e.colour);
    return out;
}

bool RenderPreview(const ImageRgba& src,
                   const imagen::palette::PaletteAssignment& assignment,
                   const Settings& s,
                   ImageRgba& out,
                   int& out_distinct,
                   std::string& err)
{
    out_distinct = 0;

    const std::vector<Rgb8> palette = UniqueColours(assignment);
    if (palette.empty())
    {
        err = "No theme colours to render with.";
        return false;
    }

    if (!Downscale(src, s.scale, out, err))
        return false;

    std::vector<bool> used(palette.size(), false);
    const size_t n = (size_t)out.width * (size_t)out.height;
    for (size_t i = 0; i < n; ++i)
    {
        std::uint8_t* p = &out.pixels[i * 4u];
        const Rgb8 c = NearestColour(Rgb8{p[0], p[1], p[2]}, palette);
        p[0] = c.r;
        p[1] = c.g;
        p[2] = c.b;
        p[3] = 255;

        const auto idx = (size_t)(std::find(palette.begin(), palette.end(), c) - palette.begin());
        used[idx] = true;
    }

    out_distinct = (int)std::count(used.begin(), used.end(), true);
    return true;
}

bool WritePreviewPng(const std::string& path,
                     const ImageRgba& src,
                     const imagen::palette::PaletteAssignment& assignment,
                     const Settings& s,
                     int& out_distinct,
                     std::string& err)
{
    ImageRgba preview;
    if (!RenderPreview(src, assignment, s, preview, out_distinct, err))
        return false;
    return image_writer::WritePngFromRgba32(path, preview.width, preview.height, preview.pixels, err);
}
} // namespace preview_convert
