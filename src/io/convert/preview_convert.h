// Theme preview: the source image redrawn with only the theme's colours.
#pragma once

#include "core/colour.h"
#include "core/palette/quantize.h"
#include "core/palette/slot_assigner.h"

#include <span>
#include <string>
#include <vector>

namespace preview_convert
{
using imagen::colour::Rgb8;
using imagen::palette::ImageRgba;

struct Settings
{
    int scale = 4; // integer downscale factor (>= 1)
};

// Box-average downscale by an integer factor. Output dimensions are at least 1x1.
bool Downscale(const ImageRgba& src, int scale, ImageRgba& out, std::string& err);

// Nearest palette colour by Manhattan distance; the first of equally near colours wins.
// `palette` must not be empty.
Rgb8 NearestColour(const Rgb8& c, std::span<const Rgb8> palette);

// Distinct colours of an assignment, in assignment order.
std::vector<Rgb8> UniqueColours(const imagen::palette::PaletteAssignment& assignment);

// Downscales `src` and maps every pixel to its nearest theme colour (opaque output).
// out_distinct is the number of different colours present in the result.
bool RenderPreview(const ImageRgba& src,
                   const imagen::palette::PaletteAssignment& assignment,
                   const Settings& s,
                   ImageRgba& out,
                   int& out_distinct,
                   std::string& err);

// RenderPreview() then writes a PNG to `path`.
bool WritePreviewPng(const std::string& path,
                     const ImageRgba& src,
                     const imagen::palette::PaletteAssignment& assignment,
                     const Settings& s,
                     int& out_distinct,
                     std::string& err);
} // namespace preview_convert
