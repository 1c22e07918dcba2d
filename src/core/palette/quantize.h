#pragma once

#include "core/colour.h"
#include "core/error.h"

#include <cstdint>
#include <span>
#include <vector>

namespace imagen::palette
{
using colour::Rgb8;

struct ImageRgba
{
    int                       width = 0;
    int                       height = 0;
    std::vector<std::uint8_t> pixels; // RGBA8, row-major, width * height * 4
};

struct QuantizeOptions
{
    int colour_count = 50;
    int quality = 1; // sample every Nth pixel
};

// Median-cut quantization over a 5-bit-per-channel histogram.
// Skips pixels with alpha < 125 and near-white pixels. Each box reports the
// population-weighted mean of the real pixels it holds; results are ordered by population,
// largest first.
bool QuantizeColours(const ImageRgba& image,
                     const QuantizeOptions& options,
                     std::vector<Rgb8>& out,
                     Error& err);

// Candidate list for theme building: [dominant colour] + QuantizeColours(options).
// The dominant colour is the most populous box of a five colour quantization.
bool ExtractCandidates(const ImageRgba& image,
                       const QuantizeOptions& options,
                       std::vector<Rgb8>& out,
                       Error& err);
} // namespace imagen::palette
