// xterm-256 palette, used when the terminal cannot show 24-bit colour.
//
// Layout:
// - 0..15   : ANSI base colours
// - 16..231 : 6x6x6 colour cube (levels: 0,95,135,175,215,255)
// - 232..255: grayscale ramp (24 steps, 8..238)
#pragma once

#include "core/colour.h"

#include <cstdint>

namespace imagen::xterm256
{
// Returns the palette RGB for idx (0..255). Out-of-range indices are clamped.
const colour::Rgb8& RgbForIndex(int idx);

// Nearest xterm-256 index by squared RGB distance. Only the cube cell, the grayscale step and
// the 16 base colours nearest to the input are compared; ties keep the earlier candidate.
int NearestIndex(const colour::Rgb8& c);

inline std::uint8_t ClampIndex(int idx)
{
    if (idx < 0) return 0;
    if (idx > 255) return 255;
    return (std::uint8_t)idx;
}
} // namespace imagen::xterm256
