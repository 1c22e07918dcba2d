#pragma once

#include "core/colour.h"
#include "core/palette/slot_assigner.h"

#include <cstdio>
#include <span>
#include <string>
#include <string_view>

// Coloured "█████ (r, g, b) -> colorNN" lines for a quick look at a theme in the terminal.
namespace terminal_swatch
{
enum class Mode
{
    TrueColour, // ESC[38;2;r;g;bm
    Xterm256,   // ESC[38;5;nm, nearest xterm-256 index
};

// TrueColour when $COLORTERM is "truecolor" or "24bit", Xterm256 otherwise.
Mode DetectMode();

// "truecolour"/"truecolor", "xterm256" or "auto" (resolved through DetectMode()).
bool ParseMode(std::string_view s, Mode& out);

// One coloured line (no trailing newline).
std::string Swatch(const imagen::colour::Rgb8& c, std::string_view text, Mode mode);

// One line per slot, in assignment order.
std::string FormatAssignment(const imagen::palette::PaletteAssignment& assignment, Mode mode);

// One line per colour, darkest first.
std::string FormatPalette(std::span<const imagen::colour::Rgb8> palette, Mode mode);

void Print(std::FILE* out, const std::string& text);
} // namespace terminal_swatch
