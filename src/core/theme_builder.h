#pragma once

#include "core/colour.h"
#include "core/error.h"
#include "core/palette/palette_filter.h"
#include "core/palette/slot_assigner.h"
#include "core/palette/tone.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace imagen::theme
{
using colour::Rgb8;

enum class Variant : std::uint8_t
{
    Auto = 0, // decided by the dominant colour's brightness
    Dark,
    Light,
};

const char* VariantName(Variant v);
bool ParseVariant(std::string_view s, Variant& out);

// Inclusive range of average channel brightness, 0..255.
struct BrightnessWindow
{
    double lower = 0.0;
    double upper = 255.0;

    bool Contains(const Rgb8& c) const
    {
        const double avg = colour::AverageBrightness(c);
        return avg >= lower && avg <= upper;
    }
};

struct ThemeOptions
{
    std::string name;
    Variant     variant = Variant::Auto;
    int         intensity = 100; // 0..100

    // Use the image's dominant colour (candidates[0]) as the background verbatim.
    bool dominant_background = false;

    palette::FilterOptions filter;

    // Overrides the window derived from variant/intensity.
    std::optional<BrightnessWindow> window;
};

struct Theme
{
    std::string              name; // without the "base16-" prefix
    palette::Tone            tone = palette::Tone::Dark;
    BrightnessWindow         window;
    std::vector<Rgb8>        palette;
    palette::PaletteAssignment assignment;

    bool degraded = false;
    bool oversized = false;
};

// Strips a leading "base16-" and surrounding whitespace.
std::string NormalizeThemeName(std::string_view name);

// "base16-<name>"
std::string ThemeFileStem(const Theme& theme);

// Tone and brightness window for a given dominant colour.
//
// Auto: dark when the dominant colour's average brightness is below 127.5; the window then runs
// from the dominant brightness up to 255*intensity/100 (dark) or from 255*(1-intensity/100) up to
// the dominant brightness (light).
// Dark: [255*(1-intensity/100), 255]. Light: [0, 255*intensity/100].
void ResolveTone(const Rgb8& dominant,
                 Variant variant,
                 int intensity,
                 palette::Tone& out_tone,
                 BrightnessWindow& out_window);

// Keeps candidates inside the window, order preserved.
std::vector<Rgb8> ApplyBrightnessWindow(std::span<const Rgb8> candidates, const BrightnessWindow& window);

// candidates[0] is the image's dominant colour.
bool BuildTheme(std::span<const Rgb8> candidates, const ThemeOptions& options, Theme& out, Error& err);
} // namespace imagen::theme
