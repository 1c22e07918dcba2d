#include "core/theme_builder.h"

#include <cctype>
#include <cstdio>

namespace imagen::theme
{
const char* VariantName(Variant v)
{
    switch (v)
    {
        case Variant::Auto: return "auto";
        case Variant::Dark: return "dark";
        case Variant::Light: return "light";
    }
    return "auto";
}

bool ParseVariant(std::string_view s, Variant& out)
{
    if (s == "auto" || s.empty())
        out = Variant::Auto;
    else if (s == "dark")
        out = Variant::Dark;
    else if (s == "light")
        out = Variant::Light;
    else
        return false;
    return true;
}

std::string NormalizeThemeName(std::string_view name)
{
    while (!name.empty() && std::isspace((unsigned char)name.front()))
        name.remove_prefix(1);
    while (!name.empty() && std::isspace((unsigned char)name.back()))
        name.remove_suffix(1);

    static constexpr std::string_view kPrefix = "base16-";
    if (name.size() > kPrefix.size() && name.substr(0, kPrefix.size()) == kPrefix)
        name.remove_prefix(kPrefix.size());
    return std::string(name);
}

std::string ThemeFileStem(const Theme& theme)
{
    return "base16-" + theme.name;
}

void ResolveTone(const Rgb8& dominant,
                 Variant variant,
                 int intensity,
                 palette::Tone& out_tone,
                 BrightnessWindow& out_window)
{
    const double level = (double)intensity / 100.0;

    switch (variant)
    {
        case Variant::Auto:
        {
            const double background = colour::AverageBrightness(dominant);
            if (background < 255.0 / 2.0)
            {
                out_tone = palette::Tone::Dark;
                out_window = BrightnessWindow{background, 255.0 * level};
            }
            else
            {
                out_tone = palette::Tone::Light;
                out_window = BrightnessWindow{255.0 * (1.0 - level), background};
            }
            return;
        }
        case Variant::Dark:
            out_tone = palette::Tone::Dark;
            out_window = BrightnessWindow{255.0 * (1.0 - level), 255.0};
            return;
        case Variant::Light:
            out_tone = palette::Tone::Light;
            out_window = BrightnessWindow{0.0, 255.0 * level};
            return;
    }
}

std::vector<Rgb8> ApplyBrightnessWindow(std::span<const Rgb8> candidates, const BrightnessWindow& window)
{
    std::vector<Rgb8> out;
    out.reserve(candidates.size());
    for (const Rgb8& c : candidates)
        if (window.Contains(c))
            out.push_back(c);
    return out;
}

bool BuildTheme(std::span<const Rgb8> candidates, const ThemeOptions& options, Theme& out, Error& err)
{
    err.Clear();
    out = Theme{};
    out.name = NormalizeThemeName(options.name);

    if (out.name.empty())
        return err.Fail(ErrorCode::InvalidArgument, "theme name is empty");
    if (options.intensity < 0 || options.intensity > 100)
        return err.Fail(ErrorCode::InvalidArgument,
                        "intensity must be within 0..100 (got " + std::to_string(options.intensity) + ")");
    if (candidates.empty())
        return err.Fail(ErrorCode::InsufficientDistinctColours, "no candidate colours");

    ResolveTone(candidates[0], options.variant, options.intensity, out.tone, out.window);
    if (options.window)
        out.window = *options.window;

    const std::vector<Rgb8> windowed = ApplyBrightnessWindow(candidates, out.window);
    if (windowed.empty())
    {
        char buf[128];
        std::snprintf(buf, sizeof(buf), "no candidate colours within brightness window [%.1f, %.1f]",
                      out.window.lower, out.window.upper);
        return err.Fail(ErrorCode::InsufficientDistinctColours, buf);
    }

    // The dominant colour only anchors the palette if it survived the window.
    const bool dominant = options.dominant_background && windowed.front() == candidates[0];
    if (options.dominant_background && !dominant)
        std::fprintf(stderr, "[theme] dominant colour is outside the brightness window; scoring background instead\n");

    palette::FilterOptions filter = options.filter;
    filter.dominant_anchor = dominant;

    palette::FilterResult filtered;
    if (!palette::FilterPalette(windowed, out.tone, filter, filtered, err))
        return false;

    if (filtered.degraded)
        std::fprintf(stderr, "[palette] only found %d distinct colours; some slots will reuse colours\n",
                     (int)filtered.palette.size());
    if (filtered.oversized)
        std::fprintf(stderr, "[palette] could not narrow down to %d colours; using %d\n",
                     filter.target_count, (int)filtered.palette.size());

    if (!palette::ValidateSlotCatalog(out.tone, err))
        return false;

    palette::AssignOptions assign;
    assign.background = dominant ? palette::BackgroundMode::Dominant : palette::BackgroundMode::Scored;
    if (!palette::AssignSlots(filtered.palette, out.tone, assign, out.assignment, err))
        return false;

    out.palette = std::move(filtered.palette);
    out.degraded = filtered.degraded;
    out.oversized = filtered.oversized;
    return true;
}
} // namespace imagen::theme
