#include "io/terminal_swatch.h"

#include "core/xterm256_palette.h"

#include <algorithm>
#include <cstdlib>
#include <vector>

namespace terminal_swatch
{
using imagen::colour::Rgb8;

namespace
{
static constexpr const char* kBlock = "\xE2\x96\x88\xE2\x96\x88\xE2\x96\x88\xE2\x96\x88\xE2\x96\x88"; // █████
static constexpr const char* kReset = "\x1B[0m";
} // namespace

Mode DetectMode()
{
    const char* v = std::getenv("COLORTERM");
    if (!v)
        return Mode::Xterm256;
    const std::string_view s(v);
    return (s == "truecolor" || s == "24bit") ? Mode::TrueColour : Mode::Xterm256;
}

bool ParseMode(std::string_view s, Mode& out)
{
    if (s == "auto" || s.empty())
        out = DetectMode();
    else if (s == "truecolour" || s == "truecolor")
        out = Mode::TrueColour;
    else if (s == "xterm256")
        out = Mode::Xterm256;
    else
        return false;
    return true;
}

std::string Swatch(const Rgb8& c, std::string_view text, Mode mode)
{
    char esc[32];
    if (mode == Mode::TrueColour)
        std::snprintf(esc, sizeof(esc), "\x1B[38;2;%d;%d;%dm", (int)c.r, (int)c.g, (int)c.b);
    else
        std::snprintf(esc, sizeof(esc), "\x1B[38;5;%dm", imagen::xterm256::NearestIndex(c));

    std::string line(esc);
    line += kBlock;
    line += ' ';
    line.append(text);
    line += kReset;
    return line;
}

std::string FormatAssignment(const imagen::palette::PaletteAssignment& assignment, Mode mode)
{
    std::string out;
    for (const auto& e : assignment.entries)
    {
        std::string text = imagen::colour::ToTupleString(e.colour) + " -> " + imagen::palette::SlotLabel(e.slot);
        if (e.reused)
            text += " (reused)";
        out += Swatch(e.colour, text, mode);
        out += '\n';
    }
    return out;
}

std::string FormatPalette(std::span<const Rgb8> palette, Mode mode)
{
    std::vector<Rgb8> sorted(palette.begin(), palette.end());
    std::stable_sort(sorted.begin(), sorted.end(), [](const Rgb8& a, const Rgb8& b) {
        return imagen::colour::Brightness(a) < imagen::colour::Brightness(b);
    });

    std::string out;
    for (const Rgb8& c : sorted)
    {
        out += Swatch(c, imagen::colour::ToTupleString(c), mode);
        out += '\n';
    }
    return out;
}

void Print(std::FILE* out, const std::string& text)
{
    std::fwrite(text.data(), 1, text.size(), out);
    std::fflush(out);
}
} // namespace terminal_swatch
