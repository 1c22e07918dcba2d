#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace imagen::colour
{
struct Rgb8
{
    std::uint8_t r = 0, g = 0, b = 0;

    bool operator==(const Rgb8& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Rgb8& o) const { return !(*this == o); }
};

// Channel sum in [0, 765]. Used as the "brightness" of a colour throughout.
inline int Brightness(const Rgb8& c)
{
    return (int)c.r + (int)c.g + (int)c.b;
}

// Average channel value in [0, 255].
inline double AverageBrightness(const Rgb8& c)
{
    return (double)Brightness(c) / 3.0;
}

double EuclideanDistance(const Rgb8& a, const Rgb8& b);

// 1 - distance(a, b) / distance(black, white). 1 means identical, 0 means black vs white.
double Similarity(const Rgb8& a, const Rgb8& b);

// 1 - |sum(a) - sum(b)| / 3 / 255. 1 means equal brightness.
double BrightnessSimilarity(const Rgb8& a, const Rgb8& b);

// Lower-case hex, one two-digit group per channel joined by `separator`.
// ToHex({29, 31, 33}, "/") -> "1d/1f/21"
std::string ToHex(const Rgb8& c, std::string_view separator = {});

// Accepts "#RRGGBB" or "RRGGBB" (either case).
bool ParseHexRgb(std::string_view s, Rgb8& out);

// "(r, g, b)"
std::string ToTupleString(const Rgb8& c);
} // namespace imagen::colour
