#include "core/colour.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace imagen::colour
{
namespace
{
// distance((0,0,0), (255,255,255))
const double kMaxDistance = std::sqrt(3.0 * 255.0 * 255.0);
} // namespace

double EuclideanDistance(const Rgb8& a, const Rgb8& b)
{
    const double dr = (double)a.r - (double)b.r;
    const double dg = (double)a.g - (double)b.g;
    const double db = (double)a.b - (double)b.b;
    return std::sqrt(dr * dr + dg * dg + db * db);
}

double Similarity(const Rgb8& a, const Rgb8& b)
{
    return 1.0 - EuclideanDistance(a, b) / kMaxDistance;
}

double BrightnessSimilarity(const Rgb8& a, const Rgb8& b)
{
    return 1.0 - (double)std::abs(Brightness(a) - Brightness(b)) / 3.0 / 255.0;
}

std::string ToHex(const Rgb8& c, std::string_view separator)
{
    auto hex2 = [](std::uint8_t v) -> std::string {
        static const char* k = "0123456789abcdef";
        std::string s;
        s.resize(2);
        s[0] = k[(v >> 4) & 0xFu];
        s[1] = k[v & 0xFu];
        return s;
    };

    std::string out;
    out.reserve(6 + separator.size() * 2);
    out += hex2(c.r);
    out += separator;
    out += hex2(c.g);
    out += separator;
    out += hex2(c.b);
    return out;
}

bool ParseHexRgb(std::string_view s, Rgb8& out)
{
    if (!s.empty() && s[0] == '#')
        s.remove_prefix(1);
    if (s.size() != 6)
        return false;

    auto nyb = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
        if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
        return -1;
    };
    auto byte_at = [&](size_t i) -> int {
        const int hi = nyb(s[i + 0]);
        const int lo = nyb(s[i + 1]);
        if (hi < 0 || lo < 0)
            return -1;
        return (hi << 4) | lo;
    };

    const int r = byte_at(0);
    const int g = byte_at(2);
    const int b = byte_at(4);
    if (r < 0 || g < 0 || b < 0)
        return false;
    out.r = (std::uint8_t)r;
    out.g = (std::uint8_t)g;
    out.b = (std::uint8_t)b;
    return true;
}

std::string ToTupleString(const Rgb8& c)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "(%d, %d, %d)", (int)c.r, (int)c.g, (int)c.b);
    return std::string(buf);
}
} // namespace imagen::colour
