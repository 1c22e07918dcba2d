#include "core/xterm256_palette.h"

#include <algorithm>
#include <array>

namespace imagen::xterm256
{
namespace
{
using colour::Rgb8;

constexpr std::uint8_t kLevel[6] = {0, 95, 135, 175, 215, 255};

constexpr std::array<Rgb8, 256> BuildPalette()
{
    std::array<Rgb8, 256> p{};

    auto set = [&](int idx, int r, int g, int b) {
        p[(size_t)idx] = Rgb8{(std::uint8_t)r, (std::uint8_t)g, (std::uint8_t)b};
    };

    // xterm defaults
    set(0, 0, 0, 0);
    set(1, 205, 0, 0);
    set(2, 0, 205, 0);
    set(3, 205, 205, 0);
    set(4, 0, 0, 238);
    set(5, 205, 0, 205);
    set(6, 0, 205, 205);
    set(7, 229, 229, 229);
    set(8, 127, 127, 127);
    set(9, 255, 0, 0);
    set(10, 0, 255, 0);
    set(11, 255, 255, 0);
    set(12, 92, 92, 255);
    set(13, 255, 0, 255);
    set(14, 0, 255, 255);
    set(15, 255, 255, 255);

    for (int i = 16; i <= 231; ++i)
    {
        const int cube = i - 16;
        set(i, kLevel[cube / 36], kLevel[(cube % 36) / 6], kLevel[cube % 6]);
    }

    for (int i = 232; i <= 255; ++i)
    {
        const int shade = 8 + (i - 232) * 10;
        set(i, shade, shade, shade);
    }

    return p;
}

constexpr std::array<Rgb8, 256> kPalette = BuildPalette();

static int Dist2(const Rgb8& a, const Rgb8& b)
{
    const int dr = (int)a.r - (int)b.r;
    const int dg = (int)a.g - (int)b.g;
    const int db = (int)a.b - (int)b.b;
    return dr * dr + dg * dg + db * db;
}

// Nearest index in kLevel.
static int NearestLevel(std::uint8_t v)
{
    if (v < 48) return 0;
    if (v < 115) return 1;
    if (v < 155) return 2;
    if (v < 195) return 3;
    if (v < 235) return 4;
    return 5;
}

static int NearestGray(const Rgb8& c)
{
    const int avg = (colour::Brightness(c) + 1) / 3;
    if (avg <= 8)
        return 232;
    if (avg >= 238)
        return 255;
    return 232 + std::clamp((avg - 8 + 5) / 10, 0, 23);
}
} // namespace

const Rgb8& RgbForIndex(int idx)
{
    return kPalette[(size_t)ClampIndex(idx)];
}

int NearestIndex(const Rgb8& c)
{
    int best_idx = 16 + 36 * NearestLevel(c.r) + 6 * NearestLevel(c.g) + NearestLevel(c.b);
    int best_d2 = Dist2(c, kPalette[(size_t)best_idx]);

    const int gray_idx = NearestGray(c);
    const int gray_d2 = Dist2(c, kPalette[(size_t)gray_idx]);
    if (gray_d2 < best_d2)
    {
        best_d2 = gray_d2;
        best_idx = gray_idx;
    }

    for (int i = 0; i < 16; ++i)
    {
        const int d2 = Dist2(c, kPalette[(size_t)i]);
        if (d2 < best_d2)
        {
            best_d2 = d2;
            best_idx = i;
        }
    }
    return best_idx;
}
} // namespace imagen::xterm256
