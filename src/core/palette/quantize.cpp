#include "core/palette/quantize.h"

#include <algorithm>
#include <array>
#include <string>

namespace imagen::palette
{
namespace
{
static constexpr int kSigBits = 5;
static constexpr int kSide = 1 << kSigBits;          // 32 bins per channel
static constexpr int kBins = kSide * kSide * kSide;  // 32768
static constexpr int kShift = 8 - kSigBits;
static constexpr double kPopulationFraction = 0.75;

static int BinIndex(int r, int g, int b)
{
    return (r << (2 * kSigBits)) + (g << kSigBits) + b;
}

struct Histogram
{
    std::vector<std::uint32_t> count;
    std::vector<std::uint64_t> sum_r, sum_g, sum_b;
    std::uint64_t              total = 0;

    Histogram() : count(kBins, 0), sum_r(kBins, 0), sum_g(kBins, 0), sum_b(kBins, 0) {}
};

struct Box
{
    int lo[3] = {0, 0, 0};
    int hi[3] = {kSide - 1, kSide - 1, kSide - 1};
    std::uint64_t count = 0;

    std::uint64_t Volume() const
    {
        return (std::uint64_t)(hi[0] - lo[0] + 1) * (std::uint64_t)(hi[1] - lo[1] + 1) *
               (std::uint64_t)(hi[2] - lo[2] + 1);
    }
};

template <typename Fn>
static void ForEachBin(const Box& box, Fn&& fn)
{
    for (int r = box.lo[0]; r <= box.hi[0]; ++r)
        for (int g = box.lo[1]; g <= box.hi[1]; ++g)
            for (int b = box.lo[2]; b <= box.hi[2]; ++b)
                fn(r, g, b, BinIndex(r, g, b));
}

// Shrinks the box to the populated bins it contains and recomputes its population.
static void ShrinkToFit(const Histogram& h, Box& box)
{
    int lo[3] = {kSide, kSide, kSide};
    int hi[3] = {-1, -1, -1};
    std::uint64_t n = 0;

    ForEachBin(box, [&](int r, int g, int b, int idx) {
        const std::uint32_t c = h.count[(size_t)idx];
        if (c == 0)
            return;
        n += c;
        const int v[3] = {r, g, b};
        for (int k = 0; k < 3; ++k)
        {
            lo[k] = std::min(lo[k], v[k]);
            hi[k] = std::max(hi[k], v[k]);
        }
    });

    box.count = n;
    if (n == 0)
        return;
    for (int k = 0; k < 3; ++k)
    {
        box.lo[k] = lo[k];
        box.hi[k] = hi[k];
    }
}

// Splits at the population median of the longest axis. Both halves are non-empty because the
// box was shrunk to fit.
static void SplitBox(const Histogram& h, const Box& box, Box& a, Box& b)
{
    int axis = 0;
    int best_extent = -1;
    for (int k = 0; k < 3; ++k)
    {
        const int extent = box.hi[k] - box.lo[k];
        if (extent > best_extent)
        {
            best_extent = extent;
            axis = k;
        }
    }

    std::vector<std::uint64_t> slice((size_t)kSide, 0);
    ForEachBin(box, [&](int r, int g, int bb, int idx) {
        const int v[3] = {r, g, bb};
        slice[(size_t)v[axis]] += h.count[(size_t)idx];
    });

    const std::uint64_t half = box.count / 2;
    std::uint64_t acc = 0;
    int cut = box.lo[axis];
    for (int i = box.lo[axis]; i <= box.hi[axis]; ++i)
    {
        acc += slice[(size_t)i];
        cut = i;
        if (acc >= half)
            break;
    }
    if (cut >= box.hi[axis])
        cut = box.hi[axis] - 1;

    a = box;
    b = box;
    a.hi[axis] = cut;
    b.lo[axis] = cut + 1;
    ShrinkToFit(h, a);
    ShrinkToFit(h, b);
}

// Splits boxes until `target` boxes exist or nothing can be split. `priority` ranks candidates;
// the earliest box wins ties.
template <typename Priority>
static void SplitUntil(const Histogram& h, std::vector<Box>& boxes, std::size_t target, Priority&& priority)
{
    while (boxes.size() < target)
    {
        std::size_t pick = boxes.size();
        std::uint64_t best = 0;
        for (std::size_t i = 0; i < boxes.size(); ++i)
        {
            if (boxes[i].Volume() <= 1)
                continue;
            const std::uint64_t p = priority(boxes[i]);
            if (pick == boxes.size() || p > best)
            {
                pick = i;
                best = p;
            }
        }
        if (pick == boxes.size())
            return;

        Box a, b;
        SplitBox(h, boxes[pick], a, b);
        boxes[pick] = a;
        boxes.push_back(b);
    }
}

static bool BuildHistogram(const ImageRgba& image, int quality, Histogram& h, Error& err)
{
    if (image.width <= 0 || image.height <= 0)
        return err.Fail(ErrorCode::ImageLoadFailed, "invalid image dimensions");

    const std::size_t n = (std::size_t)image.width * (std::size_t)image.height;
    if (image.pixels.size() < n * 4u)
        return err.Fail(ErrorCode::ImageLoadFailed, "invalid RGBA buffer size");

    const std::size_t step = (std::size_t)std::max(1, quality);
    for (std::size_t i = 0; i < n; i += step)
    {
        const std::uint8_t* p = &image.pixels[i * 4u];
        const int r = p[0], g = p[1], b = p[2], a = p[3];
        if (a < 125)
            continue;
        if (r > 250 && g > 250 && b > 250)
            continue;

        const auto idx = (size_t)BinIndex(r >> kShift, g >> kShift, b >> kShift);
        h.count[idx] += 1;
        h.sum_r[idx] += (std::uint64_t)r;
        h.sum_g[idx] += (std::uint64_t)g;
        h.sum_b[idx] += (std::uint64_t)b;
        h.total += 1;
    }

    if (h.total == 0)
        return err.Fail(ErrorCode::ImageLoadFailed, "image has no opaque pixels to sample");
    return true;
}

static Rgb8 MeanColour(const Histogram& h, const Box& box)
{
    std::uint64_t r = 0, g = 0, b = 0;
    ForEachBin(box, [&](int, int, int, int idx) {
        r += h.sum_r[(size_t)idx];
        g += h.sum_g[(size_t)idx];
        b += h.sum_b[(size_t)idx];
    });
    const std::uint64_t n = std::max<std::uint64_t>(box.count, 1);
    return Rgb8{(std::uint8_t)(r / n), (std::uint8_t)(g / n), (std::uint8_t)(b / n)};
}

static void Quantize(const Histogram& h, int colour_count, std::vector<Rgb8>& out)
{
    out.clear();

    std::vector<Box> boxes(1);
    ShrinkToFit(h, boxes[0]);

    const std::size_t target = (std::size_t)std::max(1, colour_count);
    const std::size_t by_population = std::max<std::size_t>(1, (std::size_t)(kPopulationFraction * (double)target));

    SplitUntil(h, boxes, by_population, [](const Box& b) { return b.count; });
    SplitUntil(h, boxes, target, [](const Box& b) { return b.count * b.Volume(); });

    std::stable_sort(boxes.begin(), boxes.end(), [](const Box& a, const Box& b) { return a.count > b.count; });

    out.reserve(boxes.size());
    for (const Box& b : boxes)
    {
        if (b.count == 0)
            continue;
        out.push_back(MeanColour(h, b));
    }
}
} // namespace

bool QuantizeColours(const ImageRgba& image,
                     const QuantizeOptions& options,
                     std::vector<Rgb8>& out,
                     Error& err)
{
    err.Clear();
    out.clear();

    if (options.colour_count < 1)
        return err.Fail(ErrorCode::InvalidArgument, "colour_count must be positive");

    Histogram h;
    if (!BuildHistogram(image, options.quality, h, err))
        return false;

    Quantize(h, options.colour_count, out);
    return true;
}

bool ExtractCandidates(const ImageRgba& image,
                       const QuantizeOptions& options,
                       std::vector<Rgb8>& out,
                       Error& err)
{
    err.Clear();
    out.clear();

    if (options.colour_count < 1)
        return err.Fail(ErrorCode::InvalidArgument, "colour_count must be positive");

    Histogram h;
    if (!BuildHistogram(image, options.quality, h, err))
        return false;

    std::vector<Rgb8> dominant;
    Quantize(h, 5, dominant);

    std::vector<Rgb8> palette;
    Quantize(h, options.colour_count, palette);

    out.reserve(palette.size() + 1);
    if (!dominant.empty())
        out.push_back(dominant.front());
    out.insert(out.end(), palette.begin(), palette.end());
    return true;
}
} // namespace imagen::palette
