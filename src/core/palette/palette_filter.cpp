#include "core/palette/palette_filter.h"

#include <algorithm>
#include <optional>
#include <string>

namespace imagen::palette
{
double BackgroundThreshold(double similarity_threshold, BackgroundRule rule)
{
    const double t = similarity_threshold;
    switch (rule)
    {
        case BackgroundRule::Quartic: return t * t * t * t;
        case BackgroundRule::Linear: return std::max(1.0 - (1.0 - t) * 2.0, t);
    }
    return t;
}

std::vector<Rgb8> SortForTone(std::span<const Rgb8> colours, Tone tone, bool keep_first)
{
    std::vector<Rgb8> out(colours.begin(), colours.end());
    if (out.size() < 2)
        return out;

    auto first = out.begin();
    if (keep_first)
        ++first;

    if (tone == Tone::Dark)
    {
        std::stable_sort(first, out.end(), [](const Rgb8& a, const Rgb8& b) {
            return colour::Brightness(a) < colour::Brightness(b);
        });
    }
    else
    {
        std::stable_sort(first, out.end(), [](const Rgb8& a, const Rgb8& b) {
            return colour::Brightness(a) > colour::Brightness(b);
        });
    }
    return out;
}

std::vector<Rgb8> FilterBySimilarity(std::span<const Rgb8> colours,
                                     double similarity_threshold,
                                     BackgroundRule rule)
{
    std::vector<Rgb8> chosen;
    if (colours.empty())
        return chosen;

    const Rgb8 background = colours[0];
    chosen.push_back(background);

    const double background_threshold = BackgroundThreshold(similarity_threshold, rule);

    for (std::size_t i = 1; i < colours.size(); ++i)
    {
        const Rgb8 c = colours[i];

        const bool too_similar = std::any_of(chosen.begin(), chosen.end(), [&](const Rgb8& kept) {
            return colour::Similarity(c, kept) > similarity_threshold;
        });
        if (too_similar)
            continue;

        if (colour::BrightnessSimilarity(c, background) > background_threshold)
            continue;

        chosen.push_back(c);
    }
    return chosen;
}

bool FilterPalette(std::span<const Rgb8> candidates,
                   Tone tone,
                   const FilterOptions& options,
                   FilterResult& out,
                   Error& err)
{
    err.Clear();
    out = FilterResult{};

    if (options.target_count < 1 || options.max_iterations < 1 || options.min_colours < 1 ||
        options.min_colours > options.target_count)
    {
        return err.Fail(ErrorCode::InvalidArgument,
                        "filter options out of range (target " + std::to_string(options.target_count) +
                            ", min " + std::to_string(options.min_colours) + ", iterations " +
                            std::to_string(options.max_iterations) + ")");
    }

    if (candidates.empty())
        return true;

    const std::vector<Rgb8> colours = SortForTone(candidates, tone, options.dominant_anchor);
    const std::size_t target = (std::size_t)options.target_count;

    struct Observed
    {
        std::vector<Rgb8> palette;
        double threshold = 0.0;
    };
    // Largest set at or below the target, and smallest set above it. Later observations win ties.
    std::optional<Observed> best_under;
    std::optional<Observed> best_over;

    double left = 0.0;
    double right = 1.0;

    for (int i = 0; i < options.max_iterations; ++i)
    {
        const double middle = (left + right) / 2.0;
        std::vector<Rgb8> found = FilterBySimilarity(colours, middle, options.background_rule);
        const std::size_t n = found.size();
        out.iterations = i + 1;

        if (n == target)
        {
            out.palette = std::move(found);
            out.threshold = middle;
            out.converged = true;
            return true;
        }

        if (n < target)
        {
            if (!best_under || n >= best_under->palette.size())
                best_under = Observed{std::move(found), middle};
            left = middle;
        }
        else
        {
            if (!best_over || n <= best_over->palette.size())
                best_over = Observed{std::move(found), middle};
            right = middle;
        }
    }

    const std::size_t floor = (std::size_t)options.min_colours;

    if (best_under && best_under->palette.size() >= floor)
    {
        out.palette = std::move(best_under->palette);
        out.threshold = best_under->threshold;
        out.degraded = true;
        return true;
    }

    if (best_over)
    {
        out.palette = std::move(best_over->palette);
        out.threshold = best_over->threshold;
        out.oversized = true;
        return true;
    }

    const std::size_t n = best_under ? best_under->palette.size() : 0;
    return err.Fail(ErrorCode::InsufficientDistinctColours,
                    "can only find " + std::to_string(n) + " (< " + std::to_string(floor) +
                        ") distinct colours");
}
} // namespace imagen::palette
