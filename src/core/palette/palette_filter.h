#pragma once

#include "core/colour.h"
#include "core/error.h"
#include "core/palette/tone.h"

#include <cstdint>
#include <span>
#include <vector>

namespace imagen::palette
{
using colour::Rgb8;

// How strictly candidates close to the anchor's brightness are rejected, derived from the
// similarity threshold t:
// - Quartic: t^4
// - Linear:  max(1 - 2(1 - t), t)
enum class BackgroundRule : std::uint8_t
{
    Quartic = 0,
    Linear = 1,
};

struct FilterOptions
{
    int target_count = 16;
    int max_iterations = 50;

    // Below this many distinct colours no usable palette exists.
    int min_colours = 8;

    BackgroundRule background_rule = BackgroundRule::Quartic;

    // Keep candidates[0] (the image's dominant colour) as the anchor instead of sorting it
    // into place with the others.
    bool dominant_anchor = false;
};

struct FilterResult
{
    std::vector<Rgb8> palette; // palette[0] is the anchor/background

    bool   converged = false; // hit target_count exactly
    bool   degraded = false;  // fewer than target_count colours
    bool   oversized = false; // more than target_count colours
    int    iterations = 0;
    double threshold = 0.0; // similarity threshold that produced `palette`
};

double BackgroundThreshold(double similarity_threshold, BackgroundRule rule);

// Stable sort by channel sum: ascending for dark, descending for light.
// With keep_first, colours[0] stays in front and only the tail is sorted.
std::vector<Rgb8> SortForTone(std::span<const Rgb8> colours, Tone tone, bool keep_first);

// Single similarity pass. colours[0] is the anchor and is always kept; every later colour is
// dropped when it is more similar than `similarity_threshold` to anything already kept, or when
// its brightness is too close to the anchor's.
std::vector<Rgb8> FilterBySimilarity(std::span<const Rgb8> colours,
                                     double similarity_threshold,
                                     BackgroundRule rule = BackgroundRule::Quartic);

// Reduces `candidates` to options.target_count mutually distinct colours by binary searching
// the similarity threshold.
//
// Returns false with ErrorCode::InsufficientDistinctColours when fewer than options.min_colours
// survive any observed threshold. Empty input succeeds with an empty palette.
bool FilterPalette(std::span<const Rgb8> candidates,
                   Tone tone,
                   const FilterOptions& options,
                   FilterResult& out,
                   Error& err);
} // namespace imagen::palette
