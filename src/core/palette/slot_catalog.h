#pragma once

#include "core/colour.h"
#include "core/error.h"
#include "core/palette/tone.h"

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace imagen::palette
{
using colour::Rgb8;

// Base16 slot identifiers color00..color21. Only 16 of them take part in assignment; see
// AssignmentOrder().
enum class Slot : std::uint8_t
{
    Color00 = 0, Color01, Color02, Color03, Color04, Color05, Color06, Color07,
    Color08, Color09, Color10, Color11, Color12, Color13, Color14, Color15,
    Color16, Color17, Color18, Color19, Color20, Color21,
};

static constexpr int kSlotCount = 22;

// "color00".."color21"
const char* SlotLabel(Slot slot);
bool ParseSlotLabel(std::string_view label, Slot& out);

// Closed set of scoring metrics. Higher scores are preferred during assignment.
enum class Metric : std::uint8_t
{
    Dark = 0, // -sum(c)
    Light,    // sum(c)
    Red,
    Green,
    Blue,
    Cyan,    // green + blue
    Magenta, // red + blue
    Yellow,  // red + green
};

const char* MetricName(Metric m);

struct HueSet
{
    enum : std::uint8_t
    {
        kRed = 1u << 0,
        kGreen = 1u << 1,
        kBlue = 1u << 2,
    };
    std::uint8_t bits = 0;

    bool Valid() const { return bits != 0 && bits != (kRed | kGreen | kBlue); }
};

// Hue names must be "red", "green" or "blue". Empty selections and selections naming all three
// channels are rejected as well (nothing would be left to compare against).
bool ParseHueSet(std::span<const std::string_view> names, HueSet& out, Error& err);

// min(desired - undesired) over every desired/undesired channel pair.
// Prominence({200, 50, 50}, red) == 150. Returns INT_MIN for an invalid set.
int Prominence(const Rgb8& c, HueSet hues);

// Name-based form, failing with ErrorCode::InvalidHueSelection on bad names.
bool Prominence(const Rgb8& c, std::span<const std::string_view> hue_names, int& out, Error& err);

int Score(Metric m, const Rgb8& c);

struct SlotRule
{
    Slot   slot;
    Metric metric;
};

// Fixed priority order per tone: background, foreground, red, green, blue, yellow, magenta,
// cyan, then eight extended slots scored by the background metric.
std::span<const SlotRule> AssignmentOrder(Tone tone);

enum class ReuseKind : std::uint8_t
{
    Copy = 0, // copy sources[0] verbatim
    Select,   // pick one of sources by metric
};

enum class Pick : std::uint8_t
{
    Lowest = 0,
    Highest,
};

struct ReuseRule
{
    ReuseKind         kind = ReuseKind::Copy;
    std::vector<Slot> sources;
    Metric            metric = Metric::Dark; // Select only
    Pick              pick = Pick::Lowest;   // Select only
};

// Fallback used once the working palette is exhausted. nullptr for slots outside the
// assignment catalog.
const ReuseRule* ReuseRuleFor(Slot slot);

// Startup check: every ordered slot is unique, has a reuse rule, and each rule only refers to
// slots assigned earlier in the same order.
bool ValidateSlotCatalog(Tone tone, Error& err);
} // namespace imagen::palette
