#include "core/palette/slot_catalog.h"

#include <algorithm>
#include <array>
#include <climits>
#include <cstdio>
#include <optional>
#include <string>

namespace imagen::palette
{
namespace
{
static const char* const kSlotLabels[kSlotCount] = {
    "color00", "color01", "color02", "color03", "color04", "color05", "color06", "color07",
    "color08", "color09", "color10", "color11", "color12", "color13", "color14", "color15",
    "color16", "color17", "color18", "color19", "color20", "color21",
};

static constexpr std::array<SlotRule, 16> kDarkOrder = {{
    {Slot::Color00, Metric::Dark},  // background
    {Slot::Color07, Metric::Light}, // foreground
    {Slot::Color01, Metric::Red},
    {Slot::Color02, Metric::Green},
    {Slot::Color04, Metric::Blue},
    {Slot::Color03, Metric::Yellow},
    {Slot::Color05, Metric::Magenta},
    {Slot::Color06, Metric::Cyan},
    {Slot::Color18, Metric::Dark},
    {Slot::Color19, Metric::Dark},
    {Slot::Color20, Metric::Dark},
    {Slot::Color21, Metric::Dark},
    {Slot::Color15, Metric::Dark},
    {Slot::Color16, Metric::Dark},
    {Slot::Color17, Metric::Dark},
    {Slot::Color08, Metric::Dark},
}};

static constexpr std::array<SlotRule, 16> kLightOrder = {{
    {Slot::Color00, Metric::Light}, // background
    {Slot::Color07, Metric::Dark},  // foreground
    {Slot::Color01, Metric::Red},
    {Slot::Color02, Metric::Green},
    {Slot::Color04, Metric::Blue},
    {Slot::Color03, Metric::Yellow},
    {Slot::Color05, Metric::Magenta},
    {Slot::Color06, Metric::Cyan},
    {Slot::Color18, Metric::Light},
    {Slot::Color19, Metric::Light},
    {Slot::Color20, Metric::Light},
    {Slot::Color21, Metric::Light},
    {Slot::Color15, Metric::Light},
    {Slot::Color16, Metric::Light},
    {Slot::Color17, Metric::Light},
    {Slot::Color08, Metric::Light},
}};

static ReuseRule Copy(Slot from)
{
    ReuseRule r;
    r.kind = ReuseKind::Copy;
    r.sources = {from};
    return r;
}

static ReuseRule Select(std::vector<Slot> from, Metric metric, Pick pick)
{
    ReuseRule r;
    r.kind = ReuseKind::Select;
    r.sources = std::move(from);
    r.metric = metric;
    r.pick = pick;
    return r;
}

using ReuseTable = std::array<std::optional<ReuseRule>, kSlotCount>;

static ReuseTable BuildReuseTable()
{
    ReuseTable t;
    auto set = [&](Slot s, ReuseRule r) { t[(size_t)s] = std::move(r); };

    // Primary slots only run dry when the palette is smaller than eight colours.
    set(Slot::Color07, Copy(Slot::Color00));
    set(Slot::Color01, Select({Slot::Color00, Slot::Color07}, Metric::Red, Pick::Highest));
    set(Slot::Color02, Select({Slot::Color00, Slot::Color07, Slot::Color01}, Metric::Green, Pick::Highest));
    set(Slot::Color04,
        Select({Slot::Color00, Slot::Color07, Slot::Color01, Slot::Color02}, Metric::Blue, Pick::Highest));
    set(Slot::Color03,
        Select({Slot::Color00, Slot::Color07, Slot::Color01, Slot::Color02, Slot::Color04},
               Metric::Yellow,
               Pick::Highest));
    set(Slot::Color05,
        Select({Slot::Color00, Slot::Color07, Slot::Color01, Slot::Color02, Slot::Color04, Slot::Color03},
               Metric::Magenta,
               Pick::Highest));
    set(Slot::Color06,
        Select({Slot::Color00,
                Slot::Color07,
                Slot::Color01,
                Slot::Color02,
                Slot::Color04,
                Slot::Color03,
                Slot::Color05},
               Metric::Cyan,
               Pick::Highest));

    const std::vector<Slot> accents = {
        Slot::Color01, Slot::Color02, Slot::Color03, Slot::Color04, Slot::Color05, Slot::Color06,
    };
    set(Slot::Color08, Select(accents, Metric::Dark, Pick::Lowest));
    set(Slot::Color18, Select(accents, Metric::Light, Pick::Lowest));
    set(Slot::Color19, Copy(Slot::Color04));
    set(Slot::Color20, Copy(Slot::Color07));
    set(Slot::Color21, Copy(Slot::Color00));
    set(Slot::Color15, Copy(Slot::Color01));
    set(Slot::Color16, Copy(Slot::Color06));
    set(Slot::Color17, Copy(Slot::Color02));
    return t;
}

static const ReuseTable& Reuse()
{
    static const ReuseTable table = BuildReuseTable();
    return table;
}
} // namespace

const char* SlotLabel(Slot slot)
{
    const auto i = (size_t)slot;
    if (i >= (size_t)kSlotCount)
        return "color??";
    return kSlotLabels[i];
}

bool ParseSlotLabel(std::string_view label, Slot& out)
{
    for (int i = 0; i < kSlotCount; ++i)
    {
        if (label == kSlotLabels[i])
        {
            out = (Slot)i;
            return true;
        }
    }
    return false;
}

const char* MetricName(Metric m)
{
    switch (m)
    {
        case Metric::Dark: return "dark";
        case Metric::Light: return "light";
        case Metric::Red: return "red";
        case Metric::Green: return "green";
        case Metric::Blue: return "blue";
        case Metric::Cyan: return "cyan";
        case Metric::Magenta: return "magenta";
        case Metric::Yellow: return "yellow";
    }
    return "unknown";
}

bool ParseHueSet(std::span<const std::string_view> names, HueSet& out, Error& err)
{
    err.Clear();
    HueSet hs;
    for (std::string_view n : names)
    {
        if (n == "red")
            hs.bits |= HueSet::kRed;
        else if (n == "green")
            hs.bits |= HueSet::kGreen;
        else if (n == "blue")
            hs.bits |= HueSet::kBlue;
        else
            return err.Fail(ErrorCode::InvalidHueSelection, "bad highlight selection: \"" + std::string(n) + "\"");
    }
    if (!hs.Valid())
        return err.Fail(ErrorCode::InvalidHueSelection, "highlight selection must name one or two of red/green/blue");

    out = hs;
    return true;
}

int Prominence(const Rgb8& c, HueSet hues)
{
    if (!hues.Valid())
        return INT_MIN;

    const int channel[3] = {(int)c.r, (int)c.g, (int)c.b};
    const std::uint8_t bit[3] = {HueSet::kRed, HueSet::kGreen, HueSet::kBlue};

    int best = INT_MAX;
    for (int d = 0; d < 3; ++d)
    {
        if ((hues.bits & bit[d]) == 0)
            continue;
        for (int u = 0; u < 3; ++u)
        {
            if ((hues.bits & bit[u]) != 0)
                continue;
            best = std::min(best, channel[d] - channel[u]);
        }
    }
    return best;
}

bool Prominence(const Rgb8& c, std::span<const std::string_view> hue_names, int& out, Error& err)
{
    HueSet hs;
    if (!ParseHueSet(hue_names, hs, err))
        return false;
    out = Prominence(c, hs);
    return true;
}

int Score(Metric m, const Rgb8& c)
{
    switch (m)
    {
        case Metric::Dark: return -colour::Brightness(c);
        case Metric::Light: return colour::Brightness(c);
        case Metric::Red: return Prominence(c, HueSet{HueSet::kRed});
        case Metric::Green: return Prominence(c, HueSet{HueSet::kGreen});
        case Metric::Blue: return Prominence(c, HueSet{HueSet::kBlue});
        case Metric::Cyan: return Prominence(c, HueSet{HueSet::kGreen | HueSet::kBlue});
        case Metric::Magenta: return Prominence(c, HueSet{HueSet::kRed | HueSet::kBlue});
        case Metric::Yellow: return Prominence(c, HueSet{HueSet::kRed | HueSet::kGreen});
    }
    return 0;
}

std::span<const SlotRule> AssignmentOrder(Tone tone)
{
    if (tone == Tone::Dark)
        return kDarkOrder;
    return kLightOrder;
}

const ReuseRule* ReuseRuleFor(Slot slot)
{
    const auto i = (size_t)slot;
    if (i >= (size_t)kSlotCount)
        return nullptr;
    const auto& r = Reuse()[i];
    return r ? &*r : nullptr;
}

bool ValidateSlotCatalog(Tone tone, Error& err)
{
    err.Clear();
    const auto order = AssignmentOrder(tone);

    std::array<int, kSlotCount> position;
    position.fill(-1);

    for (std::size_t i = 0; i < order.size(); ++i)
    {
        const auto s = (size_t)order[i].slot;
        if (position[s] >= 0)
            return err.Fail(ErrorCode::IncompleteAssignment,
                            std::string("slot listed twice: ") + SlotLabel(order[i].slot));
        position[s] = (int)i;
    }

    // The first slot always consumes a colour; every later one needs a fallback.
    for (std::size_t i = 1; i < order.size(); ++i)
    {
        const Slot slot = order[i].slot;
        const ReuseRule* rule = ReuseRuleFor(slot);
        if (!rule || rule->sources.empty())
            return err.Fail(ErrorCode::IncompleteAssignment, std::string("no reuse rule for ") + SlotLabel(slot));
        if (rule->kind == ReuseKind::Copy && rule->sources.size() != 1)
            return err.Fail(ErrorCode::IncompleteAssignment,
                            std::string("copy rule must name exactly one slot: ") + SlotLabel(slot));

        for (Slot src : rule->sources)
        {
            const int p = position[(size_t)src];
            if (p < 0 || p >= (int)i)
            {
                char buf[128];
                std::snprintf(buf, sizeof(buf), "%s reuses %s which is not assigned before it",
                              SlotLabel(slot), SlotLabel(src));
                return err.Fail(ErrorCode::IncompleteAssignment, buf);
            }
        }
    }
    return true;
}
} // namespace imagen::palette
