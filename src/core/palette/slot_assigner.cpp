#include "core/palette/slot_assigner.h"

#include <algorithm>
#include <array>
#include <optional>
#include <string>

namespace imagen::palette
{
const Rgb8* PaletteAssignment::Find(Slot slot) const
{
    for (const auto& e : entries)
        if (e.slot == slot)
            return &e.colour;
    return nullptr;
}

namespace
{
using Assigned = std::array<std::optional<Rgb8>, kSlotCount>;

static bool ResolveReuse(Slot slot, const Assigned& assigned, Rgb8& out, Error& err)
{
    const ReuseRule* rule = ReuseRuleFor(slot);
    if (!rule || rule->sources.empty())
        return err.Fail(ErrorCode::IncompleteAssignment, std::string("no colour left for ") + SlotLabel(slot));

    if (rule->kind == ReuseKind::Copy)
    {
        const auto& src = assigned[(size_t)rule->sources[0]];
        if (!src)
            return err.Fail(ErrorCode::IncompleteAssignment,
                            std::string(SlotLabel(slot)) + " reuses unassigned " + SlotLabel(rule->sources[0]));
        out = *src;
        return true;
    }

    // Select: scan sources in listed order; the first of equally scored colours wins.
    std::optional<Rgb8> best;
    int best_score = 0;
    for (Slot s : rule->sources)
    {
        const auto& src = assigned[(size_t)s];
        if (!src)
            return err.Fail(ErrorCode::IncompleteAssignment,
                            std::string(SlotLabel(slot)) + " reuses unassigned " + SlotLabel(s));

        const int score = Score(rule->metric, *src);
        const bool better = rule->pick == Pick::Lowest ? score < best_score : score > best_score;
        if (!best || better)
        {
            best = *src;
            best_score = score;
        }
    }
    out = *best;
    return true;
}
} // namespace

bool AssignSlots(std::span<const Rgb8> palette,
                 Tone tone,
                 const AssignOptions& options,
                 PaletteAssignment& out,
                 Error& err)
{
    err.Clear();
    out = PaletteAssignment{};
    out.tone = tone;

    if (palette.empty())
        return err.Fail(ErrorCode::InvalidArgument, "cannot assign slots from an empty palette");

    std::vector<Rgb8> working(palette.begin(), palette.end());
    Assigned assigned;

    const auto order = AssignmentOrder(tone);
    out.entries.reserve(order.size());

    for (std::size_t i = 0; i < order.size(); ++i)
    {
        const SlotRule& rule = order[i];
        SlotAssignment entry;
        entry.slot = rule.slot;

        if (i == 0 && options.background == BackgroundMode::Dominant)
        {
            entry.colour = working.front();
            working.erase(working.begin());
        }
        else if (!working.empty())
        {
            // Ascending stable sort, then take the last: ties go to the later colour.
            std::stable_sort(working.begin(), working.end(), [&](const Rgb8& a, const Rgb8& b) {
                return Score(rule.metric, a) < Score(rule.metric, b);
            });
            entry.colour = working.back();
            working.pop_back();
        }
        else
        {
            if (!ResolveReuse(rule.slot, assigned, entry.colour, err))
            {
                out.entries.clear();
                return false;
            }
            entry.reused = true;
        }

        assigned[(size_t)rule.slot] = entry.colour;
        out.entries.push_back(entry);
    }
    return true;
}
} // namespace imagen::palette
