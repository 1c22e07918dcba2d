#pragma once

#include "core/colour.h"
#include "core/error.h"
#include "core/palette/slot_catalog.h"
#include "core/palette/tone.h"

#include <cstdint>
#include <span>
#include <vector>

namespace imagen::palette
{
enum class BackgroundMode : std::uint8_t
{
    // color00 is scored like every other slot.
    Scored = 0,
    // color00 takes palette[0] verbatim (the dominant colour kept as the filter's anchor).
    Dominant = 1,
};

struct AssignOptions
{
    BackgroundMode background = BackgroundMode::Scored;
};

struct SlotAssignment
{
    Slot slot = Slot::Color00;
    Rgb8 colour;
    bool reused = false; // copied from an earlier slot instead of consumed from the palette

    bool operator==(const SlotAssignment& o) const
    {
        return slot == o.slot && colour == o.colour && reused == o.reused;
    }
};

struct PaletteAssignment
{
    Tone                        tone = Tone::Dark;
    std::vector<SlotAssignment> entries; // assignment order, one per catalog slot

    // nullptr when the slot is not part of the assignment.
    const Rgb8* Find(Slot slot) const;

    bool operator==(const PaletteAssignment& o) const { return tone == o.tone && entries == o.entries; }
    bool operator!=(const PaletteAssignment& o) const { return !(*this == o); }
};

// Greedily assigns the best-scoring remaining colour to each slot in AssignmentOrder(tone).
// Once the palette is exhausted the slot's ReuseRule supplies a colour from an earlier slot.
//
// Fails with InvalidArgument on an empty palette and IncompleteAssignment if a slot cannot be
// covered.
bool AssignSlots(std::span<const Rgb8> palette,
                 Tone tone,
                 const AssignOptions& options,
                 PaletteAssignment& out,
                 Error& err);
} // namespace imagen::palette
