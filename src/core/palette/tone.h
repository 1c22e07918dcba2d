#pragma once

#include <cstdint>

namespace imagen::palette
{
// Whether the theme background is dark or light.
enum class Tone : std::uint8_t
{
    Dark = 0,
    Light = 1,
};

inline const char* ToneName(Tone t)
{
    return t == Tone::Dark ? "dark" : "light";
}
} // namespace imagen::palette
