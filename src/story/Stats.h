#pragma once

#include <cstdint>

#include "story/StoryState.h"

namespace lore::story {

// Bounded integer attributes of a StoryState.
enum class Stat : std::uint8_t
{
    Health = 0,
    Power,
    Morality,
    Notoriety,
    TrustDemonLord,
    BondDemonLord,
};

inline constexpr int kStatCount = 6;

struct StatRange
{
    int lo = 0;
    int hi = 100;
};

[[nodiscard]] constexpr StatRange RangeOf(Stat s) noexcept
{
    return s == Stat::Morality ? StatRange{-100, 100} : StatRange{0, 100};
}

[[nodiscard]] constexpr int Clamp(int v, int lo, int hi) noexcept
{
    return v < lo ? lo : (v > hi ? hi : v);
}

[[nodiscard]] const char* StatName(Stat s) noexcept;

[[nodiscard]] int& StatRef(StoryState& st, Stat s) noexcept;
[[nodiscard]] int StatValue(const StoryState& st, Stat s) noexcept;

// Adds `delta` and saturates to the stat's interval. Returns the applied change.
int ApplyStatDelta(StoryState& st, Stat s, int delta) noexcept;

// Saturates every bounded attribute (used when accepting foreign data).
void ClampAllStats(StoryState& st) noexcept;

} // namespace lore::story
