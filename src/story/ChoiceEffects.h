#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "story/Stats.h"

namespace lore::story {

struct StatDelta
{
    Stat stat;
    int delta;
};

struct FlagWrite
{
    const char* name;
    bool value;
};

// One row of the choice table. Applied in order: deltas (clamped), flags, history, item.
struct ChoiceEffect
{
    const char* tag;
    std::vector<StatDelta> deltas;
    std::vector<FlagWrite> flags;
    const char* historyLine = nullptr;
    const char* inventoryItem = nullptr;
    const char* narration = "";   // "{dl}" is interpolated
};

inline constexpr const char* kUnknownChoiceNarration =
    "Time moves, yet nothing decisive happens. Perhaps the next choice will cut deeper.";

[[nodiscard]] const std::vector<ChoiceEffect>& ChoiceEffects();

// nullptr for tags that are not in the table (stale or foreign tags).
[[nodiscard]] const ChoiceEffect* FindChoiceEffect(std::string_view tag);

// Mutates `st` per `effect` (chapter untouched) and returns the interpolated narration.
std::string ApplyEffect(const ChoiceEffect& effect, StoryState& st);

} // namespace lore::story
