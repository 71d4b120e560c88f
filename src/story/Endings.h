#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "story/StoryState.h"

namespace lore::story {

// Listed in evaluation priority; the first matching predicate wins.
enum class EndingKind : std::uint8_t
{
    Fallen = 0,          // health <= 0
    AscendantAlliance,   // trust >= 80, power >= 70, oath_bound
    LoneSovereign,       // notoriety >= 80, power >= 80, morality <= -30
    RedeemedGuardian,    // morality >= 80, power >= 50
    QuietExile,          // chapter >= 30, trust < 40, notoriety < 40
};

struct Ending
{
    EndingKind kind;
    std::string title;
    std::string text;
};

[[nodiscard]] const char* EndingTitle(EndingKind k) noexcept;

// std::nullopt while the story continues. Does not mark the state as concluded.
[[nodiscard]] std::optional<Ending> EvaluateEnding(const StoryState& st);

} // namespace lore::story
