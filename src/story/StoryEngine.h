#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "core/Rng.h"
#include "story/Endings.h"
#include "story/Scenes.h"
#include "story/StoryState.h"

namespace lore::story {

// Scene selection and state transitions for one session.
//
// Every random decision (archetype draw, demon lord name, incidental drift) comes
// from the single PCG32 stream below, so a fixed seed plus a fixed choice sequence
// reproduces the same scenes, narration and final state.
class StoryEngine
{
public:
    explicit StoryEngine(std::uint64_t seed = kDefaultSeed);

    // Restart the stream (on new game / load). Consumed draws are not replayed.
    void Reseed(std::uint64_t seed);

    // Intro at chapter 0, otherwise a uniformly drawn eligible archetype.
    // Writes st.location; the intro also advances chapter to 1 and seeds its flags.
    [[nodiscard]] Scene RenderScene(StoryState& st);

    // chapter += 1, then the tag's effect. Unknown tags are a no-op with a fixed narration.
    std::string ApplyChoice(StoryState& st, std::string_view tag);

    [[nodiscard]] std::optional<Ending> CheckEnding(const StoryState& st) const;

    // With probability `chance`, nudge health by -2/-1/+1/+2 (clamped).
    // Returns the applied change when the roll hits.
    std::optional<int> ApplyIncidentalDrift(StoryState& st, double chance);

private:
    Scene RenderIntro(StoryState& st);

    rng::Pcg32 m_rng;
};

} // namespace lore::story
