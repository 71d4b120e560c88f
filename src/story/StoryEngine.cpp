#include "story/StoryEngine.h"
#include "story/ChoiceEffects.h"
#include "story/Stats.h"

#include <iterator>

#include <spdlog/spdlog.h>

namespace lore::story {

namespace {

constexpr int kDriftSteps[] = {-2, -1, +1, +2};

} // namespace

StoryEngine::StoryEngine(std::uint64_t seed)
    : m_rng(seed)
{
}

void StoryEngine::Reseed(std::uint64_t seed)
{
    m_rng.seed(seed);
    spdlog::debug("StoryEngine: reseeded with {}", seed);
}

Scene StoryEngine::RenderIntro(StoryState& st)
{
    st.chapter = 1;
    st.SetFlagIfAbsent("betrayed", true);
    st.SetFlagIfAbsent("met_demon_lord", true);
    st.SetFlagIfAbsent("allied", false);
    st.SetFlagIfAbsent("vow_revenge", false);
    st.SetFlagIfAbsent("seeking_truth", true);
    st.AddHistory("Banished to the Demon Forest after betrayal by the kingdom and fellow heroes.");

    if (st.demonLordName.empty())
    {
        const auto idx = m_rng.next_bounded(static_cast<std::uint32_t>(kDemonLordNameCount));
        st.demonLordName = DemonLordName(static_cast<int>(idx));
        spdlog::info("StoryEngine: demon lord is {}", st.demonLordName);
    }

    return RenderTemplate(IntroTemplate(), st);
}

Scene StoryEngine::RenderScene(StoryState& st)
{
    if (st.chapter == 0)
        return RenderIntro(st);

    const auto candidates = EligibleArchetypes(st);
    const auto idx = m_rng.next_bounded(static_cast<std::uint32_t>(candidates.size()));
    const Archetype chosen = candidates[idx];

    spdlog::debug("StoryEngine: chapter {} picked {} from {} candidates",
                  st.chapter, ArchetypeId(chosen), candidates.size());

    return RenderTemplate(TemplateFor(chosen), st);
}

std::string StoryEngine::ApplyChoice(StoryState& st, std::string_view tag)
{
    st.chapter += 1;

    const ChoiceEffect* effect = FindChoiceEffect(tag);
    if (!effect)
    {
        spdlog::warn("StoryEngine: unknown choice tag '{}' at chapter {}", tag, st.chapter);
        return kUnknownChoiceNarration;
    }

    spdlog::info("StoryEngine: chapter {} applied '{}'", st.chapter, tag);
    return ApplyEffect(*effect, st);
}

std::optional<Ending> StoryEngine::CheckEnding(const StoryState& st) const
{
    auto ending = EvaluateEnding(st);
    if (ending)
        spdlog::info("StoryEngine: ending reached: {}", ending->title);
    return ending;
}

std::optional<int> StoryEngine::ApplyIncidentalDrift(StoryState& st, double chance)
{
    if (!m_rng.chance(chance))
        return std::nullopt;

    const auto idx = m_rng.next_bounded(static_cast<std::uint32_t>(std::size(kDriftSteps)));
    const int applied = ApplyStatDelta(st, Stat::Health, kDriftSteps[idx]);
    spdlog::debug("StoryEngine: incidental drift {} -> health {}", kDriftSteps[idx], st.health);
    return applied;
}

} // namespace lore::story
