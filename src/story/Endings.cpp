#include "story/Endings.h"
#include "story/Scenes.h"

namespace lore::story {

namespace {

Ending Make(EndingKind k, std::string text)
{
    return Ending{k, EndingTitle(k), std::move(text)};
}

} // namespace

const char* EndingTitle(EndingKind k) noexcept
{
    switch (k)
    {
    case EndingKind::Fallen:            return "Fallen";
    case EndingKind::AscendantAlliance: return "Ascendant Alliance";
    case EndingKind::LoneSovereign:     return "Lone Sovereign";
    case EndingKind::RedeemedGuardian:  return "Redeemed Guardian";
    case EndingKind::QuietExile:        return "Quiet Exile";
    }
    return "?";
}

std::optional<Ending> EvaluateEnding(const StoryState& st)
{
    if (st.health <= 0)
        return Make(EndingKind::Fallen,
                    "Your story ends beneath black boughs. Even the forest bows its head.");

    if (st.trustDemonLord >= 80 && st.power >= 70 && st.Flag("oath_bound"))
        return Make(EndingKind::AscendantAlliance,
                    Interpolate("Side by side with {dl}, you confront the crown. "
                                "Proof and power make a quiet revolution.\n"
                                "The heroes who betrayed you kneel, not to force, but to truth. "
                                "The forest grows less afraid.",
                                st.DemonLordDisplayName()));

    if (st.notoriety >= 80 && st.power >= 80 && st.morality <= -30)
        return Make(EndingKind::LoneSovereign,
                    "Feared and unstoppable, you become a storm that keeps its own counsel. "
                    "Kings learn to read the sky.");

    if (st.morality >= 80 && st.power >= 50)
        return Make(EndingKind::RedeemedGuardian,
                    "You choose to guard rather than rule. Roads are safer where your shadow falls.");

    if (st.chapter >= 30 && st.trustDemonLord < 40 && st.notoriety < 40)
        return Make(EndingKind::QuietExile,
                    "Years pass like leaves. Your name fades, but the people you saved remember.\n"
                    "Not all legends need thrones.");

    return std::nullopt;
}

} // namespace lore::story
