#include "story/ChoiceEffects.h"
#include "story/Scenes.h"

#include <algorithm>

namespace lore::story {

namespace {

constexpr Stat H = Stat::Health;
constexpr Stat P = Stat::Power;
constexpr Stat M = Stat::Morality;
constexpr Stat N = Stat::Notoriety;
constexpr Stat T = Stat::TrustDemonLord;
constexpr Stat B = Stat::BondDemonLord;

} // namespace

const std::vector<ChoiceEffect>& ChoiceEffects()
{
    static const std::vector<ChoiceEffect> table = {
        // Intro
        {"intro_plead", {{M, +10}, {T, +15}}, {{"seeking_truth", true}}, nullptr, nullptr,
         "You speak plainly of betrayal. {dl} studies the cracks in your voice and lowers her hand. "
         "\"Truth cuts deeper than any blade,\" she says."},
        {"intro_vengeance", {{M, -10}, {P, +10}, {T, +5}}, {{"vow_revenge", true}}, nullptr, nullptr,
         "Vengeance burns like pitch. {dl} smiles—a small, dangerous thing. \"Then we understand each other.\""},
        {"intro_pact", {{T, +20}}, {{"allied", true}}, nullptr, nullptr,
         "You offer terms, not supplication. {dl} clasps your wrist. "
         "\"We hunt different prey—but we can share the trail.\""},
        {"intro_fight", {{H, -15}, {P, +5}, {T, +10}}, {}, nullptr, nullptr,
         "Steel rings. You draw blood and pay in kind. {dl} laughs like thunder far away. "
         "\"Live, then. Earn the right to stand.\""},

        // Camp
        {"camp_confide", {{M, +5}, {T, +12}}, {}, nullptr, nullptr,
         "Your memory is a splinter. You let it out. {dl} listens without mercy—without judgment. "
         "The fire warms, just a little."},
        {"camp_silence", {{P, +5}, {T, +2}}, {}, nullptr, nullptr,
         "You sharpen steel and silence. Sparks chart constellations no map has named."},
        {"camp_probe", {{T, -3}, {N, +5}}, {}, nullptr, nullptr,
         "Questions are knives. {dl} answers some and turns aside others. "
         "You learn enough to be wary—and useful."},
        {"camp_scout", {{P, +3}, {H, +3}}, {}, nullptr, nullptr,
         "You pace the warding ring. Footprints. A bent reed. "
         "The forest is a chessboard and you are learning the moves."},

        // Training
        {"train_defense", {{P, +7}, {M, +5}, {T, +5}}, {}, nullptr, nullptr,
         "Your ward blooms like a quiet star. It holds when claws descend. "
         "Somewhere, someone will live because of this."},
        {"train_wrath", {{P, +12}, {M, -6}, {N, +6}}, {}, nullptr, nullptr,
         "You inhale the storm and exhale ruin. The stones remember your name as a crack."},
        {"train_sync", {{P, +6}, {T, +10}, {B, +1}}, {}, nullptr, nullptr,
         "Step, strike, breathe—together. {dl}'s motion becomes a language you begin to read."},

        // Council
        {"council_diplomacy", {{M, +8}, {T, +6}}, {{"seeking_truth", true}}, nullptr, nullptr,
         "You chart a path of proof and patience. The hall quiets; even war can listen."},
        {"council_raids", {{P, +8}, {N, +10}}, {{"vow_revenge", true}}, nullptr, nullptr,
         "Targets line the map like sins. You thread a needle through them made of fire."},
        {"council_parley", {{M, +3}, {N, +3}}, {{"parley_set", true}}, nullptr, nullptr,
         "A secret parley—dangerous, delicate. If it holds, the story changes."},

        // Oath
        {"oath_sworn", {{T, +20}, {B, +3}}, {{"oath_bound", true}}, nullptr, nullptr,
         "You swear by fang and star. The Moonwell seals the promise with a chill that tastes like dawn."},
        {"oath_hesitate", {{T, -5}}, {}, nullptr, nullptr,
         "You ask for time. The Moonwell reflects two strangers trying to be allies."},
        {"oath_refuse", {{T, -12}}, {{"allied", false}}, nullptr, nullptr,
         "You step back from the brink. Freedom is a lonely country."},

        // Spies
        {"spy_intercept", {{M, +4}, {N, +5}}, {}, nullptr, nullptr,
         "You unmask the trap and free the bait. Rumors begin to turn toward truth."},
        {"spy_reverse", {{P, +7}, {M, -2}, {N, +9}}, {}, nullptr, nullptr,
         "Hunters become the hunted. The forest keeps your secrets."},
        {"spy_ignore", {{P, +4}, {M, -4}}, {}, nullptr, nullptr,
         "You let the game play on without you—for now."},

        // Ambush
        {"ambush_shadow", {{P, +8}, {M, -6}, {N, +8}}, {}, nullptr, nullptr,
         "No witnesses. No mercy. The bridge remembers only silence."},
        {"ambush_capture", {{M, +6}, {N, +4}}, {}, nullptr, nullptr,
         "Under your blade, a scout chooses life—and answers. Names spill like beads from a torn chain."},
        {"ambush_letgo", {{M, +2}, {N, +6}}, {}, nullptr, nullptr,
         "Mercy travels faster than hoofbeats. Fear travels faster still."},

        // Rescue
        {"rescue_shield", {{M, +10}, {H, -8}, {T, +4}}, {}, nullptr, nullptr,
         "You take the blows others could not bear. A child's cough becomes a laugh."},
        {"rescue_ruse", {{M, +6}, {P, +3}}, {}, nullptr, nullptr,
         "Illusions, footprints, a staged cry—bandits chase ghosts while the caravan slips free."},
        {"rescue_walk", {{M, -10}, {P, +4}, {N, +5}}, {}, nullptr, nullptr,
         "You turn away. The road learns your name without deciding if it loves you."},

        // Grim bargain
        {"bargain_memory", {{P, +15}, {M, -8}}, {},
         "You traded a cherished memory at the Thorn Altar.", nullptr,
         "You give the altar a memory of home. Power rushes in to fill the hollow it leaves."},
        {"bargain_reject", {{M, +5}, {T, +3}}, {}, nullptr, nullptr,
         "You walk away from easy strength. The altar hums, disappointed."},
        {"bargain_token", {{P, +10}, {N, +7}}, {}, nullptr, nullptr,
         "You place a betrayer's token on the altar. The thorns drink deep and answer with power."},

        // Ruins
        {"ruins_study", {{P, +4}, {M, +2}}, {},
         "Discovered records of prior heroes consumed by their crowns.", nullptr,
         "Glyphs confess: heroes burned an age to keep a throne warm. Truth is an ember you pocket."},
        {"ruins_force", {{P, +8}, {M, -4}}, {}, nullptr, "Vault Relic",
         "The vault yields with a scream of stone. Inside waits a relic that knows your pulse."},
        {"ruins_mark", {{M, +1}, {T, +2}}, {}, nullptr, nullptr,
         "You leave a mark, not a wound. Even ruins deserve a future."},

        // Wild Hunt
        {"hunt_race", {{P, +5}, {N, +3}}, {}, nullptr, nullptr,
         "You run with ghosts until your lungs are bells. They teach you shortcuts through moonlight."},
        {"hunt_duel", {{P, +10}, {H, -6}, {N, +6}}, {}, nullptr, nullptr,
         "Steel rings against antler and oath. You win a scar and a salute."},
        {"hunt_hide", {{M, +2}}, {}, nullptr, nullptr,
         "You watch unseen as the Wild Hunt redraws the night's borders."},

        // Whispers
        {"whisper_follow", {{N, +4}}, {{"betrayer_trail", true}}, nullptr, nullptr,
         "The whisper leads to a sigil cut in bark: a hero's mark. The trail warms under your gaze."},
        {"whisper_ward", {{P, +3}, {M, +1}}, {}, nullptr, nullptr,
         "You hush the forest with a ward that tastes like peppermint and thunder."},
        {"whisper_together", {{T, +8}, {B, +1}}, {}, nullptr, nullptr,
         "You and {dl} listen as one. The voices braid into a map only two can read."},
    };
    return table;
}

const ChoiceEffect* FindChoiceEffect(std::string_view tag)
{
    const auto& table = ChoiceEffects();
    const auto it = std::find_if(table.begin(), table.end(),
                                 [tag](const ChoiceEffect& e) { return tag == e.tag; });
    return it == table.end() ? nullptr : &*it;
}

std::string ApplyEffect(const ChoiceEffect& effect, StoryState& st)
{
    for (const auto& d : effect.deltas)
        ApplyStatDelta(st, d.stat, d.delta);

    for (const auto& f : effect.flags)
        st.SetFlag(f.name, f.value);

    if (effect.historyLine)
        st.AddHistory(effect.historyLine);

    if (effect.inventoryItem)
        st.AddItem(effect.inventoryItem);

    return Interpolate(effect.narration, st.DemonLordDisplayName());
}

} // namespace lore::story
