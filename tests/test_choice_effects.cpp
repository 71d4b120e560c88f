// tests/test_choice_effects.cpp
//
// The choice table: coverage against the scene templates and the exact effect of every row.

#include <doctest/doctest.h>

#include "story/ChoiceEffects.h"
#include "story/Scenes.h"
#include "story/Stats.h"

#include <iterator>
#include <map>
#include <set>
#include <string>
#include <vector>

using lore::story::StoryState;

namespace {

[[nodiscard]] std::set<std::string> AllSceneTags()
{
    std::set<std::string> tags;
    for (const auto& c : lore::story::IntroTemplate().choices)
        tags.insert(c.tag);
    for (const auto& t : lore::story::SceneTemplates())
        for (const auto& c : t.choices)
            tags.insert(c.tag);
    return tags;
}

} // namespace

TEST_CASE("Every scene tag has an effect and every effect belongs to a scene")
{
    const auto sceneTags = AllSceneTags();

    std::set<std::string> tableTags;
    for (const auto& e : lore::story::ChoiceEffects())
    {
        INFO("tag: ", e.tag);
        CHECK(tableTags.insert(e.tag).second);
        CHECK(sceneTags.count(e.tag) == 1);
    }

    for (const auto& tag : sceneTags)
    {
        INFO("tag: ", tag);
        CHECK(lore::story::FindChoiceEffect(tag) != nullptr);
    }

    CHECK(tableTags.size() == sceneTags.size());
}

TEST_CASE("No effect lowers the bond with the demon lord")
{
    for (const auto& e : lore::story::ChoiceEffects())
        for (const auto& d : e.deltas)
        {
            INFO("tag: ", e.tag);
            if (d.stat == lore::story::Stat::BondDemonLord)
                CHECK(d.delta > 0);
        }
}

TEST_CASE("FindChoiceEffect returns nullptr for unknown tags")
{
    CHECK(lore::story::FindChoiceEffect("") == nullptr);
    CHECK(lore::story::FindChoiceEffect("intro_dance") == nullptr);
    CHECK(lore::story::FindChoiceEffect("INTRO_PACT") == nullptr);
}

TEST_CASE("ApplyEffect for oath_sworn raises trust and bond and binds the oath")
{
    StoryState st;
    st.trustDemonLord = 65;

    const auto* e = lore::story::FindChoiceEffect("oath_sworn");
    REQUIRE(e != nullptr);
    lore::story::ApplyEffect(*e, st);

    CHECK(st.trustDemonLord == 85);
    CHECK(st.bondDemonLord == 3);
    CHECK(st.Flag("oath_bound"));
    CHECK(st.chapter == 0); // chapter is the engine's business
}

TEST_CASE("ApplyEffect clamps and writes history and inventory")
{
    StoryState st;
    st.power = 95;
    st.morality = -98;

    const auto* memory = lore::story::FindChoiceEffect("bargain_memory");
    REQUIRE(memory != nullptr);
    lore::story::ApplyEffect(*memory, st);
    CHECK(st.power == 100);
    CHECK(st.morality == -100);
    REQUIRE(st.history.size() == 1);
    CHECK(st.history.back() == "You traded a cherished memory at the Thorn Altar.");

    const auto* relic = lore::story::FindChoiceEffect("ruins_force");
    REQUIRE(relic != nullptr);
    lore::story::ApplyEffect(*relic, st);
    lore::story::ApplyEffect(*relic, st);
    CHECK(st.HasItem("Vault Relic"));
    CHECK(st.inventory.size() == 3);
}

TEST_CASE("ApplyEffect narration uses the frozen demon lord name")
{
    StoryState st;
    st.demonLordName = "Seraphine";

    const auto* e = lore::story::FindChoiceEffect("intro_pact");
    REQUIRE(e != nullptr);
    const std::string text = lore::story::ApplyEffect(*e, st);
    CHECK(text.find("Seraphine") != std::string::npos);
    CHECK(text.find("{dl}") == std::string::npos);

    StoryState unnamed;
    const std::string fallback = lore::story::ApplyEffect(*e, unnamed);
    CHECK(fallback.find("the Demon Lord") != std::string::npos);
}

TEST_CASE("oath_refuse clears the alliance flag")
{
    StoryState st;
    st.SetFlag("allied", true);
    st.trustDemonLord = 5;

    const auto* e = lore::story::FindChoiceEffect("oath_refuse");
    REQUIRE(e != nullptr);
    lore::story::ApplyEffect(*e, st);
    CHECK_FALSE(st.Flag("allied", true));
    CHECK(st.trustDemonLord == 0);
}

namespace {

// Expected record after applying one row to a record with every attribute at 50.
struct ExpectedRow
{
    const char* tag;
    int health, power, morality, notoriety, trust, bond;
    const char* flag;
    bool flagValue;
    const char* history;
    const char* item;
};

} // namespace

TEST_CASE("ApplyEffect produces the exact deltas, flags, history and item for every tag")
{
    static const ExpectedRow kRows[] = {
        {"intro_plead", 50, 50, 60, 50, 65, 50, "seeking_truth", true, nullptr, nullptr},
        {"intro_vengeance", 50, 60, 40, 50, 55, 50, "vow_revenge", true, nullptr, nullptr},
        {"intro_pact", 50, 50, 50, 50, 70, 50, "allied", true, nullptr, nullptr},
        {"intro_fight", 35, 55, 50, 50, 60, 50, nullptr, false, nullptr, nullptr},
        {"camp_confide", 50, 50, 55, 50, 62, 50, nullptr, false, nullptr, nullptr},
        {"camp_silence", 50, 55, 50, 50, 52, 50, nullptr, false, nullptr, nullptr},
        {"camp_probe", 50, 50, 50, 55, 47, 50, nullptr, false, nullptr, nullptr},
        {"camp_scout", 53, 53, 50, 50, 50, 50, nullptr, false, nullptr, nullptr},
        {"train_defense", 50, 57, 55, 50, 55, 50, nullptr, false, nullptr, nullptr},
        {"train_wrath", 50, 62, 44, 56, 50, 50, nullptr, false, nullptr, nullptr},
        {"train_sync", 50, 56, 50, 50, 60, 51, nullptr, false, nullptr, nullptr},
        {"council_diplomacy", 50, 50, 58, 50, 56, 50, "seeking_truth", true, nullptr, nullptr},
        {"council_raids", 50, 58, 50, 60, 50, 50, "vow_revenge", true, nullptr, nullptr},
        {"council_parley", 50, 50, 53, 53, 50, 50, "parley_set", true, nullptr, nullptr},
        {"oath_sworn", 50, 50, 50, 50, 70, 53, "oath_bound", true, nullptr, nullptr},
        {"oath_hesitate", 50, 50, 50, 50, 45, 50, nullptr, false, nullptr, nullptr},
        {"oath_refuse", 50, 50, 50, 50, 38, 50, "allied", false, nullptr, nullptr},
        {"spy_intercept", 50, 50, 54, 55, 50, 50, nullptr, false, nullptr, nullptr},
        {"spy_reverse", 50, 57, 48, 59, 50, 50, nullptr, false, nullptr, nullptr},
        {"spy_ignore", 50, 54, 46, 50, 50, 50, nullptr, false, nullptr, nullptr},
        {"ambush_shadow", 50, 58, 44, 58, 50, 50, nullptr, false, nullptr, nullptr},
        {"ambush_capture", 50, 50, 56, 54, 50, 50, nullptr, false, nullptr, nullptr},
        {"ambush_letgo", 50, 50, 52, 56, 50, 50, nullptr, false, nullptr, nullptr},
        {"rescue_shield", 42, 50, 60, 50, 54, 50, nullptr, false, nullptr, nullptr},
        {"rescue_ruse", 50, 53, 56, 50, 50, 50, nullptr, false, nullptr, nullptr},
        {"rescue_walk", 50, 54, 40, 55, 50, 50, nullptr, false, nullptr, nullptr},
        {"bargain_memory", 50, 65, 42, 50, 50, 50, nullptr, false, "You traded a cherished memory at the Thorn Altar.", nullptr},
        {"bargain_reject", 50, 50, 55, 50, 53, 50, nullptr, false, nullptr, nullptr},
        {"bargain_token", 50, 60, 50, 57, 50, 50, nullptr, false, nullptr, nullptr},
        {"ruins_study", 50, 54, 52, 50, 50, 50, nullptr, false, "Discovered records of prior heroes consumed by their crowns.", nullptr},
        {"ruins_force", 50, 58, 46, 50, 50, 50, nullptr, false, nullptr, "Vault Relic"},
        {"ruins_mark", 50, 50, 51, 50, 52, 50, nullptr, false, nullptr, nullptr},
        {"hunt_race", 50, 55, 50, 53, 50, 50, nullptr, false, nullptr, nullptr},
        {"hunt_duel", 44, 60, 50, 56, 50, 50, nullptr, false, nullptr, nullptr},
        {"hunt_hide", 50, 50, 52, 50, 50, 50, nullptr, false, nullptr, nullptr},
        {"whisper_follow", 50, 50, 50, 54, 50, 50, "betrayer_trail", true, nullptr, nullptr},
        {"whisper_ward", 50, 53, 51, 50, 50, 50, nullptr, false, nullptr, nullptr},
        {"whisper_together", 50, 50, 50, 50, 58, 51, nullptr, false, nullptr, nullptr},
    };

    CHECK(std::size(kRows) == lore::story::ChoiceEffects().size());

    for (const auto& row : kRows)
    {
        INFO("tag: ", row.tag);

        StoryState st;
        st.health = st.power = st.morality = st.notoriety = st.trustDemonLord = st.bondDemonLord = 50;
        st.inventory.clear();

        const auto* e = lore::story::FindChoiceEffect(row.tag);
        REQUIRE(e != nullptr);
        lore::story::ApplyEffect(*e, st);

        CHECK(st.health == row.health);
        CHECK(st.power == row.power);
        CHECK(st.morality == row.morality);
        CHECK(st.notoriety == row.notoriety);
        CHECK(st.trustDemonLord == row.trust);
        CHECK(st.bondDemonLord == row.bond);

        std::map<std::string, bool> flags;
        if (row.flag)
            flags[row.flag] = row.flagValue;
        CHECK(st.flags == flags);

        std::vector<std::string> history;
        if (row.history)
            history.emplace_back(row.history);
        CHECK(st.history == history);

        std::vector<std::string> inventory;
        if (row.item)
            inventory.emplace_back(row.item);
        CHECK(st.inventory == inventory);
    }
}
