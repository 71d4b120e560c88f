// tests/test_story_engine.cpp
//
// StoryEngine: intro, choice application, drift and seeded reproducibility.

#include <doctest/doctest.h>

#include "story/ChoiceEffects.h"
#include "story/Stats.h"
#include "story/StoryEngine.h"

#include <algorithm>
#include <set>
#include <string>
#include <vector>

using lore::story::Archetype;
using lore::story::StoryEngine;
using lore::story::StoryState;

namespace {

struct Transcript
{
    std::vector<Archetype> archetypes;
    std::vector<std::string> narration;
    std::vector<int> drifts;
    StoryState finalState;
};

// Plays `turns` choices, always taking choice (turn % count).
[[nodiscard]] Transcript Play(std::uint64_t seed, int turns, double drift = 0.15)
{
    Transcript t;
    StoryState st = lore::story::NewPlaythrough("Aren", seed);
    StoryEngine engine(st.seed);

    for (int turn = 0; turn < turns; ++turn)
    {
        const auto scene = engine.RenderScene(st);
        t.archetypes.push_back(scene.archetype);

        const auto& choice = scene.choices[static_cast<std::size_t>(turn) % scene.choices.size()];
        t.narration.push_back(engine.ApplyChoice(st, choice.tag));
        t.drifts.push_back(engine.ApplyIncidentalDrift(st, drift).value_or(0));
    }

    t.finalState = st;
    return t;
}

[[nodiscard]] bool InRange(const StoryState& st)
{
    using lore::story::Stat;
    for (Stat s : {Stat::Health, Stat::Power, Stat::Morality, Stat::Notoriety,
                   Stat::TrustDemonLord, Stat::BondDemonLord})
    {
        const auto r = lore::story::RangeOf(s);
        const int v = lore::story::StatValue(st, s);
        if (v < r.lo || v > r.hi)
            return false;
    }
    return true;
}

} // namespace

TEST_CASE("The intro starts chapter 1 and freezes a demon lord name")
{
    StoryState st = lore::story::NewPlaythrough("Aren", 42);
    StoryEngine engine(st.seed);

    const auto scene = engine.RenderScene(st);
    CHECK(scene.archetype == Archetype::Intro);
    CHECK(scene.choices.size() == 4);
    CHECK(st.chapter == 1);
    CHECK(st.location == "Demon Forest — Thornsfall Edge");
    CHECK(scene.location == st.location);

    std::set<std::string> roster;
    for (int i = 0; i < lore::story::kDemonLordNameCount; ++i)
        roster.insert(lore::story::DemonLordName(i));
    CHECK(roster.count(st.demonLordName) == 1);
    CHECK(scene.text.find(st.demonLordName) != std::string::npos);

    REQUIRE(st.history.size() == 1);
    CHECK(st.history[0] == "Banished to the Demon Forest after betrayal by the kingdom and fellow heroes.");
    REQUIRE(st.flags.count("vow_revenge") == 1);
    CHECK_FALSE(st.flags.at("vow_revenge"));
}

TEST_CASE("The intro keeps existing flags and an already frozen name")
{
    StoryState st;
    st.SetFlag("allied", true);
    st.demonLordName = "Noctra";

    StoryEngine engine(7);
    (void)engine.RenderScene(st);

    CHECK(st.Flag("allied"));
    CHECK(st.Flag("betrayed"));
    CHECK(st.Flag("seeking_truth"));
    CHECK(st.demonLordName == "Noctra");
}

TEST_CASE("The intro name draw is the only draw before the first choice")
{
    StoryState a;
    StoryState b;
    b.demonLordName = "Nyx";

    StoryEngine named(9);
    StoryEngine fresh(9);
    (void)fresh.RenderScene(a);   // draws the name
    (void)named.RenderScene(b);   // draws nothing

    lore::rng::Pcg32 reference(9);
    (void)reference.next_bounded(static_cast<std::uint32_t>(lore::story::kDemonLordNameCount));

    StoryState scratch;
    scratch.health = 50;
    CHECK(fresh.ApplyIncidentalDrift(scratch, 0.5).has_value() == (reference.next_double01() < 0.5));
}

TEST_CASE("ApplyChoice on a fresh record: intro_pact")
{
    StoryState st;
    StoryEngine engine;

    const std::string text = engine.ApplyChoice(st, "intro_pact");
    CHECK(st.chapter == 1);
    CHECK(st.trustDemonLord == 30);
    CHECK(st.Flag("allied"));
    CHECK(text.find("the Demon Lord") != std::string::npos);
}

TEST_CASE("Render then intro_pact lands in chapter 2")
{
    StoryState st = lore::story::NewPlaythrough("Aren", 3);
    StoryEngine engine(st.seed);

    (void)engine.RenderScene(st);
    (void)engine.ApplyChoice(st, "intro_pact");
    CHECK(st.chapter == 2);
    CHECK(st.trustDemonLord == 30);
}

TEST_CASE("Unknown tags advance the chapter and change nothing else")
{
    StoryState st = lore::story::NewPlaythrough("Aren", 3);
    st.chapter = 5;
    StoryState expected = st;
    expected.chapter = 6;

    StoryEngine engine(st.seed);
    const std::string text = engine.ApplyChoice(st, "not_a_real_tag");
    CHECK(text == lore::story::kUnknownChoiceNarration);
    CHECK(st == expected);
}

TEST_CASE("Scene draws only come from the eligible set")
{
    StoryState st = lore::story::NewPlaythrough("Aren", 11);
    st.chapter = 3;
    st.trustDemonLord = 10;

    const auto eligible = lore::story::EligibleArchetypes(st);
    StoryEngine engine(11);
    std::set<Archetype> seen;
    for (int i = 0; i < 300; ++i)
    {
        const auto scene = engine.RenderScene(st);
        REQUIRE(std::find(eligible.begin(), eligible.end(), scene.archetype) != eligible.end());
        seen.insert(scene.archetype);
    }

    CHECK(seen.count(Archetype::TenseCamp) == 1);
    CHECK(seen.count(Archetype::Council) == 0);
    CHECK(seen.count(Archetype::Training) == 0);
    CHECK(seen.size() == eligible.size());
}

TEST_CASE("Same seed and same choices reproduce the session exactly")
{
    const auto a = Play(123456789, 60);
    const auto b = Play(123456789, 60);

    CHECK(a.archetypes == b.archetypes);
    CHECK(a.narration == b.narration);
    CHECK(a.drifts == b.drifts);
    CHECK(a.finalState == b.finalState);
}

TEST_CASE("Different seeds produce different sessions")
{
    const auto a = Play(1, 40);
    const auto b = Play(2, 40);
    CHECK(a.archetypes != b.archetypes);
}

TEST_CASE("Attributes stay in range and bond never decreases over long play")
{
    for (std::uint64_t seed : {5ull, 77ull, 2024ull})
    {
        StoryState st = lore::story::NewPlaythrough("Aren", seed);
        StoryEngine engine(seed);
        lore::rng::Pcg32 picker(seed ^ 0xABCDull);

        int bond = st.bondDemonLord;
        for (int turn = 0; turn < 400; ++turn)
        {
            const auto scene = engine.RenderScene(st);
            REQUIRE_FALSE(scene.choices.empty());
            const auto idx = picker.next_bounded(static_cast<std::uint32_t>(scene.choices.size()));
            (void)engine.ApplyChoice(st, scene.choices[idx].tag);
            (void)engine.ApplyIncidentalDrift(st, 0.5);

            REQUIRE(InRange(st));
            REQUIRE(st.bondDemonLord >= bond);
            bond = st.bondDemonLord;
        }
        CHECK(st.chapter == 401); // intro sets 1, each of 400 choices adds 1
    }
}

TEST_CASE("Incidental drift: never at 0, always at 1, within two points")
{
    StoryState st;
    StoryEngine engine(31);

    for (int i = 0; i < 50; ++i)
        CHECK_FALSE(engine.ApplyIncidentalDrift(st, 0.0).has_value());
    CHECK(st.health == 80);

    for (int i = 0; i < 50; ++i)
    {
        st.health = 50;
        const auto d = engine.ApplyIncidentalDrift(st, 1.0);
        REQUIRE(d.has_value());
        CHECK(*d != 0);
        CHECK(*d >= -2);
        CHECK(*d <= 2);
        CHECK(st.health == 50 + *d);
    }

    st.health = 100;
    for (int i = 0; i < 50; ++i)
        (void)engine.ApplyIncidentalDrift(st, 1.0);
    CHECK(st.health <= 100);
}

TEST_CASE("Reseed restarts scene selection")
{
    StoryState a = lore::story::NewPlaythrough("Aren", 8);
    a.chapter = 4;
    StoryState b = a;

    StoryEngine engine(8);
    const auto first = engine.RenderScene(a);
    (void)engine.RenderScene(a);

    engine.Reseed(8);
    const auto again = engine.RenderScene(b);
    CHECK(first.archetype == again.archetype);
}

TEST_CASE("CheckEnding reports death")
{
    StoryState st;
    st.health = 0;
    const StoryEngine engine;
    const auto ending = engine.CheckEnding(st);
    REQUIRE(ending.has_value());
    CHECK(ending->kind == lore::story::EndingKind::Fallen);
}
