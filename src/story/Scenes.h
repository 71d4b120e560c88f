#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "story/StoryState.h"

namespace lore::story {

enum class Archetype : std::uint8_t
{
    Intro = 0,
    OathBond,
    Council,
    Training,
    TenseCamp,
    SpyReport,
    AmbushKingScouts,
    RescueTravelers,
    GrimBargain,
    MysticRuins,
    WildHunt,
    WhisperingTrees,
};

// Stable identifier ("oath_bond", "ambush_king_scouts", ...), used in logs and tests.
[[nodiscard]] const char* ArchetypeId(Archetype a) noexcept;

struct ChoiceOption
{
    std::string text;
    std::string tag;
};

// A rendered scene: what the session prints and the tags it may send back.
struct Scene
{
    Archetype archetype = Archetype::Intro;
    std::string location;
    std::string text;
    std::vector<ChoiceOption> choices;
};

// Fixed scene template. "{dl}" in narration or choice text is replaced by the demon lord's name.
struct SceneTemplate
{
    Archetype archetype;
    const char* location;
    const char* narration;
    std::vector<ChoiceOption> choices;
};

// Declarative eligibility: every rule whose predicate holds contributes its archetypes.
struct EligibilityRule
{
    const char* description;
    bool (*applies)(const StoryState&);
    std::vector<Archetype> adds;
};

inline constexpr int kDemonLordNameCount = 8;
[[nodiscard]] const char* DemonLordName(int index) noexcept;

[[nodiscard]] const SceneTemplate& IntroTemplate();

// Templates for every non-intro archetype, in Archetype order.
[[nodiscard]] const std::vector<SceneTemplate>& SceneTemplates();
[[nodiscard]] const SceneTemplate& TemplateFor(Archetype a);

[[nodiscard]] const std::vector<EligibilityRule>& EligibilityRules();

// Union of all matching rules, first-seen order, no duplicates. Never empty.
[[nodiscard]] std::vector<Archetype> EligibleArchetypes(const StoryState& st);

// Replace every "{dl}" in `tmpl` with `name`.
[[nodiscard]] std::string Interpolate(std::string_view tmpl, std::string_view name);

// Sets st.location and builds the scene text / choices from the template.
[[nodiscard]] Scene RenderTemplate(const SceneTemplate& t, StoryState& st);

} // namespace lore::story
