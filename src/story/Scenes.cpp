#include "story/Scenes.h"

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace lore::story {

namespace {

const char* const kDemonLordNames[kDemonLordNameCount] = {
    "Nyx", "Velaria", "Lilithe", "Morrigan", "Eresh", "Seraphine", "Astariel", "Noctra",
};

bool MetDemonLord(const StoryState& st) { return st.Flag("met_demon_lord"); }

} // namespace

const char* ArchetypeId(Archetype a) noexcept
{
    switch (a)
    {
    case Archetype::Intro:            return "intro";
    case Archetype::OathBond:         return "oath_bond";
    case Archetype::Council:          return "council";
    case Archetype::Training:         return "training";
    case Archetype::TenseCamp:        return "tense_camp";
    case Archetype::SpyReport:        return "spy_report";
    case Archetype::AmbushKingScouts: return "ambush_king_scouts";
    case Archetype::RescueTravelers:  return "rescue_travelers";
    case Archetype::GrimBargain:      return "grim_bargain";
    case Archetype::MysticRuins:      return "mystic_ruins";
    case Archetype::WildHunt:         return "wild_hunt";
    case Archetype::WhisperingTrees:  return "whispering_trees";
    }
    return "?";
}

const char* DemonLordName(int index) noexcept
{
    if (index < 0 || index >= kDemonLordNameCount)
        return kDemonLordNames[0];
    return kDemonLordNames[index];
}

const SceneTemplate& IntroTemplate()
{
    static const SceneTemplate intro{
        Archetype::Intro,
        "Demon Forest — Thornsfall Edge",
        "You awaken in briars and ash. The kingdom you died to protect has cast you out.\n"
        "Branches claw your cloak as you stumble through the Demon Forest. A presence watches.\n\n"
        "She steps from the gloom: the Demon Lord, a girl with eyes like eclipsed moons.\n"
        "\"I am {dl}. Your light reeks of betrayal,\" she says. \"Why should I spare you?\"",
        {
            {"Plead your case: you were framed and seek only the truth.", "intro_plead"},
            {"Swear vengeance: you'll raze the kingdom that betrayed you.", "intro_vengeance"},
            {"Offer a pact: strength for strength—become uneasy allies.", "intro_pact"},
            {"Draw steel: if she wants blood, she'll earn it.", "intro_fight"},
        },
    };
    return intro;
}

const std::vector<SceneTemplate>& SceneTemplates()
{
    static const std::vector<SceneTemplate> templates = {
        {
            Archetype::OathBond,
            "Moonwell — Mirror of Vows",
            "Beside the Moonwell, {dl} offers her hand. \"We choose each other—against crown and fate.\"\n"
            "The water reflects futures you barely recognize.",
            {
                {"Swear an oath of alliance.", "oath_sworn"},
                {"Hesitate—the cost of vows is always hidden.", "oath_hesitate"},
                {"Refuse—freedom above all.", "oath_refuse"},
            },
        },
        {
            Archetype::Council,
            "Eclipse Hall — Council of Cinders",
            "{dl}'s lieutenants argue under lanterns filled with captured starlight.\n"
            "War or peace? Retaliation or secrecy? They seek your counsel.",
            {
                {"Advise diplomacy—seek proof of the kingdom's treachery.", "council_diplomacy"},
                {"Plan raids on corrupt nobles and supply lines.", "council_raids"},
                {"Propose a secret parley with a sympathetic hero.", "council_parley"},
            },
        },
        {
            Archetype::Training,
            "Obsidian Glade — Training Stones",
            "In the Obsidian Glade, {dl} tests you. Demonic sigils fracture the air.\n"
            "Power strains your scars as you push beyond mortal limits.",
            {
                {"Master a defensive ward to shield the weak.", "train_defense"},
                {"Channel wrath—strike harder, faster, crueler.", "train_wrath"},
                {"Synchronize with {dl}'s rhythm; trust the dance of blades.", "train_sync"},
            },
        },
        {
            Archetype::TenseCamp,
            "Forest Camp — Ember Clearing",
            "A small fire sputters beneath twisted pines. {dl} watches you from across the flames.\n"
            "Trust flickers like kindling. The forest listens.",
            {
                {"Share a painful memory to earn her empathy.", "camp_confide"},
                {"Hone your blade in silence; let actions speak.", "camp_silence"},
                {"Probe her motives—why rule the demons at all?", "camp_probe"},
                {"Scout the perimeter; danger stalks the dark.", "camp_scout"},
            },
        },
        {
            Archetype::SpyReport,
            "Shadespine — Scout's Path",
            "A demon scout kneels, breathless: the kingdom moves hunters into the forest.\n"
            "They bear your crest—bait for a public execution.",
            {
                {"Intercept and expose the ruse.", "spy_intercept"},
                {"Turn the ambush onto the hunters.", "spy_reverse"},
                {"Ignore; focus on power first.", "spy_ignore"},
            },
        },
        {
            Archetype::AmbushKingScouts,
            "Ravine Verge — Broken Bridge",
            "You spot royal scouts across a broken bridge, whispering your name like a curse.\n"
            "Their signal mirrors glint. A choice, sharp as shale.",
            {
                {"Strike from shadow—no witnesses.", "ambush_shadow"},
                {"Seize a scout alive for information.", "ambush_capture"},
                {"Let them flee; plant fear and rumor.", "ambush_letgo"},
            },
        },
        {
            Archetype::RescueTravelers,
            "Cairn Road — Bleak Mile",
            "A caravan of refugees stumbles under the weight of injustice. Bandits circle.\n"
            "You hear a child's cough beneath the wind.",
            {
                {"Shield the caravan; take the blows for them.", "rescue_shield"},
                {"Outwit the bandits with a ruse.", "rescue_ruse"},
                {"Walk away. Mercy is a luxury.", "rescue_walk"},
            },
        },
        {
            Archetype::GrimBargain,
            "Thorn Altar — Price of Power",
            "A thorned altar hums with forbidden strength. {dl}'s gaze is unreadable.\n"
            "The altar grants might… and takes what you value most.",
            {
                {"Bleed for power: sacrifice a memory.", "bargain_memory"},
                {"Spare yourself—reject the altar.", "bargain_reject"},
                {"Offer the altar a token from your betrayers.", "bargain_token"},
            },
        },
        {
            Archetype::MysticRuins,
            "Ancient Ruins — Vault of Mists",
            "Fog curls around cracked archways. Glyphs speak of heroes who burned their own ages ago.\n"
            "A vault door breathes cold secrets.",
            {
                {"Study the glyphs for hidden history.", "ruins_study"},
                {"Force the vault—whatever lies within is yours.", "ruins_force"},
                {"Leave a mark: a promise to return stronger.", "ruins_mark"},
            },
        },
        {
            Archetype::WildHunt,
            "Night Plains — The Wild Hunt",
            "Horns sound. Spectral riders rise like storm-surf, seeking a worthy quarry.\n"
            "They circle, inviting chase or challenge.",
            {
                {"Race with them; learn their paths.", "hunt_race"},
                {"Challenge the huntmaster to single combat.", "hunt_duel"},
                {"Hide and observe; knowledge first.", "hunt_hide"},
            },
        },
        {
            Archetype::WhisperingTrees,
            "Whispering Trees — Root of Echoes",
            "Leaves speak in voices you once trusted. They tell different truths now.\n"
            "One whisper carries the name of a hero who betrayed you.",
            {
                {"Follow the whisper to its source.", "whisper_follow"},
                {"Silence the voices with a ward.", "whisper_ward"},
                {"Ask {dl} to listen with you.", "whisper_together"},
            },
        },
    };
    return templates;
}

const SceneTemplate& TemplateFor(Archetype a)
{
    if (a == Archetype::Intro)
        return IntroTemplate();

    const auto& all = SceneTemplates();
    const auto it = std::find_if(all.begin(), all.end(),
                                 [a](const SceneTemplate& t) { return t.archetype == a; });
    if (it == all.end())
        throw std::out_of_range(std::string("no scene template for archetype ") + ArchetypeId(a));
    return *it;
}

const std::vector<EligibilityRule>& EligibilityRules()
{
    static const std::vector<EligibilityRule> rules = {
        {"met demon lord, trust >= 60, no oath yet",
         [](const StoryState& st) {
             return MetDemonLord(st) && st.trustDemonLord >= 60 && !st.Flag("oath_bound");
         },
         {Archetype::OathBond}},
        {"met demon lord, trust >= 30",
         [](const StoryState& st) { return MetDemonLord(st) && st.trustDemonLord >= 30; },
         {Archetype::Council, Archetype::Training}},
        {"met demon lord, trust < 30",
         [](const StoryState& st) { return MetDemonLord(st) && st.trustDemonLord < 30; },
         {Archetype::TenseCamp}},
        {"vowed revenge",
         [](const StoryState& st) { return st.Flag("vow_revenge"); },
         {Archetype::SpyReport, Archetype::AmbushKingScouts}},
        {"morality >= 40",
         [](const StoryState& st) { return st.morality >= 40; },
         {Archetype::RescueTravelers}},
        {"morality <= -40",
         [](const StoryState& st) { return st.morality <= -40; },
         {Archetype::GrimBargain}},
        {"general exploration",
         [](const StoryState&) { return true; },
         {Archetype::MysticRuins, Archetype::WildHunt, Archetype::WhisperingTrees}},
    };
    return rules;
}

std::vector<Archetype> EligibleArchetypes(const StoryState& st)
{
    std::vector<Archetype> out;
    for (const auto& rule : EligibilityRules())
    {
        if (!rule.applies(st))
            continue;
        spdlog::trace("EligibleArchetypes: rule '{}' applies", rule.description);
        for (Archetype a : rule.adds)
        {
            if (std::find(out.begin(), out.end(), a) == out.end())
                out.push_back(a);
        }
    }
    return out;
}

std::string Interpolate(std::string_view tmpl, std::string_view name)
{
    constexpr std::string_view kToken = "{dl}";

    std::string out;
    out.reserve(tmpl.size() + name.size());
    std::size_t pos = 0;
    for (;;)
    {
        const std::size_t hit = tmpl.find(kToken, pos);
        if (hit == std::string_view::npos)
        {
            out.append(tmpl.substr(pos));
            break;
        }
        out.append(tmpl.substr(pos, hit - pos));
        out.append(name);
        pos = hit + kToken.size();
    }
    return out;
}

Scene RenderTemplate(const SceneTemplate& t, StoryState& st)
{
    const std::string dl = st.DemonLordDisplayName();

    st.location = t.location;

    Scene scene;
    scene.archetype = t.archetype;
    scene.location = st.location;
    scene.text = Interpolate(t.narration, dl);
    scene.choices.reserve(t.choices.size());
    for (const auto& c : t.choices)
        scene.choices.push_back(ChoiceOption{Interpolate(c.text, dl), c.tag});
    return scene;
}

} // namespace lore::story
