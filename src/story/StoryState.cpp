#include "story/StoryState.h"
#include "story/Stats.h"
#include "core/Rng.h"

#include <algorithm>
#include <cstdint>
#include <limits>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace lore::story {

namespace {

using json = nlohmann::json;

constexpr std::uint64_t kFnvOffset = 0xcbf29ce484222325ull;
constexpr std::uint64_t kFnvPrime  = 0x100000001b3ull;

[[nodiscard]] std::uint64_t Fnv1a(std::string_view s, std::uint64_t h = kFnvOffset) noexcept
{
    for (char c : s)
    {
        h ^= static_cast<unsigned char>(c);
        h *= kFnvPrime;
    }
    return h;
}

// Integral JSON number saturated to int. A missing key yields `fallback`; `out`
// is written only on success.
[[nodiscard]] bool ReadInt(const json& j, const char* key, int fallback, int& out, std::string* outError)
{
    const auto it = j.find(key);
    if (it == j.end())
    {
        out = fallback;
        return true;
    }

    constexpr std::int64_t kMin = std::numeric_limits<int>::min();
    constexpr std::int64_t kMax = std::numeric_limits<int>::max();

    if (it->is_number_unsigned())
    {
        const auto u = it->get<std::uint64_t>();
        out = u > static_cast<std::uint64_t>(kMax) ? static_cast<int>(kMax) : static_cast<int>(u);
        return true;
    }
    if (it->is_number_integer())
    {
        out = static_cast<int>(std::clamp(it->get<std::int64_t>(), kMin, kMax));
        return true;
    }

    if (outError) *outError = std::string("\"") + key + "\" is not an integer.";
    return false;
}

[[nodiscard]] bool ReadSeed(const json& j, std::uint64_t fallback, std::uint64_t& out, std::string* outError)
{
    const auto it = j.find("seed");
    if (it == j.end())
    {
        out = fallback;
        return true;
    }
    if (!it->is_number_integer())
    {
        if (outError) *outError = "\"seed\" is not an integer.";
        return false;
    }
    out = it->is_number_unsigned() ? it->get<std::uint64_t>()
                                   : static_cast<std::uint64_t>(it->get<std::int64_t>());
    return true;
}

} // namespace

bool StoryState::Flag(std::string_view key, bool fallback) const
{
    const auto it = flags.find(std::string(key));
    return it == flags.end() ? fallback : it->second;
}

void StoryState::SetFlag(const std::string& key, bool value)
{
    flags[key] = value;
}

bool StoryState::SetFlagIfAbsent(const std::string& key, bool value)
{
    return flags.emplace(key, value).second;
}

bool StoryState::AddItem(const std::string& item)
{
    if (HasItem(item))
        return false;
    inventory.push_back(item);
    return true;
}

bool StoryState::HasItem(std::string_view item) const
{
    return std::find(inventory.begin(), inventory.end(), item) != inventory.end();
}

std::string StoryState::DemonLordDisplayName() const
{
    return demonLordName.empty() ? std::string("the Demon Lord") : demonLordName;
}

bool operator==(const StoryState& a, const StoryState& b)
{
    return a.name == b.name && a.chapter == b.chapter && a.location == b.location &&
           a.health == b.health && a.power == b.power && a.morality == b.morality &&
           a.notoriety == b.notoriety && a.trustDemonLord == b.trustDemonLord &&
           a.bondDemonLord == b.bondDemonLord && a.inventory == b.inventory &&
           a.flags == b.flags && a.demonLordName == b.demonLordName &&
           a.history == b.history && a.seed == b.seed;
}

StoryState NewPlaythrough(std::string name, std::uint64_t seed)
{
    StoryState st;
    if (!name.empty())
        st.name = std::move(name);
    st.seed = seed;
    st.flags = {
        {"betrayed", true},
        {"met_demon_lord", true},
        {"allied", false},
        {"seeking_truth", true},
    };
    return st;
}

std::uint64_t DeriveSeed(std::string_view name, std::int64_t clockTicks) noexcept
{
    std::uint64_t h = Fnv1a(name);
    h = Fnv1a("-", h);
    h ^= rng::mix64(static_cast<std::uint64_t>(clockTicks));
    return rng::mix64(h) & 0xFFFFFFFFull;
}

json ToJson(const StoryState& st)
{
    json flags = json::object();
    for (const auto& [key, value] : st.flags)
        flags[key] = value;
    if (!st.demonLordName.empty())
        flags[kDemonLordNameKey] = st.demonLordName;

    json j;
    j["name"]             = st.name;
    j["chapter"]          = st.chapter;
    j["location"]         = st.location;
    j["health"]           = st.health;
    j["power"]            = st.power;
    j["morality"]         = st.morality;
    j["notoriety"]        = st.notoriety;
    j["trust_demon_lord"] = st.trustDemonLord;
    j["bond_demon_lord"]  = st.bondDemonLord;
    j["inventory"]        = st.inventory;
    j["flags"]            = std::move(flags);
    j["history"]          = st.history;
    j["seed"]             = st.seed;
    return j;
}

bool FromJson(const json& j, StoryState& out, std::string* outError)
{
    if (!j.is_object())
    {
        if (outError) *outError = "State payload is not an object.";
        return false;
    }

    const StoryState defaults;
    StoryState st;

    try
    {
        st.name           = j.value("name", defaults.name);
        st.location       = j.value("location", defaults.location);

        int chapter = 0;
        if (!ReadInt(j, "chapter", defaults.chapter, chapter, outError))
            return false;
        st.chapter = std::max(0, chapter);

        for (int i = 0; i < kStatCount; ++i)
        {
            const Stat s = static_cast<Stat>(i);
            if (!ReadInt(j, StatName(s), StatValue(defaults, s), StatRef(st, s), outError))
                return false;
        }

        if (!ReadSeed(j, defaults.seed, st.seed, outError))
            return false;

        // Hand-edited or foreign saves may carry out-of-range values.
        ClampAllStats(st);

        st.inventory.clear();
        for (const auto& item : j.value("inventory", defaults.inventory))
            st.AddItem(item);

        st.history = j.value("history", defaults.history);

        st.flags.clear();
        if (j.contains("flags"))
        {
            const json& f = j.at("flags");
            if (!f.is_object())
            {
                if (outError) *outError = "\"flags\" is not an object.";
                return false;
            }

            for (const auto& [key, value] : f.items())
            {
                if (key == kDemonLordNameKey)
                {
                    if (value.is_string())
                        st.demonLordName = value.get<std::string>();
                }
                else if (value.is_boolean())
                {
                    st.flags[key] = value.get<bool>();
                }
                else
                {
                    spdlog::warn("FromJson: dropping non-boolean flag '{}'", key);
                }
            }
        }
    }
    catch (const json::exception& e)
    {
        if (outError) *outError = std::string("Malformed state: ") + e.what();
        return false;
    }

    out = std::move(st);
    return true;
}

} // namespace lore::story
