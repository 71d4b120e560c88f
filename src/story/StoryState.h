#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace lore::story {

inline constexpr std::uint64_t kDefaultSeed = 42;

// Key under which the frozen demon lord name lives in the serialized "flags" object.
inline constexpr const char* kDemonLordNameKey = "demon_lord_name";

// One playthrough. Owned by the session; attributes change only through the engine.
struct StoryState
{
    std::string name = "Nameless";
    int chapter = 0;                    // 0 = not started (forces the intro scene)
    std::string location = "Demon Forest";

    int health = 80;                    // [0,100]
    int power = 20;                     // [0,100]
    int morality = 0;                   // [-100,100] ruthless .. noble
    int notoriety = 0;                  // [0,100]
    int trustDemonLord = 10;            // [0,100]
    int bondDemonLord = 0;              // [0,100], only ever increases

    std::vector<std::string> inventory{"Torn Cloak", "Rusty Sword"};
    std::map<std::string, bool> flags;
    std::string demonLordName;          // empty until the intro assigns one
    std::vector<std::string> history;

    std::uint64_t seed = kDefaultSeed;

    [[nodiscard]] bool Flag(std::string_view key, bool fallback = false) const;
    void SetFlag(const std::string& key, bool value);

    // Lazy initialization: writes `value` only when `key` was never set. Returns true if written.
    bool SetFlagIfAbsent(const std::string& key, bool value);

    // Appends unless already carried; keeps first-seen order. Returns true if added.
    bool AddItem(const std::string& item);
    [[nodiscard]] bool HasItem(std::string_view item) const;

    void AddHistory(std::string line) { history.push_back(std::move(line)); }

    // Frozen name, or "the Demon Lord" before the intro ran.
    [[nodiscard]] std::string DemonLordDisplayName() const;

    friend bool operator==(const StoryState& a, const StoryState& b);
    friend bool operator!=(const StoryState& a, const StoryState& b) { return !(a == b); }
};

// Fresh playthrough with the starter flag set.
[[nodiscard]] StoryState NewPlaythrough(std::string name, std::uint64_t seed);

// Seed from the player's name and the wall clock (32-bit, collision-resistant, not cryptographic).
[[nodiscard]] std::uint64_t DeriveSeed(std::string_view name, std::int64_t clockTicks) noexcept;

// Flat JSON object of primitives (plus the flags object and string arrays).
[[nodiscard]] nlohmann::json ToJson(const StoryState& st);

// Missing keys take the default-constructed value; containers are rebuilt.
// On a malformed payload returns false, fills `outError` and leaves `out` untouched.
[[nodiscard]] bool FromJson(const nlohmann::json& j, StoryState& out, std::string* outError = nullptr);

} // namespace lore::story
