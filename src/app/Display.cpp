#include "app/Display.h"

#include <algorithm>
#include <sstream>

namespace lore::app {

namespace {

[[nodiscard]] std::string Join(const std::vector<std::string>& items, const char* sep)
{
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        if (i) out += sep;
        out += items[i];
    }
    return out;
}

} // namespace

const char* AsciiTitle() noexcept
{
    return R"(
  _        ___    ____    _____
 | |      / _ \  |  _ \  | ____|
 | |     | | | | | |_) | |  _|
 | |___  | |_| | |  _ <  | |___
 |_____|  \___/  |_| \_\ |_____|

          A   G A M E   O F   L O R E
)";
}

std::string HelpText(int slotCount)
{
    const std::string range = "1-" + std::to_string(slotCount);

    std::ostringstream oss;
    oss << "\nCommands you can type anytime:\n";
    oss << "  help           - show this help\n";
    oss << "  stats          - show your current stats\n";
    oss << "  save <slot>    - save to slot " << range << " (e.g., save 3)\n";
    oss << "  load <slot>    - load from slot " << range << " (e.g., load 2)\n";
    oss << "  slots          - list existing saves\n";
    oss << "  quit           - exit the game\n";
    return oss.str();
}

void PrintStats(std::ostream& out, const story::StoryState& st)
{
    out << "\n--- Stats ---\n";
    out << "Name: " << st.name << " | Chapter: " << st.chapter << " | Location: " << st.location << '\n';
    out << "Health: " << st.health << "  Power: " << st.power
        << "  Morality: " << st.morality << "  Notoriety: " << st.notoriety << '\n';
    out << "Trust (" << st.DemonLordDisplayName() << "): " << st.trustDemonLord
        << "  Bond: " << st.bondDemonLord << '\n';
    out << "Inventory: " << (st.inventory.empty() ? std::string("(empty)") : Join(st.inventory, ", ")) << '\n';

    // std::map iterates in key order, so the list is already sorted.
    std::vector<std::string> raised;
    for (const auto& [key, value] : st.flags)
        if (value) raised.push_back(key);
    if (!raised.empty())
        out << "Notable Flags: " << Join(raised, ", ") << '\n';

    out << "-------------\n\n";
}

void PrintScene(std::ostream& out, const story::StoryState& st, const story::Scene& scene)
{
    out << "\n[Chapter " << st.chapter << "] " << scene.location << "\n";
    out << "\n" << scene.text << "\n\n";

    int i = 1;
    for (const auto& c : scene.choices)
        out << "  " << i++ << ". " << c.text << '\n';
    out << "  (Or type a command: save <n>, load <n>, stats, slots, help, quit)\n";
}

void PrintEnding(std::ostream& out, const story::Ending& ending)
{
    out << "\n=== An Ending Unfolds ===\n";
    out << ending.title << "\n\n";
    out << ending.text << '\n';
    out << "\nThanks for playing A Game Of Lore.\n\n";
}

void PrintSlots(std::ostream& out, const std::vector<save::SlotInfo>& slots, int slotCount)
{
    if (slots.empty())
    {
        out << "No saves yet. Use: save <slot> (1-" << slotCount << ")\n";
        return;
    }

    out << "Existing saves:\n";
    for (const auto& s : slots)
    {
        std::string when = s.readable ? save::FormatLocalTime(s.savedUnixSecondsUtc) : std::string();
        if (when.empty()) when = "<unknown>";

        out << "  Slot " << s.slot << ": " << when;
        if (s.readable && !s.playerName.empty())
            out << "  (" << s.playerName << ", chapter " << s.chapter << ")";
        out << '\n';
    }
}

} // namespace lore::app
