#include "app/Session.h"
#include "app/Display.h"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>

namespace lore::app {

namespace {

[[nodiscard]] std::string Trim(std::string_view s)
{
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return std::string(s.substr(b, e - b));
}

[[nodiscard]] bool IsAllDigits(std::string_view s)
{
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

// Digits only, at most 4 significant ones ("0002" is 2); anything else is "not a number".
[[nodiscard]] std::optional<int> ParseSmallNumber(std::string_view s)
{
    if (!IsAllDigits(s))
        return std::nullopt;
    const auto first = s.find_first_not_of('0');
    s = first == std::string_view::npos ? std::string_view("0") : s.substr(first);
    if (s.size() > 4)
        return std::nullopt;
    int v = 0;
    for (char c : s) v = v * 10 + (c - '0');
    return v;
}

} // namespace

Command ParseCommand(std::string_view line)
{
    std::string lowered(line);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::istringstream words(lowered);
    std::string head;
    if (!(words >> head))
        return {};

    Command cmd;
    if (head == "help")       cmd.kind = CommandKind::Help;
    else if (head == "stats") cmd.kind = CommandKind::Stats;
    else if (head == "slots") cmd.kind = CommandKind::Slots;
    else if (head == "quit")  cmd.kind = CommandKind::Quit;
    else if (head == "save")  cmd.kind = CommandKind::Save;
    else if (head == "load")  cmd.kind = CommandKind::Load;
    else return {};

    if (cmd.kind == CommandKind::Save || cmd.kind == CommandKind::Load)
    {
        std::string arg;
        if (words >> arg)
            cmd.slot = ParseSmallNumber(arg);
    }
    return cmd;
}

Session::Session(story::StoryState state,
                 const save::SaveManager& saves,
                 std::istream& in,
                 std::ostream& out,
                 SessionOptions options)
    : m_state(std::move(state))
    , m_engine(m_state.seed)
    , m_saves(saves)
    , m_in(in)
    , m_out(out)
    , m_options(options)
{
}

SessionOutcome Session::Run()
{
    spdlog::info("Session: start '{}' chapter {} seed {}", m_state.name, m_state.chapter, m_state.seed);

    m_out << AsciiTitle() << '\n';
    m_out << "You can type 'help' at any time.\n";
    if (m_options.showHelpOnStart)
        m_out << HelpText(m_saves.slotCount());

    for (;;)
    {
        if (auto ending = m_engine.CheckEnding(m_state))
        {
            PrintEnding(m_out, *ending);
            m_ending = std::move(ending);
            return SessionOutcome::Ending;
        }

        const story::Scene scene = m_engine.RenderScene(m_state);
        PrintScene(m_out, m_state, scene);

        switch (ReadTurn(scene))
        {
        case TurnResult::Advance:
        case TurnResult::Rerender:
            break;
        case TurnResult::Quit:
            spdlog::info("Session: quit at chapter {}", m_state.chapter);
            return SessionOutcome::Quit;
        case TurnResult::EndOfInput:
            spdlog::info("Session: input closed at chapter {}", m_state.chapter);
            return SessionOutcome::EndOfInput;
        }
    }
}

Session::TurnResult Session::ReadTurn(const story::Scene& scene)
{
    for (;;)
    {
        m_out << "\nYour choice: " << std::flush;

        std::string line;
        if (!std::getline(m_in, line))
        {
            m_out << "\nFarewell, traveler.\n";
            return TurnResult::EndOfInput;
        }

        const std::string raw = Trim(line);
        const Command cmd = ParseCommand(raw);

        switch (cmd.kind)
        {
        case CommandKind::Help:
            m_out << HelpText(m_saves.slotCount());
            continue;
        case CommandKind::Stats:
            PrintStats(m_out, m_state);
            continue;
        case CommandKind::Slots:
            PrintSlots(m_out, m_saves.ListSaves(), m_saves.slotCount());
            continue;
        case CommandKind::Quit:
            m_out << "Farewell, traveler.\n";
            return TurnResult::Quit;
        case CommandKind::Save:
            HandleSave(cmd);
            continue;
        case CommandKind::Load:
            if (HandleLoad(cmd))
                return TurnResult::Rerender;
            continue;
        case CommandKind::None:
            break;
        }

        if (!IsAllDigits(raw))
        {
            m_out << "Type a choice number, or a command like 'save 1' or 'help'.\n";
            continue;
        }

        const auto index = ParseSmallNumber(raw);
        if (!index || *index < 1 || *index > static_cast<int>(scene.choices.size()))
        {
            m_out << "Pick a listed choice number.\n";
            continue;
        }

        ApplyNumberedChoice(scene, *index);
        return TurnResult::Advance;
    }
}

void Session::HandleSave(const Command& cmd)
{
    if (!cmd.slot)
    {
        m_out << "Usage: save <slot number 1-" << m_saves.slotCount() << ">\n";
        return;
    }

    std::string err;
    save::fs::path written;
    const auto status = m_saves.Save(*cmd.slot, m_state, &err, &written);
    if (status != save::SaveStatus::Ok)
    {
        m_out << "Save failed: " << err << '\n';
        return;
    }
    m_out << "Saved to Slot " << *cmd.slot << " (" << written.string() << ")\n";
}

bool Session::HandleLoad(const Command& cmd)
{
    if (!cmd.slot)
    {
        m_out << "Usage: load <slot number 1-" << m_saves.slotCount() << ">\n";
        return false;
    }

    std::string err;
    story::StoryState loaded;
    const auto status = m_saves.Load(*cmd.slot, loaded, &err);
    if (status != save::SaveStatus::Ok)
    {
        m_out << "Load failed: " << err << '\n';
        return false;
    }

    m_state = std::move(loaded);
    m_engine.Reseed(m_state.seed);

    m_out << "Loaded Slot " << *cmd.slot << ".\n";
    PrintStats(m_out, m_state);
    return true;
}

void Session::ApplyNumberedChoice(const story::Scene& scene, int index)
{
    const auto& choice = scene.choices[static_cast<std::size_t>(index - 1)];
    const std::string follow = m_engine.ApplyChoice(m_state, choice.tag);
    m_out << "\n" << follow << "\n";

    if (const auto drift = m_engine.ApplyIncidentalDrift(m_state, m_options.driftChance))
        spdlog::debug("Session: incidental drift {:+d} (health {})", *drift, m_state.health);
}

} // namespace lore::app
