#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string_view>

#include "save/SaveManager.h"
#include "story/Endings.h"
#include "story/StoryEngine.h"
#include "story/StoryState.h"

namespace lore::app {

enum class CommandKind : std::uint8_t
{
    None = 0,   // not a command (choice number or noise)
    Help,
    Stats,
    Slots,
    Quit,
    Save,
    Load,
};

struct Command
{
    CommandKind kind = CommandKind::None;
    std::optional<int> slot; // save/load only; empty when the argument is missing or not a number
};

// Case-insensitive; extra words after the command are ignored.
[[nodiscard]] Command ParseCommand(std::string_view line);

struct SessionOptions
{
    double driftChance = 0.15;
    bool showHelpOnStart = true;
};

enum class SessionOutcome : std::uint8_t
{
    Ending,      // an ending predicate matched
    Quit,        // the player typed quit
    EndOfInput,  // input stream closed; treated like quit
};

// One playthrough: ending check -> render -> display -> input, until an ending or quit.
//
// The session owns the state record and the engine; the engine is seeded from
// state.seed on construction and again after every successful load.
class Session
{
public:
    Session(story::StoryState state,
            const save::SaveManager& saves,
            std::istream& in,
            std::ostream& out,
            SessionOptions options = {});

    SessionOutcome Run();

    [[nodiscard]] const story::StoryState& state() const noexcept { return m_state; }
    [[nodiscard]] const std::optional<story::Ending>& ending() const noexcept { return m_ending; }

private:
    enum class TurnResult : std::uint8_t { Advance, Rerender, Quit, EndOfInput };

    TurnResult ReadTurn(const story::Scene& scene);
    void HandleSave(const Command& cmd);
    bool HandleLoad(const Command& cmd);
    void ApplyNumberedChoice(const story::Scene& scene, int index);

    story::StoryState m_state;
    story::StoryEngine m_engine;
    const save::SaveManager& m_saves;
    std::istream& m_in;
    std::ostream& m_out;
    SessionOptions m_options;
    std::optional<story::Ending> m_ending;
};

} // namespace lore::app
