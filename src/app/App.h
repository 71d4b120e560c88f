#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>

#include "app/CommandLineArgs.h"
#include "app/Session.h"
#include "save/SaveManager.h"

namespace lore::app {

// Exit codes returned by AppMain.
inline constexpr int kExitOk             = 0;
inline constexpr int kExitLoadFailed     = 1;
inline constexpr int kExitBadCommandLine = 2;

// New Game / Load Game / Quit, looping until Quit or end of input.
// `fixedSeed` replaces the name+clock seed derivation for new games.
int RunMainMenu(const save::SaveManager& saves,
                const SessionOptions& options,
                std::istream& in,
                std::ostream& out,
                std::optional<std::uint64_t> fixedSeed = std::nullopt);

// Full program: command line, config, logging, then a direct session or the main menu.
int AppMain(const CommandLineArgs& args, std::istream& in, std::ostream& out, std::ostream& err);

} // namespace lore::app
