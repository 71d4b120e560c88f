#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lore::app {

// Parsed command-line arguments for the lore executable.
//
// Notes:
//   - All option names are case-insensitive; values keep their case.
//   - Both "--opt=value" and "--opt value" forms are supported.
struct CommandLineArgs
{
    bool showHelp = false;                  // --help / -h / -?

    std::optional<std::string> name;        // --name <text>      start a new game directly
    std::optional<std::uint64_t> seed;      // --seed <n>         fixed seed for a new game
    std::optional<int> loadSlot;            // --load <slot>      resume a save
    std::optional<std::string> configPath;  // --config <path>
    std::optional<std::string> saveDir;     // --save-dir <path>
    std::optional<std::string> logLevel;    // --log-level <lvl>

    // Any unknown/unsupported args are collected here (so we can show a useful error).
    std::vector<std::string> unknown;
};

// argv[0] is the program name and is skipped.
[[nodiscard]] CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv);
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, char** argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace lore::app
