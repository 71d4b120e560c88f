#include "app/App.h"
#include "app/Display.h"

#include "core/Config.h"
#include "core/Log.h"
#include "core/Paths.h"
#include "story/StoryState.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <istream>
#include <ostream>
#include <string>

#include <spdlog/spdlog.h>

namespace lore::app {

namespace {

[[nodiscard]] std::string Trim(std::string s)
{
    const auto notSpace = [](unsigned char c) { return std::isspace(c) == 0; };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

[[nodiscard]] std::string Lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

[[nodiscard]] std::uint64_t SeedFor(const std::string& name, std::optional<std::uint64_t> fixedSeed)
{
    if (fixedSeed)
        return *fixedSeed;
    const auto ticks = std::chrono::system_clock::now().time_since_epoch().count();
    return story::DeriveSeed(name, static_cast<std::int64_t>(ticks));
}

// Surrounding blanks are stripped; the player's casing is kept.
[[nodiscard]] std::string NameOrDefault(std::string name)
{
    name = Trim(std::move(name));
    return name.empty() ? story::StoryState{}.name : name;
}

SessionOutcome RunSession(story::StoryState state,
                          const save::SaveManager& saves,
                          const SessionOptions& options,
                          std::istream& in,
                          std::ostream& out)
{
    Session session(std::move(state), saves, in, out, options);
    return session.Run();
}

} // namespace

int RunMainMenu(const save::SaveManager& saves,
                const SessionOptions& options,
                std::istream& in,
                std::ostream& out,
                std::optional<std::uint64_t> fixedSeed)
{
    for (;;)
    {
        out << AsciiTitle() << '\n';
        out << "1) New Game\n";
        out << "2) Load Game\n";
        out << "3) Quit\n";
        out << "\nSelect: " << std::flush;

        std::string line;
        if (!std::getline(in, line))
        {
            out << "\nExiting. Your legend rests, for now.\n";
            return kExitOk;
        }

        const std::string choice = Lower(Trim(line));

        if (choice == "1" || choice == "n" || choice == "new" || choice == "new game")
        {
            out << AsciiTitle() << '\n';
            out << "Welcome to A Game Of Lore.\n\n";
            out << "What name shall your legend carry? " << std::flush;

            std::string name;
            if (!std::getline(in, name))
                return kExitOk;
            name = NameOrDefault(std::move(name));

            const std::uint64_t seed = SeedFor(name, fixedSeed);
            spdlog::info("Menu: new game '{}' seed {}", name, seed);

            if (RunSession(story::NewPlaythrough(name, seed), saves, options, in, out) == SessionOutcome::EndOfInput)
                return kExitOk;
        }
        else if (choice == "2" || choice == "l" || choice == "load" || choice == "load game")
        {
            out << "Enter slot number (1-" << saves.slotCount() << "): " << std::flush;

            std::string slotText;
            if (!std::getline(in, slotText))
                return kExitOk;
            slotText = Trim(slotText);

            const bool digits = !slotText.empty() && slotText.size() <= 4 &&
                std::all_of(slotText.begin(), slotText.end(),
                            [](unsigned char c) { return std::isdigit(c) != 0; });
            if (!digits)
            {
                out << "Invalid slot.\n";
                continue;
            }

            story::StoryState loaded;
            std::string err;
            if (saves.Load(std::stoi(slotText), loaded, &err) != save::SaveStatus::Ok)
            {
                out << "Could not load: " << err << '\n';
                out << "Press Enter to continue..." << std::flush;
                std::string ignored;
                if (!std::getline(in, ignored))
                    return kExitOk;
                continue;
            }

            if (RunSession(std::move(loaded), saves, options, in, out) == SessionOutcome::EndOfInput)
                return kExitOk;
        }
        else if (choice == "3" || choice == "q" || choice == "quit" || choice == "exit")
        {
            out << "Goodbye.\n";
            return kExitOk;
        }
        else
        {
            out << "Please choose 1, 2, or 3.\n\n";
        }
    }
}

int AppMain(const CommandLineArgs& args, std::istream& in, std::ostream& out, std::ostream& err)
{
    if (args.showHelp)
    {
        out << BuildCommandLineHelpText();
        return kExitOk;
    }

    if (!args.unknown.empty())
    {
        err << "Unknown command line option(s):\n";
        for (const auto& u : args.unknown)
            err << "  " << u << '\n';
        err << '\n' << BuildCommandLineHelpText();
        return kExitBadCommandLine;
    }

    // ----- Logging first, so config problems end up in the log -----
    if (!core::LogInit(core::paths::LogsDir()))
        err << "Warning: file logging is unavailable.\n";

    // ----- Config -----
    core::Config cfg;
    const bool explicitConfig = args.configPath.has_value();
    const std::filesystem::path configFile =
        explicitConfig ? std::filesystem::path(*args.configPath) : core::paths::ConfigFile();

    if (!core::LoadConfig(cfg, configFile))
    {
        if (explicitConfig)
        {
            spdlog::warn("AppMain: config {} not readable, using defaults", configFile.string());
        }
        else
        {
            // First run: leave a default file for the player to edit.
            core::paths::EnsureCreated(configFile.parent_path());
            if (core::SaveConfig(cfg, configFile))
                spdlog::info("AppMain: wrote default config {}", configFile.string());
        }
    }

    const std::string levelText = args.logLevel.value_or(cfg.logLevel);
    spdlog::level::level_enum level = spdlog::level::info;
    if (core::ParseLogLevel(levelText, level))
        spdlog::set_level(level);
    else
        spdlog::warn("AppMain: unknown log level '{}', keeping info", levelText);

    // ----- Saves -----
    const std::filesystem::path saveDir =
        args.saveDir ? std::filesystem::path(*args.saveDir) : core::ResolveSaveDir(cfg);
    core::paths::EnsureCreated(saveDir);
    const save::SaveManager saves(saveDir, cfg.saveSlots);

    SessionOptions options;
    options.driftChance = cfg.driftChance;
    options.showHelpOnStart = cfg.showHelpOnStart;

    spdlog::info("AppMain: saves in {} ({} slots)", saveDir.string(), saves.slotCount());

    int exitCode = kExitOk;
    if (args.loadSlot)
    {
        story::StoryState loaded;
        std::string loadErr;
        if (saves.Load(*args.loadSlot, loaded, &loadErr) != save::SaveStatus::Ok)
        {
            err << "Could not load slot " << *args.loadSlot << ": " << loadErr << '\n';
            exitCode = kExitLoadFailed;
        }
        else
        {
            RunSession(std::move(loaded), saves, options, in, out);
        }
    }
    else if (args.name || args.seed)
    {
        const std::string name = NameOrDefault(args.name.value_or(std::string()));
        const std::uint64_t seed = SeedFor(name, args.seed);
        spdlog::info("AppMain: new game '{}' seed {}", name, seed);
        RunSession(story::NewPlaythrough(name, seed), saves, options, in, out);
    }
    else
    {
        exitCode = RunMainMenu(saves, options, in, out);
    }

    core::LogShutdown();
    return exitCode;
}

} // namespace lore::app
