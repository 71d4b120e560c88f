#include "app/CommandLineArgs.h"

#include <cctype>
#include <limits>
#include <sstream>

namespace lore::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// "--opt=value": `loweredArg` is matched against `prefix`, the value is cut from `rawArg`.
[[nodiscard]] bool ConsumeValue(std::string_view loweredArg,
                                std::string_view rawArg,
                                std::string_view prefix,
                                std::string_view& outValue)
{
    if (!StartsWith(loweredArg, prefix))
        return false;

    const std::size_t n = prefix.size();
    if (loweredArg.size() == n || loweredArg[n] != '=')
        return false;

    outValue = rawArg.substr(n + 1);
    return true;
}

[[nodiscard]] std::optional<std::uint64_t> ParseUnsigned(std::string_view s)
{
    if (s.empty())
        return std::nullopt;

    std::uint64_t v = 0;
    for (char c : s)
    {
        if (c < '0' || c > '9')
            return std::nullopt;
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (v > (std::numeric_limits<std::uint64_t>::max() - digit) / 10)
            return std::nullopt; // overflow
        v = v * 10 + digit;
    }
    return v;
}

[[nodiscard]] std::optional<int> ParseSlot(std::string_view s)
{
    const auto v = ParseUnsigned(s);
    if (!v || *v > 1000)
        return std::nullopt;
    return static_cast<int>(*v);
}

} // namespace

CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv)
{
    CommandLineArgs out;

    const std::size_t argc = argv.size();
    for (std::size_t i = 1; i < argc; ++i)
    {
        const std::string_view raw = argv[i];
        if (raw.empty())
            continue;

        const std::string lowered = ToLower(raw);
        const std::string_view arg(lowered);

        if (arg == "--help" || arg == "-h" || arg == "-?") {
            out.showHelp = true;
            continue;
        }

        std::string_view value;

        // "--opt value": returns false (and records the arg as unknown) when the value is missing.
        const auto takeNext = [&](std::string_view& dst) -> bool {
            if (i + 1 >= argc) {
                out.unknown.emplace_back(raw);
                return false;
            }
            dst = argv[++i];
            return true;
        };

        const auto setString = [&](std::optional<std::string>& dst, std::string_view v) {
            dst = std::string(v);
        };
        const auto setSeed = [&](std::string_view v) {
            if (const auto parsed = ParseUnsigned(v)) out.seed = *parsed;
            else out.unknown.emplace_back(raw);
        };
        const auto setSlot = [&](std::string_view v) {
            if (const auto parsed = ParseSlot(v)) out.loadSlot = *parsed;
            else out.unknown.emplace_back(raw);
        };

        if (arg == "--name")                              { if (takeNext(value)) setString(out.name, value); continue; }
        if (ConsumeValue(arg, raw, "--name", value))      { setString(out.name, value); continue; }

        if (arg == "--seed")                              { if (takeNext(value)) setSeed(value); continue; }
        if (ConsumeValue(arg, raw, "--seed", value))      { setSeed(value); continue; }

        if (arg == "--load")                              { if (takeNext(value)) setSlot(value); continue; }
        if (ConsumeValue(arg, raw, "--load", value))      { setSlot(value); continue; }

        if (arg == "--config")                            { if (takeNext(value)) setString(out.configPath, value); continue; }
        if (ConsumeValue(arg, raw, "--config", value))    { setString(out.configPath, value); continue; }

        if (arg == "--save-dir")                          { if (takeNext(value)) setString(out.saveDir, value); continue; }
        if (ConsumeValue(arg, raw, "--save-dir", value))  { setString(out.saveDir, value); continue; }

        if (arg == "--log-level")                         { if (takeNext(value)) setString(out.logLevel, value); continue; }
        if (ConsumeValue(arg, raw, "--log-level", value)) { setString(out.logLevel, value); continue; }

        // Anything else is unknown.
        out.unknown.emplace_back(raw);
    }

    return out;
}

CommandLineArgs ParseCommandLineArgs(int argc, char** argv)
{
    std::vector<std::string_view> v;
    v.reserve(argc > 0 ? static_cast<std::size_t>(argc) : 0u);
    for (int i = 0; i < argc; ++i)
        v.emplace_back(argv[i] ? argv[i] : "");
    return ParseCommandLineArgsFromArgv(v);
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream oss;
    oss << "A Game Of Lore - Command Line Options\n\n";
    oss << "Story\n";
    oss << "  --name <text>          Start a new game with this name (skips the menu)\n";
    oss << "  --seed <n>             Fixed seed for a new game (reproducible runs)\n";
    oss << "  --load <slot>          Resume the save in <slot>\n\n";

    oss << "Files\n";
    oss << "  --config <path>        Read settings from <path> instead of the per-user lore.ini\n";
    oss << "  --save-dir <path>      Directory holding slot_<n>.json files\n";
    oss << "  --log-level <lvl>      trace, debug, info, warn, error, critical, off\n\n";

    oss << "Misc\n";
    oss << "  --help, -h             Show this help\n\n";

    oss << "Examples\n";
    oss << "  lore --name Aren --seed 42\n";
    oss << "  lore --load 3 --log-level debug\n";
    return oss.str();
}

} // namespace lore::app
