#include "core/Config.h"
#include "core/Log.h"
#include "core/Paths.h"
#include "io/AtomicFile.h"

#include <array>
#include <charconv>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <string_view>
#include <system_error>

namespace lore::core {

namespace {

[[nodiscard]] std::string_view Trimmed(std::string_view s) noexcept
{
    const auto blank = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!s.empty() && blank(s.front())) s.remove_prefix(1);
    while (!s.empty() && blank(s.back()))  s.remove_suffix(1);
    return s;
}

// "8   # slots" -> "8". Recognizes '#', ';' and '//' anywhere in the value.
[[nodiscard]] std::string_view WithoutInlineComment(std::string_view v) noexcept
{
    std::size_t cut = v.size();
    for (std::string_view marker : {std::string_view("#"), std::string_view(";"), std::string_view("//")})
    {
        const std::size_t p = v.find(marker);
        if (p != std::string_view::npos && p < cut) cut = p;
    }
    return Trimmed(v.substr(0, cut));
}

[[nodiscard]] bool ParseInt(std::string_view sv, int& out) noexcept
{
    int v = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
    if (ec != std::errc{} || ptr != sv.data() + sv.size())
        return false;
    out = v;
    return true;
}

// strtod needs a terminated buffer; from_chars(double) is still patchy across standard libraries.
[[nodiscard]] bool ParseDouble(std::string_view sv, double& out)
{
    if (sv.empty())
        return false;

    const std::string s(sv);
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size())
        return false;
    out = v;
    return true;
}

[[nodiscard]] bool SameIgnoringCase(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

[[nodiscard]] bool ParseBool(std::string_view sv, bool& out) noexcept
{
    struct Spelling { std::string_view text; bool value; };
    static constexpr std::array<Spelling, 8> kSpellings{{
        {"1", true},  {"true", true},   {"yes", true}, {"on", true},
        {"0", false}, {"false", false}, {"no", false}, {"off", false},
    }};

    for (const auto& s : kSpellings)
    {
        if (SameIgnoringCase(sv, s.text))
        {
            out = s.value;
            return true;
        }
    }
    return false;
}

void StripUtf8Bom(std::string& text)
{
    if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF)
        text.erase(0, 3);
}

} // namespace

bool LoadConfig(Config& cfg, const std::filesystem::path& file)
{
    std::error_code ec;
    if (!std::filesystem::exists(file, ec))
        return false; // first run

    std::string text;
    std::string err;
    if (!io::read_all(file, text, &err))
    {
        spdlog::warn("LoadConfig: failed to read {} ({})", file.string(), err);
        return false;
    }
    StripUtf8Bom(text);

    const std::string where = file.string();
    const auto reject = [&](int lineNo, std::string_view key, std::string_view value) {
        spdlog::warn("LoadConfig: {}:{} bad {} '{}'", where, lineNo, key, value);
    };

    std::istringstream lines(text);
    std::string raw;
    int lineNo = 0;
    while (std::getline(lines, raw))
    {
        ++lineNo;

        const std::string_view line = Trimmed(raw);
        if (line.empty() || line.front() == '#' || line.front() == ';')
            continue;

        const auto eq = line.find('=');
        if (eq == std::string_view::npos)
            continue;

        const std::string_view key = Trimmed(line.substr(0, eq));
        if (key.empty())
            continue;

        // saveDir is taken verbatim; paths may contain '#' or ';'.
        if (key == "saveDir")
        {
            cfg.saveDir = std::filesystem::path(std::string(Trimmed(line.substr(eq + 1))));
            continue;
        }

        const std::string_view value = WithoutInlineComment(line.substr(eq + 1));
        if (key == "saveSlots")
        {
            int slots = 0;
            if (ParseInt(value, slots) && slots >= 1 && slots <= 99)
                cfg.saveSlots = slots;
            else
                reject(lineNo, key, value);
        }
        else if (key == "driftChance")
        {
            double p = 0.0;
            if (ParseDouble(value, p) && p >= 0.0 && p <= 1.0)
                cfg.driftChance = p;
            else
                reject(lineNo, key, value);
        }
        else if (key == "logLevel")
        {
            spdlog::level::level_enum lvl{};
            if (ParseLogLevel(value, lvl))
                cfg.logLevel = std::string(value);
            else
                reject(lineNo, key, value);
        }
        else if (key == "showHelpOnStart")
        {
            bool show = cfg.showHelpOnStart;
            if (ParseBool(value, show))
                cfg.showHelpOnStart = show;
            else
                reject(lineNo, key, value);
        }
        else
        {
            spdlog::debug("LoadConfig: ignoring unknown key '{}'", key);
        }
    }

    return true;
}

bool SaveConfig(const Config& cfg, const std::filesystem::path& file)
{
    std::ostringstream out;
    out << "# A Game Of Lore settings\n";
    if (!cfg.saveDir.empty())
        out << "saveDir="     << cfg.saveDir.string() << "\n";
    out << "saveSlots="       << cfg.saveSlots << "\n";
    out << "driftChance="     << cfg.driftChance << "\n";
    out << "logLevel="        << cfg.logLevel << "\n";
    out << "showHelpOnStart=" << (cfg.showHelpOnStart ? "true" : "false") << "\n";

    std::string err;
    if (!io::write_atomic(file, out.str(), &err, /*make_backup=*/false))
    {
        spdlog::error("SaveConfig: write failed for {} ({})", file.string(), err);
        return false;
    }
    return true;
}

std::filesystem::path ResolveSaveDir(const Config& cfg)
{
    return cfg.saveDir.empty() ? paths::SavesDir() : cfg.saveDir;
}

} // namespace lore::core
