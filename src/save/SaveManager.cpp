#include "save/SaveManager.h"

#include "io/AtomicFile.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <limits>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace lore::save {

namespace {

using json = nlohmann::json;

constexpr std::size_t kMaxSaveFileBytes = 4u * 1024u * 1024u;

void SetError(std::string* outError, std::string msg)
{
    if (outError) *outError = std::move(msg);
}

// Reads the slot file and checks format/version; the payload is left unparsed.
[[nodiscard]] SaveStatus ReadContainer(const fs::path& path, json& outContainer, std::string* outError)
{
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec)
    {
        SetError(outError, "Failed to stat save file: " + ec.message() + ".");
        return SaveStatus::IoError;
    }
    if (size > kMaxSaveFileBytes)
    {
        SetError(outError, "Save file is too large.");
        return SaveStatus::ParseError;
    }

    std::string text;
    std::string err;
    if (!io::read_all(path, text, &err))
    {
        SetError(outError, "Failed to read save file: " + err + ".");
        return SaveStatus::IoError;
    }

    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object())
    {
        SetError(outError, "Save JSON parse failed.");
        return SaveStatus::ParseError;
    }

    if (j.contains("format"))
    {
        const auto& fmt = j["format"];
        if (!fmt.is_string() || fmt.get<std::string>() != savefmt::kFormat)
        {
            SetError(outError, "Unsupported save format.");
            return SaveStatus::ParseError;
        }
    }

    if (j.contains("version"))
    {
        const auto& v = j["version"];
        const bool newer = v.is_number_unsigned()
                               ? v.get<std::uint64_t>() > static_cast<std::uint64_t>(savefmt::kVersion)
                               : v.is_number_integer() && v.get<std::int64_t>() > savefmt::kVersion;
        if (!v.is_number_integer() || newer)
        {
            SetError(outError, "Save was written by a newer version.");
            return SaveStatus::ParseError;
        }
    }

    outContainer = std::move(j);
    return SaveStatus::Ok;
}

[[nodiscard]] std::int64_t TimestampOf(const json& container) noexcept
{
    const auto it = container.find("timestamp");
    if (it == container.end() || !it->is_number_integer())
        return 0;
    if (it->is_number_unsigned())
    {
        constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        const auto u = it->get<std::uint64_t>();
        return static_cast<std::int64_t>(u > kMax ? kMax : u);
    }
    return it->get<std::int64_t>();
}

} // namespace

const char* SaveStatusName(SaveStatus s) noexcept
{
    switch (s)
    {
    case SaveStatus::Ok:          return "ok";
    case SaveStatus::InvalidSlot: return "invalid slot";
    case SaveStatus::NotFound:    return "not found";
    case SaveStatus::IoError:     return "io error";
    case SaveStatus::ParseError:  return "parse error";
    }
    return "?";
}

SaveManager::SaveManager(fs::path dir, int slotCount)
    : m_dir(std::move(dir))
    , m_slotCount(slotCount < 1 ? 1 : slotCount)
{
}

fs::path SaveManager::SlotPath(int slot) const
{
    return m_dir / ("slot_" + std::to_string(slot) + ".json");
}

SaveStatus SaveManager::Save(int slot, const story::StoryState& state,
                             std::string* outError, fs::path* outPath) const
{
    if (!IsValidSlot(slot))
    {
        SetError(outError, "Slot must be between 1 and " + std::to_string(m_slotCount) + ".");
        return SaveStatus::InvalidSlot;
    }

    json container;
    container["format"]    = savefmt::kFormat;
    container["version"]   = savefmt::kVersion;
    container["timestamp"] = UnixSecondsUtcNow();
    container["state"]     = story::ToJson(state);

    const fs::path path = SlotPath(slot);

    std::string err;
    if (!io::write_atomic(path, container.dump(2), &err, /*make_backup=*/true))
    {
        spdlog::error("SaveManager: slot {} write failed ({})", slot, err);
        SetError(outError, "Failed to write " + path.string() + ": " + err);
        return SaveStatus::IoError;
    }

    spdlog::info("SaveManager: saved slot {} ({}, chapter {})", slot, state.name, state.chapter);
    if (outPath) *outPath = path;
    return SaveStatus::Ok;
}

SaveStatus SaveManager::Load(int slot, story::StoryState& out, std::string* outError) const
{
    if (!IsValidSlot(slot))
    {
        SetError(outError, "Slot must be between 1 and " + std::to_string(m_slotCount) + ".");
        return SaveStatus::InvalidSlot;
    }

    const fs::path path = SlotPath(slot);
    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        SetError(outError, "No save found in slot " + std::to_string(slot) + ".");
        return SaveStatus::NotFound;
    }

    json container;
    const SaveStatus st = ReadContainer(path, container, outError);
    if (st != SaveStatus::Ok)
    {
        spdlog::warn("SaveManager: slot {} unreadable ({})", slot, SaveStatusName(st));
        return st;
    }

    // Older containers may lack "state"; an empty object loads as a default record.
    const json payload = container.contains("state") ? container["state"] : json::object();

    story::StoryState loaded;
    std::string err;
    if (!story::FromJson(payload, loaded, &err))
    {
        spdlog::warn("SaveManager: slot {} has a malformed state ({})", slot, err);
        SetError(outError, err);
        return SaveStatus::ParseError;
    }

    spdlog::info("SaveManager: loaded slot {} ({}, chapter {})", slot, loaded.name, loaded.chapter);
    out = std::move(loaded);
    return SaveStatus::Ok;
}

std::vector<SlotInfo> SaveManager::ListSaves() const
{
    std::vector<SlotInfo> result;
    for (int s = 1; s <= m_slotCount; ++s)
    {
        const fs::path path = SlotPath(s);
        std::error_code ec;
        if (!fs::exists(path, ec))
            continue;

        SlotInfo info;
        info.slot = s;

        json container;
        if (ReadContainer(path, container, nullptr) == SaveStatus::Ok)
        {
            info.savedUnixSecondsUtc = TimestampOf(container);
            const auto it = container.find("state");
            if (it != container.end() && it->is_object())
            {
                const auto name = it->find("name");
                if (name != it->end() && name->is_string())
                    info.playerName = name->get<std::string>();
                const auto chapter = it->find("chapter");
                if (chapter != it->end() && chapter->is_number_integer())
                {
                    constexpr std::int64_t kMax = std::numeric_limits<int>::max();
                    const std::int64_t c = chapter->is_number_unsigned()
                        ? static_cast<std::int64_t>(std::min<std::uint64_t>(chapter->get<std::uint64_t>(), kMax))
                        : chapter->get<std::int64_t>();
                    info.chapter = static_cast<int>(std::clamp<std::int64_t>(c, 0, kMax));
                }
            }
            info.readable = true;
        }

        result.push_back(std::move(info));
    }
    return result;
}

std::string FormatLocalTime(std::int64_t unixSecondsUtc) noexcept
{
    if (unixSecondsUtc <= 0)
        return {};

    std::time_t tt = static_cast<std::time_t>(unixSecondsUtc);
    std::tm tm{};

#if defined(_WIN32)
    if (localtime_s(&tm, &tt) != 0)
        return {};
#else
    if (!localtime_r(&tt, &tm))
        return {};
#endif

    char buf[64] = {};
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm) == 0)
        return {};
    return std::string(buf);
}

std::int64_t UnixSecondsUtcNow() noexcept
{
    const auto now = std::chrono::system_clock::now();
    const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(now);
    return static_cast<std::int64_t>(secs.time_since_epoch().count());
}

} // namespace lore::save
