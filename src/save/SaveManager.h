#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "save/SaveFormat.h"
#include "story/StoryState.h"

namespace lore::save {

namespace fs = std::filesystem;

enum class SaveStatus : std::uint8_t {
    Ok = 0,
    InvalidSlot,   // outside 1..slotCount; rejected before any IO
    NotFound,      // load of an empty slot
    IoError,
    ParseError,    // unreadable or malformed container / state payload
};

[[nodiscard]] const char* SaveStatusName(SaveStatus s) noexcept;

struct SlotInfo {
    int slot = 0;
    // When the save was written (Unix seconds, UTC). 0 if unknown.
    std::int64_t savedUnixSecondsUtc = 0;
    std::string playerName;
    int chapter = 0;
    bool readable = false;
};

// One JSON file per numbered slot: <dir>/slot_<n>.json
class SaveManager {
public:
    explicit SaveManager(fs::path dir, int slotCount = savefmt::kDefaultSlots);

    [[nodiscard]] int slotCount() const noexcept { return m_slotCount; }

    [[nodiscard]] bool IsValidSlot(int slot) const noexcept { return slot >= 1 && slot <= m_slotCount; }
    [[nodiscard]] fs::path SlotPath(int slot) const;

    // Writes {format, version, timestamp, state} atomically. `outPath` receives the file written.
    [[nodiscard]] SaveStatus Save(int slot, const story::StoryState& state,
                                  std::string* outError = nullptr,
                                  fs::path* outPath = nullptr) const;

    // On any failure `out` is left untouched.
    [[nodiscard]] SaveStatus Load(int slot, story::StoryState& out,
                                  std::string* outError = nullptr) const;

    // Occupied slots in ascending order. Unreadable files are listed with readable = false.
    [[nodiscard]] std::vector<SlotInfo> ListSaves() const;

private:
    fs::path m_dir;
    int m_slotCount = savefmt::kDefaultSlots;
};

// Formats a Unix timestamp (seconds, UTC) as local time "YYYY-MM-DD HH:MM:SS".
// Returns an empty string if unixSecondsUtc <= 0.
[[nodiscard]] std::string FormatLocalTime(std::int64_t unixSecondsUtc) noexcept;

[[nodiscard]] std::int64_t UnixSecondsUtcNow() noexcept;

} // namespace lore::save
