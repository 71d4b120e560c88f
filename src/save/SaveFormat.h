#pragma once

// Save-slot container identifiers, shared by SaveManager and anything that inspects slots.
//
// NOTE: containers without a "format" key (early saves) are still accepted on load.

namespace lore::save::savefmt {

inline constexpr const char* kFormat = "Lore.Save";
// Version history (slot JSON)
//  v1: { format, version, timestamp, state }
inline constexpr int         kVersion = 1;

inline constexpr int         kDefaultSlots = 8;

} // namespace lore::save::savefmt
