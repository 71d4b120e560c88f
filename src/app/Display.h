#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "save/SaveManager.h"
#include "story/Endings.h"
#include "story/Scenes.h"
#include "story/StoryState.h"

namespace lore::app {

// Fixed-width title banner.
[[nodiscard]] const char* AsciiTitle() noexcept;

// In-game command reference; `slotCount` is the highest usable save slot.
[[nodiscard]] std::string HelpText(int slotCount);

void PrintStats(std::ostream& out, const story::StoryState& st);

// "[Chapter N] Location", narration, numbered choices and the command hint.
void PrintScene(std::ostream& out, const story::StoryState& st, const story::Scene& scene);

void PrintEnding(std::ostream& out, const story::Ending& ending);

void PrintSlots(std::ostream& out, const std::vector<save::SlotInfo>& slots, int slotCount);

} // namespace lore::app
