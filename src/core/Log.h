// src/core/Log.h
#pragma once

#include <filesystem>
#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace lore::core {

// Install the "lore" default logger: rotating file under `logDir` (lore.log, 1MB * 4).
// Stdout belongs to the story text, so nothing is logged to the console once this ran.
// Returns false when the sink could not be created; logging then stays on spdlog's default.
bool LogInit(const std::filesystem::path& logDir,
             spdlog::level::level_enum level = spdlog::level::info);

// Flush the file logger installed by LogInit and detach it; later log calls go nowhere.
void LogShutdown();

// "trace", "debug", "info", "warn"/"warning", "error"/"err", "critical", "off" (case-insensitive).
[[nodiscard]] bool ParseLogLevel(std::string_view text, spdlog::level::level_enum& out) noexcept;

} // namespace lore::core
