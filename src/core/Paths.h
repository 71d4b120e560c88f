// src/core/Paths.h
#pragma once
#include <filesystem>

namespace lore::core::paths {
    // Per-user roots ($XDG_DATA_HOME/lore, else ~/.local/share/lore; temp dir as last resort).
    std::filesystem::path DataRoot();
    std::filesystem::path SavesDir();   // .../saves
    std::filesystem::path LogsDir();    // .../logs

    // $XDG_CONFIG_HOME/lore/lore.ini, else ~/.config/lore/lore.ini
    std::filesystem::path ConfigFile();

    void EnsureCreated(const std::filesystem::path& p);
}
