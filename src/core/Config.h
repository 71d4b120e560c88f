#pragma once
#include <filesystem>
#include <string>

namespace lore::core {

struct Config {
    std::filesystem::path saveDir;            // empty: paths::SavesDir()
    int    saveSlots       = 8;               // 1..99
    double driftChance     = 0.15;            // incidental health drift per applied choice
    std::string logLevel   = "info";
    bool   showHelpOnStart = true;
};

// Tiny INI reader/writer (key=value). A missing file returns false and leaves `cfg` untouched.
bool LoadConfig(Config& cfg, const std::filesystem::path& file);
bool SaveConfig(const Config& cfg, const std::filesystem::path& file);

// saveDir with the platform default applied.
std::filesystem::path ResolveSaveDir(const Config& cfg);

} // namespace lore::core
