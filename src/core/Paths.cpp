// src/core/Paths.cpp
#include "core/Paths.h"

#include <cstdlib>
#include <system_error>

namespace {
  const char* kVendor = "lore";

  // Non-empty environment value, or nullptr.
  const char* Env(const char* name) {
    const char* v = std::getenv(name);
    return (v && v[0] != '\0') ? v : nullptr;
  }

  std::filesystem::path HomeRelative(const char* xdgVar, const char* fallback) {
    if (const char* xdg = Env(xdgVar))
      return std::filesystem::path(xdg);
    if (const char* home = Env("HOME"))
      return std::filesystem::path(home) / fallback;
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    return ec ? std::filesystem::path(".") : tmp;
  }
}

namespace lore::core::paths {
  std::filesystem::path DataRoot() {
    return HomeRelative("XDG_DATA_HOME", ".local/share") / kVendor;
  }
  std::filesystem::path SavesDir() { return DataRoot() / "saves"; }
  std::filesystem::path LogsDir()  { return DataRoot() / "logs"; }

  std::filesystem::path ConfigFile() {
    return HomeRelative("XDG_CONFIG_HOME", ".config") / kVendor / "lore.ini";
  }

  void EnsureCreated(const std::filesystem::path& p) {
    std::error_code ec;
    std::filesystem::create_directories(p, ec);
  }
}
