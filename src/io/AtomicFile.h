// src/io/AtomicFile.h
//
// Whole-file I/O for save slots and lore.ini.
//
// write_atomic stages the bytes in "<target>.tmp" beside the target, closes it,
// then renames it into place. A reader never observes a half-written slot.
// When asked, the previous target survives as "<target>.bak".

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace lore::io {

namespace fs = std::filesystem;

// Creates missing parent directories. On failure `err` (if given) explains why
// and the previous target, if any, is left as it was.
[[nodiscard]] bool write_atomic(const fs::path& final_path,
                                std::string_view bytes,
                                std::string* err = nullptr,
                                bool make_backup = true);

// `out` is only touched on success.
[[nodiscard]] bool read_all(const fs::path& path,
                            std::string& out,
                            std::string* err = nullptr);

[[nodiscard]] inline fs::path default_backup_path(const fs::path& final_path)
{
    fs::path p = final_path;
    p += ".bak";
    return p;
}

} // namespace lore::io
