#include "io/AtomicFile.h"

#include <fstream>
#include <system_error>

namespace {
    bool write_temp_and_flush(const std::filesystem::path& temp, std::string_view bytes, std::string* err) {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            if (err) *err = "cannot open " + temp.string() + " for writing";
            return false;
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            if (err) *err = "write failed for " + temp.string();
            return false;
        }
        out.close();
        return true;
    }
}

namespace lore::io {
    bool write_atomic(const std::filesystem::path& path,
                      std::string_view bytes,
                      std::string* err,
                      bool make_backup)
    {
        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                if (err) *err = "create_directories failed: " + ec.message();
                return false;
            }
        }

        auto tmp = path; tmp += ".tmp";

        if (!write_temp_and_flush(tmp, bytes, err)) {
            std::filesystem::remove(tmp, ec);
            return false;
        }

        if (make_backup && std::filesystem::exists(path, ec)) {
            // A failed backup is not fatal; the new contents still get published.
            std::filesystem::copy_file(path, default_backup_path(path),
                                       std::filesystem::copy_options::overwrite_existing, ec);
        }

        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            if (err) *err = "rename failed: " + ec.message();
            std::error_code rmEc;
            std::filesystem::remove(tmp, rmEc);
            return false;
        }
        return true;
    }

    bool read_all(const std::filesystem::path& p, std::string& out, std::string* err) {
        std::ifstream in(p, std::ios::binary);
        if (!in) { if (err) *err = "open failed: " + p.string(); return false; }
        in.seekg(0, std::ios::end);
        const auto sz = in.tellg();
        if (sz < 0) { if (err) *err = "size query failed: " + p.string(); return false; }
        in.seekg(0, std::ios::beg);
        std::string buf(static_cast<size_t>(sz), '\0');
        if (sz > 0) in.read(buf.data(), sz);
        if (!in) { if (err) *err = "read failed: " + p.string(); return false; }
        out = std::move(buf);
        return true;
    }
}
