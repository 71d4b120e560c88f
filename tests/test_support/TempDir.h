// tests/test_support/TempDir.h
//
// Scratch directory under the system temp dir, removed on scope exit.
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>

namespace lore::test {

class TempDir
{
public:
    explicit TempDir(const std::string& tag)
    {
        static std::atomic<unsigned> counter{0};

        std::error_code ec;
        std::filesystem::path base = std::filesystem::temp_directory_path(ec);
        if (ec || base.empty())
            base = std::filesystem::path(".");

        const auto stamp = static_cast<long long>(
            std::chrono::high_resolution_clock::now().time_since_epoch().count());

        m_path = base / ("lore_tests_" + tag + "_" + std::to_string(stamp) + "_" +
                         std::to_string(counter.fetch_add(1)));
        std::filesystem::create_directories(m_path, ec);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

private:
    std::filesystem::path m_path;
};

} // namespace lore::test
