// tests/test_io_atomic_file.cpp
//
// Regression coverage for lore::io::write_atomic/read_all.
// Save slots and lore.ini go through these helpers (temp + rename, optional .bak).

#include <doctest/doctest.h>

#include "io/AtomicFile.h"
#include "test_support/TempDir.h"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

TEST_CASE("io::write_atomic round-trips bytes and keeps the previous version as .bak")
{
    const lore::test::TempDir dir("io_roundtrip");
    const fs::path p = dir.path() / "atomic_io_roundtrip.txt";

    INFO("path: ", p.string());

    std::string err;
    CHECK(lore::io::write_atomic(p, "hello\n", &err, /*make_backup=*/true));
    CHECK(err.empty());

    std::string read;
    err.clear();
    CHECK(lore::io::read_all(p, read, &err));
    CHECK(err.empty());
    CHECK(read == "hello\n");

    err.clear();
    CHECK(lore::io::write_atomic(p, "world\n", &err, /*make_backup=*/true));
    CHECK(err.empty());

    read.clear();
    CHECK(lore::io::read_all(p, read, &err));
    CHECK(read == "world\n");

    const fs::path bak = lore::io::default_backup_path(p);
    INFO("backup: ", bak.string());

    std::string bak_read;
    CHECK(lore::io::read_all(bak, bak_read, &err));
    CHECK(bak_read == "hello\n");
}

TEST_CASE("io::write_atomic make_backup=false does not create .bak")
{
    const lore::test::TempDir dir("io_no_bak");
    const fs::path p = dir.path() / "atomic_io_no_bak.txt";
    const fs::path bak = lore::io::default_backup_path(p);

    std::string err;
    CHECK(lore::io::write_atomic(p, "first", &err, /*make_backup=*/false));
    CHECK(err.empty());
    CHECK_FALSE(fs::exists(bak));

    err.clear();
    CHECK(lore::io::write_atomic(p, "second", &err, /*make_backup=*/false));
    CHECK(err.empty());
    CHECK_FALSE(fs::exists(bak));
}

TEST_CASE("io::write_atomic creates missing parent directories and leaves no temp file")
{
    const lore::test::TempDir dir("io_parents");
    const fs::path p = dir.path() / "a" / "b" / "slot_1.json";

    std::string err;
    REQUIRE(lore::io::write_atomic(p, "{}", &err));
    CHECK(fs::exists(p));

    fs::path tmp = p;
    tmp += ".tmp";
    CHECK_FALSE(fs::exists(tmp));
}

TEST_CASE("io::read_all reports a missing file and leaves the output alone")
{
    const lore::test::TempDir dir("io_missing");

    std::string out = "unchanged";
    std::string err;
    CHECK_FALSE(lore::io::read_all(dir.path() / "nope.txt", out, &err));
    CHECK_FALSE(err.empty());
    CHECK(out == "unchanged");
}
