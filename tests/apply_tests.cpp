#include <catch2/catch.hpp>

#include "test_support.hpp"

#include "vole/apply.hpp"
#include "vole/scan.hpp"

using namespace vole;
namespace fs = std::filesystem;
using vole::test::TempDir;
using vole::test::make_dir;
using vole::test::write_file;

namespace {

Rule paths_rule(const fs::path& root) {
    Rule rule{"cache", "Cache"};
    rule.paths = {root.string()};
    return rule;
}

} // namespace

TEST_CASE("apply removes scanned files and empty directories") {
    TempDir tmp;
    const auto root = make_dir(tmp / "cache");
    write_file(root / "a.bin", 100);
    write_file(root / "x" / "y" / "b.bin", 50);

    const std::vector<RuleScan> scans{scan_paths_rule(paths_rule(root), {})};
    const auto report = apply(scans);

    REQUIRE(report.files_removed == 2);
    REQUIRE(report.dirs_removed == 2);
    REQUIRE(report.bytes_freed == 150);
    REQUIRE(report.errors == 0);
    REQUIRE(fs::exists(root));
    REQUIRE(fs::is_empty(root));
}

TEST_CASE("applying a stale scan twice is idempotent") {
    TempDir tmp;
    const auto root = make_dir(tmp / "cache");
    write_file(root / "sub" / "c.bin", 10);

    const std::vector<RuleScan> scans{scan_paths_rule(paths_rule(root), {})};
    const auto first = apply(scans);
    REQUIRE(first.files_removed == 1);
    REQUIRE(first.dirs_removed == 1);

    const auto second = apply(scans);
    REQUIRE(second.files_removed == 0);
    REQUIRE(second.dirs_removed == 0);
    REQUIRE(second.bytes_freed == 0);
    REQUIRE(second.errors == 0);
}

TEST_CASE("directories are removed deepest first and never recursively") {
    TempDir tmp;
    const auto a = make_dir(tmp / "a");
    const auto b = make_dir(a / "b");

    RuleScan scan{paths_rule(tmp.path())};
    scan.add_dir(a);
    scan.add_dir(b);

    SECTION("empty tree is removed regardless of recorded order") {
        const auto report = apply({scan});
        REQUIRE(report.dirs_removed == 2);
        REQUIRE(report.errors == 0);
        REQUIRE_FALSE(fs::exists(a));
    }

    SECTION("an unexpected file keeps both directories") {
        const auto intruder = write_file(b / "unexpected.txt", 3);
        const auto report = apply({scan});
        REQUIRE(report.dirs_removed == 0);
        REQUIRE(report.errors == 2);
        REQUIRE(report.error_messages.size() == 2);
        REQUIRE(fs::exists(intruder));
        REQUIRE(fs::exists(a));
    }
}

TEST_CASE("files that vanished after the scan are skipped silently") {
    TempDir tmp;
    const auto root = make_dir(tmp / "cache");
    const auto gone = write_file(root / "gone.tmp", 10);
    const auto kept = write_file(root / "kept.tmp", 20);

    const std::vector<RuleScan> scans{scan_paths_rule(paths_rule(root), {})};
    fs::remove(gone);

    const auto report = apply(scans);
    REQUIRE(report.files_removed == 1);
    REQUIRE(report.bytes_freed == 20);
    REQUIRE(report.errors == 0);
    REQUIRE_FALSE(fs::exists(kept));
}

TEST_CASE("a recorded file replaced by a directory is an error, not a recursive delete") {
    TempDir tmp;
    const auto root = make_dir(tmp / "cache");
    const auto path = write_file(root / "swap", 4);

    const std::vector<RuleScan> scans{scan_paths_rule(paths_rule(root), {})};
    fs::remove(path);
    write_file(path / "inner.txt", 1);

    const auto report = apply(scans);
    REQUIRE(report.files_removed == 0);
    REQUIRE(report.errors == 1);
    REQUIRE(fs::exists(path / "inner.txt"));
}

TEST_CASE("symlinks recorded as file roots are unlinked, not followed") {
    TempDir tmp;
    const auto target = write_file(tmp / "target.txt", 30);
    fs::create_symlink(target, tmp / "link");

    const std::vector<RuleScan> scans{scan_paths_rule(paths_rule(tmp / "link"), {})};
    REQUIRE(scans.front().files == std::vector<fs::path>{tmp / "link"});

    const auto report = apply(scans);
    REQUIRE(report.files_removed == 1);
    REQUIRE_FALSE(fs::exists(fs::symlink_status(tmp / "link")));
    REQUIRE(fs::exists(target));
}
