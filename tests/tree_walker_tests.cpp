#include <catch2/catch.hpp>

#include "test_support.hpp"

#include "vole/scan.hpp"
#include "vole/tree_walker.hpp"

#include <algorithm>
#include <numeric>

#include <sys/stat.h>

using namespace vole;
namespace fs = std::filesystem;
using vole::test::TempDir;
using vole::test::PermissionGuard;
using vole::test::make_dir;
using vole::test::permissions_enforced;
using vole::test::write_file;

namespace {

Rule paths_rule(const fs::path& root, std::vector<std::string> excludes = {}) {
    Rule rule{"cache", "Cache"};
    rule.paths = {root.string()};
    rule.exclude_globs = std::move(excludes);
    return rule;
}

bool contains(const std::vector<fs::path>& paths, const fs::path& wanted) {
    return std::find(paths.begin(), paths.end(), wanted) != paths.end();
}

std::uintmax_t on_disk_size(const std::vector<fs::path>& files) {
    return std::accumulate(files.begin(), files.end(), std::uintmax_t{0},
        [](std::uintmax_t sum, const fs::path& p) { return sum + fs::file_size(p); });
}

} // namespace

TEST_CASE("paths rule records files and directories below the root") {
    TempDir tmp;
    const auto root = make_dir(tmp / "cache");
    write_file(root / "a.bin", 10);
    write_file(root / "sub" / "b.bin", 20);
    write_file(root / "sub" / "deeper" / "c.bin", 30);

    const auto scan = scan_paths_rule(paths_rule(root), {});

    REQUIRE(scan.errors == 0);
    REQUIRE(scan.files.size() == 3);
    REQUIRE(scan.entries == 3);
    REQUIRE(scan.dirs.size() == 2);
    REQUIRE(contains(scan.dirs, root / "sub"));
    REQUIRE(contains(scan.dirs, root / "sub" / "deeper"));
    REQUIRE(scan.bytes == 60);
    REQUIRE(scan.bytes == on_disk_size(scan.files));
    REQUIRE_FALSE(contains(scan.files, root));
    REQUIRE_FALSE(contains(scan.dirs, root));
    for (const auto& file : scan.files) {
        REQUIRE_FALSE(contains(scan.dirs, file));
    }
}

TEST_CASE("exclusion globs match root-relative paths") {
    TempDir tmp;
    const auto root = make_dir(tmp / "X");
    write_file(root / "notes.bak", 5);
    write_file(root / "notes.bak.txt", 7);

    const auto scan = scan_paths_rule(paths_rule(root, {"*.bak"}), {});

    REQUIRE(scan.files == std::vector<fs::path>{root / "notes.bak.txt"});
    REQUIRE(scan.bytes == 7);
}

TEST_CASE("excluded directories are pruned") {
    TempDir tmp;
    const auto root = make_dir(tmp / "cache");
    write_file(root / "keep" / "inner" / "x.dat", 4);
    write_file(root / "drop" / "y.dat", 4);

    const auto scan = scan_paths_rule(paths_rule(root, {"keep"}), {});

    REQUIRE(scan.dirs == std::vector<fs::path>{root / "drop"});
    REQUIRE(scan.files == std::vector<fs::path>{root / "drop" / "y.dat"});
}

TEST_CASE("invalid exclusion globs are counted but the scan proceeds") {
    TempDir tmp;
    const auto root = make_dir(tmp / "cache");
    write_file(root / "a.tmp", 1);
    write_file(root / "b.dat", 2);

    const auto scan = scan_paths_rule(paths_rule(root, {"[oops", "*.tmp"}), {});

    REQUIRE(scan.errors == 1);
    REQUIRE(scan.error_messages.size() == 1);
    REQUIRE(scan.files == std::vector<fs::path>{root / "b.dat"});
}

TEST_CASE("symlinks inside the tree are neither followed nor recorded") {
    TempDir tmp;
    const auto root = make_dir(tmp / "cache");
    const auto outside = make_dir(tmp / "outside");
    write_file(outside / "precious.txt", 100);
    write_file(root / "real.txt", 3);
    fs::create_directory_symlink(outside, root / "linked-dir");
    fs::create_symlink(outside / "precious.txt", root / "linked-file");

    const auto scan = scan_paths_rule(paths_rule(root), {});

    REQUIRE(scan.files == std::vector<fs::path>{root / "real.txt"});
    REQUIRE(scan.dirs.empty());
    REQUIRE(scan.bytes == 3);
}

TEST_CASE("a file root is recorded as a single entry") {
    TempDir tmp;
    const auto file = write_file(tmp / "single.log", 12);

    const auto scan = scan_paths_rule(paths_rule(file), {});

    REQUIRE(scan.files == std::vector<fs::path>{file});
    REQUIRE(scan.dirs.empty());
    REQUIRE(scan.bytes == 12);
}

TEST_CASE("a missing root contributes nothing and no error") {
    TempDir tmp;
    const auto scan = scan_paths_rule(paths_rule(tmp / "absent"), {});
    REQUIRE(scan.files.empty());
    REQUIRE(scan.dirs.empty());
    REQUIRE(scan.errors == 0);
}

TEST_CASE("tree walker visits parents before children in name order") {
    TempDir tmp;
    const auto root = make_dir(tmp / "r");
    write_file(root / "b" / "2.txt", 1);
    write_file(root / "a" / "1.txt", 1);
    write_file(root / "c.txt", 1);

    std::vector<fs::path> visited;
    std::vector<std::string> errors;
    TreeWalker walker(nullptr, [&](std::string message) { errors.push_back(std::move(message)); });
    walker.walk(root, [&](const WalkEntry& entry) { visited.push_back(entry.path); });

    REQUIRE(errors.empty());
    REQUIRE(visited == std::vector<fs::path>{root / "a", root / "a" / "1.txt", root / "b", root / "b" / "2.txt",
                           root / "c.txt"});
}

TEST_CASE("rule paths are expanded against the supplied home") {
    TempDir tmp;
    write_file(tmp / ".cache" / "blob", 9);
    Rule rule{"cache", "Cache"};
    rule.paths = {"~/.cache"};
    ScanOptions options;
    options.home = tmp.path();

    const auto scan = scan_rule(rule, options);

    REQUIRE(scan.files == std::vector<fs::path>{tmp / ".cache" / "blob"});
}

TEST_CASE("scan_rules returns one scan per rule in input order") {
    TempDir tmp;
    write_file(tmp / "one" / "f", 1);
    write_file(tmp / "two" / "g", 2);

    const auto scans = scan_rules({paths_rule(tmp / "two"), paths_rule(tmp / "one")}, {});

    REQUIRE(scans.size() == 2);
    REQUIRE(scans[0].files == std::vector<fs::path>{tmp / "two" / "g"});
    REQUIRE(scans[1].files == std::vector<fs::path>{tmp / "one" / "f"});
}

TEST_CASE("a fifo root is neither recorded nor reported") {
    TempDir tmp;
    const auto pipe = tmp / "pipe";
    REQUIRE(::mkfifo(pipe.c_str(), 0600) == 0);

    const auto scan = scan_paths_rule(paths_rule(pipe), {});

    REQUIRE(scan.files.empty());
    REQUIRE(scan.dirs.empty());
    REQUIRE(scan.bytes == 0);
    REQUIRE(scan.errors == 0);
}

TEST_CASE("a root that cannot be resolved is an error and later roots are still walked") {
    TempDir tmp;
    fs::create_symlink(tmp / "loop", tmp / "loop");
    write_file(tmp / "cache" / "keep.bin", 5);
    Rule rule{"cache", "Cache"};
    rule.paths = {(tmp / "loop" / "x").string(), (tmp / "cache").string()};

    const auto scan = scan_paths_rule(rule, {});

    REQUIRE(scan.errors == 1);
    REQUIRE(scan.error_messages.size() == 1);
    REQUIRE(scan.error_messages[0].find("loop") != std::string::npos);
    REQUIRE(scan.files == std::vector<fs::path>{tmp / "cache" / "keep.bin"});
    REQUIRE(scan.bytes == 5);
}

TEST_CASE("unreadable entries are reported and the walk continues") {
    if (!permissions_enforced()) {
        WARN("running as root, permission errors cannot be provoked");
        return;
    }
    TempDir tmp;
    const auto root = make_dir(tmp / "cache");
    write_file(root / "a.bin", 1);
    write_file(root / "locked" / "hidden.bin", 2);
    write_file(root / "listable" / "inner.bin", 3);
    write_file(root / "z.bin", 4);

    SECTION("a directory that cannot be opened") {
        PermissionGuard guard(root / "locked", fs::perms::none);
        const auto scan = scan_paths_rule(paths_rule(root), {});

        REQUIRE(scan.errors == 1);
        REQUIRE(scan.files == std::vector<fs::path>{root / "a.bin", root / "listable" / "inner.bin", root / "z.bin"});
        REQUIRE(contains(scan.dirs, root / "locked"));
        REQUIRE(scan.bytes == 8);
    }

    SECTION("entries that can be listed but not examined") {
        PermissionGuard guard(root / "listable", fs::perms::owner_read);
        const auto scan = scan_paths_rule(paths_rule(root), {});

        REQUIRE(scan.errors == 1);
        REQUIRE(scan.error_messages[0].find("inner.bin") != std::string::npos);
        REQUIRE(contains(scan.files, root / "z.bin"));
        REQUIRE(contains(scan.files, root / "locked" / "hidden.bin"));
    }

    SECTION("an excluded entry is skipped before it is examined") {
        PermissionGuard guard(root / "listable", fs::perms::owner_read);
        const auto scan = scan_paths_rule(paths_rule(root, {"listable/inner.bin"}), {});

        REQUIRE(scan.errors == 0);
        REQUIRE(scan.files.size() == 3);
    }
}
