#pragma once

#include "vole/path_expander.hpp"
#include "vole/rule.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vole {

struct ScanOptions {
    std::optional<DownloadsChoice> downloads_choice {};
    std::filesystem::path home {};
    // Empty means the process environment.
    PathExpander::EnvLookup env {};
    // Reference instant for age filtering; the current time when unset.
    std::optional<std::filesystem::file_time_type> now {};
};

// Result of evaluating one rule against the filesystem. Owns a copy of its
// rule so it stays self-describing after the rule list changes.
struct RuleScan {
    Rule rule;
    std::uintmax_t bytes { 0 };
    std::size_t entries { 0 };
    std::vector<std::filesystem::path> files {};
    std::vector<std::filesystem::path> dirs {};
    std::size_t errors { 0 };
    std::vector<std::string> error_messages {};
    std::optional<DownloadsChoice> downloads_choice {};

    explicit RuleScan(Rule source)
        : rule(std::move(source)) {}

    void add_file(std::filesystem::path path, std::uintmax_t size);
    void add_dir(std::filesystem::path path);
    void add_error(std::string message);
};

[[nodiscard]] RuleScan scan_rule(const Rule& rule, const ScanOptions& options);
[[nodiscard]] std::vector<RuleScan> scan_rules(const std::vector<Rule>& rules, const ScanOptions& options);

[[nodiscard]] RuleScan scan_paths_rule(const Rule& rule, const ScanOptions& options);
[[nodiscard]] RuleScan scan_downloads_rule(const Rule& rule, const ScanOptions& options);
[[nodiscard]] RuleScan scan_logs_rule(const Rule& rule, const ScanOptions& options);

} // namespace vole
