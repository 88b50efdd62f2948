#pragma once

#include "vole/scan.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace vole {

inline constexpr std::string_view kDryRunReportName = "vole-dry-run.txt";

struct DryRunReport {
    std::size_t files_listed { 0 };
    std::size_t dirs_listed { 0 };
    std::uintmax_t bytes_listed { 0 };
    std::size_t errors { 0 };
};

struct DryRunOutput {
    DryRunReport report;
    std::string details;
};

[[nodiscard]] DryRunOutput dry_run_output(const std::vector<RuleScan>& scans);

// Directories of `dirs` that are not nested below another entry of `dirs`.
[[nodiscard]] std::vector<std::filesystem::path> top_level_dirs(std::vector<std::filesystem::path> dirs);

[[nodiscard]] std::filesystem::path dry_run_report_path(const std::filesystem::path& home);
std::filesystem::path write_dry_run_report(const std::filesystem::path& home, std::string_view details,
    std::error_code& ec);
// Returns false when there was no report to remove or removal failed (ec set).
bool remove_dry_run_report(const std::filesystem::path& home, std::error_code& ec);

} // namespace vole
