#pragma once

#include "vole/scan.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace vole {

struct CleanReport {
    std::size_t files_removed { 0 };
    std::size_t dirs_removed { 0 };
    std::uintmax_t bytes_freed { 0 };
    std::size_t errors { 0 };
    std::vector<std::string> error_messages {};
};

// Removes everything the scans recorded. Files first, then directories
// deepest first and only when empty. Paths that are already gone are
// skipped; any other failure is counted and the sweep continues.
[[nodiscard]] CleanReport apply(const std::vector<RuleScan>& scans);

} // namespace vole
