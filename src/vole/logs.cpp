#include "vole/logs.hpp"

#include "vole/glob.hpp"
#include "vole/logger.hpp"
#include "vole/scan.hpp"
#include "vole/string_utils.hpp"
#include "vole/tree_walker.hpp"

#include <chrono>
#include <format>
#include <system_error>

namespace vole {

bool is_log_name(std::string_view file_name) {
    const auto name = string_utils::to_lower(std::string{file_name});
    return name == "xsession-errors"
        || name.starts_with("xsession-errors.")
        || name.ends_with(".log")
        || name.find(".log.") != std::string::npos
        || name.ends_with(".err")
        || name.ends_with(".error");
}

std::filesystem::file_time_type log_cutoff(std::filesystem::file_time_type now, std::uint64_t days) noexcept {
    using duration = std::filesystem::file_time_type::duration;
    const auto earliest = std::filesystem::file_time_type::min();
    const auto day_ticks = static_cast<std::uint64_t>(std::chrono::duration_cast<duration>(std::chrono::hours(24)).count());
    // Unsigned difference is exact even when now is negative.
    const auto headroom = static_cast<std::uint64_t>(now.time_since_epoch().count())
        - static_cast<std::uint64_t>(earliest.time_since_epoch().count());
    if (days > headroom / day_ticks) {
        return earliest;
    }
    const auto ticks = static_cast<std::uint64_t>(now.time_since_epoch().count()) - days * day_ticks;
    return std::filesystem::file_time_type{duration(static_cast<duration::rep>(ticks))};
}

RuleScan scan_logs_rule(const Rule& rule, const ScanOptions& options) {
    RuleScan scan{rule};

    auto compiled = compile_globs(rule.exclude_globs);
    for (auto& message : compiled.errors) {
        scan.add_error(std::move(message));
    }
    const GlobMatcher* exclude = compiled.matcher ? &*compiled.matcher : nullptr;

    std::optional<std::filesystem::file_time_type> cutoff;
    if (rule.older_than_days) {
        const auto now = options.now.value_or(std::filesystem::file_time_type::clock::now());
        cutoff = log_cutoff(now, *rule.older_than_days);
    }

    auto qualifies = [&](const WalkEntry& entry) {
        if (entry.kind != WalkEntry::Kind::File || !entry.regular) {
            return false;
        }
        if (!is_log_name(entry.path.filename().string())) {
            return false;
        }
        if (!cutoff) {
            return true;
        }
        std::error_code ec;
        const auto modified = std::filesystem::last_write_time(entry.path, ec);
        if (ec) {
            scan.add_error(std::format("{}: cannot read modification time: {}", entry.path.string(), ec.message()));
            return false;
        }
        return modified <= *cutoff;
    };

    TreeWalker walker(exclude, [&scan](std::string message) { scan.add_error(std::move(message)); });
    const PathExpander expander(options.home, options.env);
    for (const auto& root : expander.expand_all(rule.paths)) {
        walker.walk(root, [&](const WalkEntry& entry) {
            if (qualifies(entry)) {
                scan.add_file(entry.path, entry.size);
            }
        });
    }
    return scan;
}

} // namespace vole
