#include "vole/scan.hpp"

#include "vole/glob.hpp"
#include "vole/logger.hpp"
#include "vole/tree_walker.hpp"

namespace vole {

void RuleScan::add_file(std::filesystem::path path, std::uintmax_t size) {
    bytes += size;
    ++entries;
    files.push_back(std::move(path));
}

void RuleScan::add_dir(std::filesystem::path path) {
    dirs.push_back(std::move(path));
}

void RuleScan::add_error(std::string message) {
    Logger::instance().log(Logger::Level::Warn, "{}: {}", rule.id, message);
    ++errors;
    error_messages.push_back(std::move(message));
}

RuleScan scan_rule(const Rule& rule, const ScanOptions& options) {
    Logger::instance().log(Logger::Level::Debug, "scanning rule {} ({})", rule.id, to_string(rule.kind));
    switch (rule.kind) {
    case RuleKind::Paths:
        return scan_paths_rule(rule, options);
    case RuleKind::Downloads:
        return scan_downloads_rule(rule, options);
    case RuleKind::Logs:
        return scan_logs_rule(rule, options);
    }
    return RuleScan{rule};
}

std::vector<RuleScan> scan_rules(const std::vector<Rule>& rules, const ScanOptions& options) {
    std::vector<RuleScan> scans;
    scans.reserve(rules.size());
    for (const auto& rule : rules) {
        scans.push_back(scan_rule(rule, options));
    }
    return scans;
}

RuleScan scan_paths_rule(const Rule& rule, const ScanOptions& options) {
    RuleScan scan{rule};

    auto compiled = compile_globs(rule.exclude_globs);
    for (auto& message : compiled.errors) {
        scan.add_error(std::move(message));
    }
    const GlobMatcher* exclude = compiled.matcher ? &*compiled.matcher : nullptr;

    TreeWalker walker(exclude, [&scan](std::string message) { scan.add_error(std::move(message)); });
    const PathExpander expander(options.home, options.env);
    for (const auto& root : expander.expand_all(rule.paths)) {
        walker.walk(root, [&scan](const WalkEntry& entry) {
            if (entry.kind == WalkEntry::Kind::Directory) {
                scan.add_dir(entry.path);
            } else {
                scan.add_file(entry.path, entry.size);
            }
        });
    }
    return scan;
}

} // namespace vole
