#include "vole/app.hpp"

#include "vole/config.hpp"
#include "vole/default_rules.hpp"
#include "vole/formatter.hpp"
#include "vole/logger.hpp"
#include "vole/platform.hpp"
#include "vole/string_utils.hpp"

#include <algorithm>
#include <format>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace vole {

int App::run(int argc, char** argv) {
    Config& config = Config::instance();
    if (auto exit_code = cli_.parse(argc, argv, config)) {
        return *exit_code;
    }
    const auto& data = config.data();

    const bool root = platform::is_root();
    const auto home = platform::resolve_home(root, data.user_home);
    if (!home) {
        throw std::runtime_error("could not resolve home directory (set HOME or pass --user-home)");
    }

    const auto available = default_rules();
    if (data.list_rules) {
        print_rules(available);
        return 0;
    }

    if (data.sudo && !root) {
        throw std::runtime_error("--sudo requires running as root (try: sudo vole --sudo)");
    }

    const auto rules = select_rules(available, data);
    if (rules.empty()) {
        std::cout << "No rules selected.\n";
        return 0;
    }

    const bool has_downloads = std::any_of(rules.begin(), rules.end(), [](const Rule& rule) {
        return rule.kind == RuleKind::Downloads;
    });
    if (has_downloads) {
        if (data.downloads_choice) {
            std::cout << "Downloads: removing " << to_string(*data.downloads_choice) << " of archive/folder pairs\n";
        } else {
            std::cerr << "vole: downloads rule skipped; pass --downloads-remove archives|folders\n";
        }
    }

    ScanOptions options;
    options.downloads_choice = data.downloads_choice;
    options.home = *home;
    const auto scans = scan_rules(rules, options);
    print_plan(scans);

    if (data.dry_run) {
        emit_dry_run(scans, *home);
        return 0;
    }

    if (!data.yes) {
        std::cerr << "vole: refusing to delete without --yes (use --dry-run to preview)\n";
        return 1;
    }

    const auto report = apply(scans);
    emit_clean_report(report);

    std::error_code ec;
    if (remove_dry_run_report(*home, ec)) {
        Logger::instance().log(Logger::Level::Info, "removed stale dry-run report");
    }
    return 0;
}

std::vector<Rule> App::select_rules(const std::vector<Rule>& available, const Config::Data& data) const {
    std::vector<Rule> rules;
    if (!data.rule_ids.empty()) {
        std::vector<std::string> selected;
        for (const auto& id : data.rule_ids) {
            selected.push_back(string_utils::to_lower(id));
        }
        for (const auto& rule : available) {
            if (std::find(selected.begin(), selected.end(), string_utils::to_lower(rule.id)) != selected.end()) {
                rules.push_back(rule);
            }
        }
        std::vector<std::string> unknown;
        for (const auto& id : selected) {
            const bool known = std::any_of(available.begin(), available.end(), [&](const Rule& rule) {
                return string_utils::to_lower(rule.id) == id;
            });
            if (!known) {
                unknown.push_back(id);
            }
        }
        if (!unknown.empty()) {
            std::string joined;
            for (const auto& id : unknown) {
                if (!joined.empty()) {
                    joined += ", ";
                }
                joined += id;
            }
            std::cerr << "Unknown rule ids: " << joined << '\n';
        }
    } else {
        std::copy_if(available.begin(), available.end(), std::back_inserter(rules), [](const Rule& rule) {
            return rule.enabled_by_default;
        });
    }

    if (!data.sudo) {
        std::erase_if(rules, [](const Rule& rule) { return rule.requires_sudo; });
    }
    return rules;
}

void App::print_rules(const std::vector<Rule>& rules) const {
    std::cout << "Available rules:\n";
    for (const auto& rule : rules) {
        std::cout << std::format("- {}{}{}\n", rule.id, rule.requires_sudo ? " (sudo)" : "",
            rule.enabled_by_default ? " [default]" : "");
        if (rule.description) {
            std::cout << "  " << *rule.description << '\n';
        }
    }
}

void App::print_plan(const std::vector<RuleScan>& scans) const {
    std::cout << "Cleanup plan:\n";
    std::uintmax_t total_bytes = 0;
    std::size_t total_entries = 0;
    for (const auto& scan : scans) {
        total_bytes += scan.bytes;
        total_entries += scan.entries;
        std::cout << std::format("- {}: {} ({} items)\n", scan.rule.label, formatter::file_size(scan.bytes),
            scan.entries);
    }
    std::cout << std::format("Total: {} across {} items\n", formatter::file_size(total_bytes), total_entries);
}

void App::emit_dry_run(const std::vector<RuleScan>& scans, const std::filesystem::path& home) const {
    const auto output = dry_run_output(scans);
    std::cout << output.details;

    std::error_code ec;
    const auto path = write_dry_run_report(home, output.details, ec);
    if (ec) {
        std::cerr << std::format("Failed to write dry-run report {}: {}\n", path.string(), ec.message());
    } else {
        std::cout << "Dry-run report saved to " << path.string() << '\n';
    }

    const auto& report = output.report;
    std::cout << std::format("Dry-run listed {} files and {} directories\n", report.files_listed,
        report.dirs_listed);
    std::cout << "Would free " << formatter::file_size(report.bytes_listed) << '\n';
    if (report.errors > 0) {
        std::cout << "Errors encountered: " << report.errors << '\n';
    }
}

void App::emit_clean_report(const CleanReport& report) const {
    std::cout << std::format("Removed {} files and {} directories\n", report.files_removed, report.dirs_removed);
    std::cout << "Freed " << formatter::file_size(report.bytes_freed) << '\n';
    if (report.errors > 0) {
        std::cout << "Errors encountered: " << report.errors << '\n';
        for (const auto& message : report.error_messages) {
            std::cout << "  " << message << '\n';
        }
    }
}

} // namespace vole
