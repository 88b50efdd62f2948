#include "vole/dry_run.hpp"

#include "vole/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <format>
#include <fstream>
#include <iterator>

namespace vole {

namespace {

bool is_within(const std::filesystem::path& path, const std::filesystem::path& ancestor) {
    auto [a, b] = std::mismatch(ancestor.begin(), ancestor.end(), path.begin(), path.end());
    return a == ancestor.end() && b != path.end();
}

bool under_any(const std::filesystem::path& path, const std::vector<std::filesystem::path>& roots) {
    return std::any_of(roots.begin(), roots.end(), [&](const auto& root) { return is_within(path, root); });
}

void render_verbatim(const RuleScan& scan, std::string& out) {
    for (const auto& path : scan.files) {
        std::format_to(std::back_inserter(out), "  file: {}\n", path.string());
    }
    for (const auto& path : scan.dirs) {
        std::format_to(std::back_inserter(out), "  dir: {}\n", path.string());
    }
}

void render_folders_summary(const RuleScan& scan, const std::vector<std::filesystem::path>& tops, std::string& out) {
    for (const auto& path : scan.files) {
        if (!under_any(path, tops)) {
            std::format_to(std::back_inserter(out), "  file: {}\n", path.string());
        }
    }
    for (const auto& dir : tops) {
        std::format_to(std::back_inserter(out), "  dir: {}\n", dir.string());
        out += "    (contents omitted)\n";
    }
}

} // namespace

std::vector<std::filesystem::path> top_level_dirs(std::vector<std::filesystem::path> dirs) {
    // Path ordering is component-wise, so descendants sort right after
    // their ancestor.
    std::sort(dirs.begin(), dirs.end());
    dirs.erase(std::unique(dirs.begin(), dirs.end()), dirs.end());
    std::vector<std::filesystem::path> tops;
    for (auto& dir : dirs) {
        if (!tops.empty() && is_within(dir, tops.back())) {
            continue;
        }
        tops.push_back(std::move(dir));
    }
    return tops;
}

DryRunOutput dry_run_output(const std::vector<RuleScan>& scans) {
    DryRunOutput output;
    auto& details = output.details;
    details += "Dry-run details (no files will be deleted):\n";
    details += "Note: directories are only removed if empty after file removal.\n";

    for (const auto& scan : scans) {
        std::format_to(std::back_inserter(details), "Rule: {} ({})\n", scan.rule.label, scan.rule.id);
        if (scan.files.empty() && scan.dirs.empty()) {
            details += "  (no entries)\n";
        } else if (scan.rule.kind == RuleKind::Downloads && scan.downloads_choice == DownloadsChoice::Folders) {
            const auto tops = top_level_dirs(scan.dirs);
            if (tops.empty()) {
                render_verbatim(scan, details);
            } else {
                render_folders_summary(scan, tops, details);
            }
        } else {
            render_verbatim(scan, details);
        }
        for (const auto& message : scan.error_messages) {
            std::format_to(std::back_inserter(details), "  error: {}\n", message);
        }

        output.report.files_listed += scan.files.size();
        output.report.dirs_listed += scan.dirs.size();
        output.report.bytes_listed += scan.bytes;
        output.report.errors += scan.errors;
    }
    return output;
}

std::filesystem::path dry_run_report_path(const std::filesystem::path& home) {
    return home / kDryRunReportName;
}

std::filesystem::path write_dry_run_report(const std::filesystem::path& home, std::string_view details,
    std::error_code& ec) {
    ec.clear();
    auto path = dry_run_report_path(home);
    errno = 0;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        const int err = errno;
        ec.assign(err != 0 ? err : EIO, std::generic_category());
        Logger::instance().log(Logger::Level::Warn, "could not write {}: {}", path.string(), ec.message());
        return path;
    }
    out.write(details.data(), static_cast<std::streamsize>(details.size()));
    out.close();
    if (!out) {
        ec = std::make_error_code(std::errc::io_error);
        Logger::instance().log(Logger::Level::Warn, "could not write {}: {}", path.string(), ec.message());
        return path;
    }
    Logger::instance().log(Logger::Level::Debug, "dry-run report written to {}", path.string());
    return path;
}

bool remove_dry_run_report(const std::filesystem::path& home, std::error_code& ec) {
    const auto path = dry_run_report_path(home);
    const bool removed = std::filesystem::remove(path, ec);
    if (ec) {
        Logger::instance().log(Logger::Level::Warn, "could not remove {}: {}", path.string(), ec.message());
        return false;
    }
    return removed;
}

} // namespace vole
