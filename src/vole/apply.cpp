#include "vole/apply.hpp"

#include "vole/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <format>
#include <iterator>
#include <system_error>

#include <sys/stat.h>
#include <unistd.h>

namespace vole {

namespace {

void record_failure(CleanReport& report, const std::filesystem::path& path, std::string_view action, int err) {
    auto message = std::format("could not {} {}: {}", action, path.string(), std::generic_category().message(err));
    Logger::instance().log(Logger::Level::Warn, "{}", message);
    ++report.errors;
    report.error_messages.push_back(std::move(message));
}

void remove_files(const RuleScan& scan, CleanReport& report) {
    for (const auto& path : scan.files) {
        struct ::stat st {
        };
        if (::lstat(path.c_str(), &st) != 0) {
            const int err = errno;
            if (err != ENOENT) {
                record_failure(report, path, "inspect", err);
            }
            continue;
        }
        if (S_ISDIR(st.st_mode)) {
            record_failure(report, path, "remove file", EISDIR);
            continue;
        }
        if (::unlink(path.c_str()) != 0) {
            const int err = errno;
            if (err != ENOENT) {
                record_failure(report, path, "remove file", err);
            }
            continue;
        }
        Logger::instance().log(Logger::Level::Trace, "removed {}", path.string());
        ++report.files_removed;
        report.bytes_freed += static_cast<std::uintmax_t>(st.st_size);
    }
}

std::size_t depth(const std::filesystem::path& path) {
    return static_cast<std::size_t>(std::distance(path.begin(), path.end()));
}

void remove_dirs(const RuleScan& scan, CleanReport& report) {
    auto dirs = scan.dirs;
    std::stable_sort(dirs.begin(), dirs.end(), [](const auto& a, const auto& b) { return depth(a) > depth(b); });
    for (const auto& dir : dirs) {
        if (::rmdir(dir.c_str()) != 0) {
            const int err = errno;
            if (err != ENOENT) {
                record_failure(report, dir, "remove directory", err);
            }
            continue;
        }
        Logger::instance().log(Logger::Level::Trace, "removed directory {}", dir.string());
        ++report.dirs_removed;
    }
}

} // namespace

CleanReport apply(const std::vector<RuleScan>& scans) {
    CleanReport report;
    for (const auto& scan : scans) {
        Logger::instance().log(Logger::Level::Info, "applying rule {}: {} files, {} dirs", scan.rule.id,
            scan.files.size(), scan.dirs.size());
        remove_files(scan, report);
        remove_dirs(scan, report);
    }
    return report;
}

} // namespace vole
