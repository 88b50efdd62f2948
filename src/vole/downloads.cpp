#include "vole/downloads.hpp"

#include "vole/logger.hpp"
#include "vole/scan.hpp"
#include "vole/string_utils.hpp"
#include "vole/tree_walker.hpp"

#include <algorithm>
#include <format>
#include <set>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace vole {

namespace {

struct ArchiveCandidate {
    std::string base;
    std::filesystem::path path;
    std::uintmax_t size { 0 };
};

void scan_downloads_root(const std::filesystem::path& root, DownloadsChoice choice, RuleScan& scan,
    std::set<std::filesystem::path>& seen_dirs) {
    auto& logger = Logger::instance();
    std::error_code ec;
    const auto root_status = std::filesystem::symlink_status(root, ec);
    if (ec || root_status.type() == std::filesystem::file_type::not_found) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            scan.add_error(std::format("{}: {}", root.string(), ec.message()));
        } else {
            logger.log(Logger::Level::Debug, "skipping missing downloads root {}", root.string());
        }
        return;
    }
    if (std::filesystem::is_symlink(root_status) || !std::filesystem::is_directory(root_status)) {
        logger.log(Logger::Level::Debug, "skipping downloads root {}: not a directory", root.string());
        return;
    }

    std::vector<std::filesystem::directory_entry> children;
    std::filesystem::directory_iterator it(root, ec);
    if (ec) {
        scan.add_error(std::format("{}: {}", root.string(), ec.message()));
        return;
    }
    for (; it != std::filesystem::directory_iterator{}; it.increment(ec)) {
        children.push_back(*it);
    }
    if (ec) {
        scan.add_error(std::format("{}: {}", root.string(), ec.message()));
    }
    std::sort(children.begin(), children.end(), [](const auto& a, const auto& b) { return a.path() < b.path(); });

    std::vector<ArchiveCandidate> archives;
    std::unordered_map<std::string, std::filesystem::path> folders;

    for (const auto& entry : children) {
        const auto name = entry.path().filename().string();
        const auto status = entry.symlink_status(ec);
        if (ec) {
            scan.add_error(std::format("{}: {}", entry.path().string(), ec.message()));
            ec.clear();
            continue;
        }
        if (std::filesystem::is_symlink(status)) {
            continue;
        }
        if (std::filesystem::is_directory(status)) {
            folders.emplace(name, entry.path());
            continue;
        }
        if (!std::filesystem::is_regular_file(status)) {
            continue;
        }
        auto base = archive_base_name(name);
        if (!base) {
            continue;
        }
        const auto size = entry.file_size(ec);
        if (ec) {
            scan.add_error(std::format("{}: {}", entry.path().string(), ec.message()));
            ec.clear();
            continue;
        }
        archives.push_back(ArchiveCandidate{std::move(*base), entry.path(), size});
    }

    for (const auto& archive : archives) {
        auto folder = folders.find(archive.base);
        if (folder == folders.end()) {
            logger.log(Logger::Level::Trace, "no extracted folder for {}", archive.path.string());
            continue;
        }
        switch (choice) {
        case DownloadsChoice::Archives:
            scan.add_file(archive.path, archive.size);
            break;
        case DownloadsChoice::Folders: {
            if (!seen_dirs.insert(folder->second).second) {
                break;
            }
            scan.add_dir(folder->second);
            TreeWalker walker(nullptr, [&scan](std::string message) { scan.add_error(std::move(message)); });
            walker.walk(folder->second, [&scan](const WalkEntry& entry) {
                if (entry.kind == WalkEntry::Kind::Directory) {
                    scan.add_dir(entry.path);
                } else {
                    scan.add_file(entry.path, entry.size);
                }
            });
            break;
        }
        }
    }
}

} // namespace

std::optional<std::string> archive_base_name(std::string_view file_name) {
    for (const auto extension : kArchiveExtensions) {
        if (string_utils::ends_with_ignore_case(file_name, extension)) {
            const auto base_len = file_name.size() - extension.size();
            if (base_len == 0) {
                return std::nullopt;
            }
            return std::string{file_name.substr(0, base_len)};
        }
    }
    return std::nullopt;
}

RuleScan scan_downloads_rule(const Rule& rule, const ScanOptions& options) {
    RuleScan scan{rule};
    if (!options.downloads_choice) {
        Logger::instance().log(Logger::Level::Warn, "{}: no downloads choice given, nothing scanned", rule.id);
        return scan;
    }
    scan.downloads_choice = options.downloads_choice;

    std::set<std::filesystem::path> seen_dirs;
    const PathExpander expander(options.home, options.env);
    for (const auto& root : expander.expand_all(rule.paths)) {
        scan_downloads_root(root, *options.downloads_choice, scan, seen_dirs);
    }
    return scan;
}

} // namespace vole
