#include "vole/tree_walker.hpp"

#include "vole/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <format>
#include <system_error>
#include <vector>

#include <sys/stat.h>

namespace vole {

namespace {

std::string errno_message(int err) {
    return std::generic_category().message(err);
}

} // namespace

TreeWalker::TreeWalker(const GlobMatcher* exclude, ErrorSink on_error)
    : exclude_(exclude), on_error_(std::move(on_error)) {}

bool TreeWalker::excluded(const std::filesystem::path& relative) const {
    return exclude_ != nullptr && exclude_->matches(relative);
}

void TreeWalker::walk(const std::filesystem::path& root, const Visitor& visit) const {
    auto& logger = Logger::instance();
    struct ::stat st {
    };
    if (::lstat(root.c_str(), &st) != 0) {
        const int err = errno;
        if (err == ENOENT || err == ENOTDIR) {
            logger.log(Logger::Level::Debug, "skipping missing root {}", root.string());
            return;
        }
        on_error_(std::format("{}: {}", root.string(), errno_message(err)));
        return;
    }

    if (!S_ISDIR(st.st_mode)) {
        if (!S_ISREG(st.st_mode) && !S_ISLNK(st.st_mode)) {
            logger.log(Logger::Level::Debug, "skipping root {}: not a regular file, symlink or directory",
                root.string());
            return;
        }
        if (excluded(root.filename())) {
            logger.log(Logger::Level::Debug, "root {} is excluded", root.string());
            return;
        }
        visit(WalkEntry{root, WalkEntry::Kind::File, static_cast<std::uintmax_t>(st.st_size), S_ISREG(st.st_mode)});
        return;
    }

    walk_directory(root, root, st.st_dev, visit);
}

void TreeWalker::walk_directory(const std::filesystem::path& dir, const std::filesystem::path& root, ::dev_t device,
    const Visitor& visit) const {
    auto& logger = Logger::instance();
    std::error_code ec;
    std::vector<std::filesystem::path> children;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        on_error_(std::format("{}: {}", dir.string(), ec.message()));
        return;
    }
    for (; it != std::filesystem::directory_iterator{}; it.increment(ec)) {
        children.push_back(it->path());
    }
    if (ec) {
        on_error_(std::format("{}: {}", dir.string(), ec.message()));
    }
    std::sort(children.begin(), children.end());

    for (const auto& child : children) {
        if (excluded(child.lexically_relative(root))) {
            logger.log(Logger::Level::Trace, "excluded {}", child.string());
            continue;
        }
        struct ::stat st {
        };
        if (::lstat(child.c_str(), &st) != 0) {
            const int err = errno;
            on_error_(std::format("{}: {}", child.string(), errno_message(err)));
            continue;
        }
        if (S_ISLNK(st.st_mode)) {
            continue;
        }
        if (S_ISDIR(st.st_mode)) {
            if (st.st_dev != device) {
                logger.log(Logger::Level::Debug, "not crossing into mount point {}", child.string());
                continue;
            }
            visit(WalkEntry{child, WalkEntry::Kind::Directory, 0, false});
            walk_directory(child, root, device, visit);
            continue;
        }
        visit(WalkEntry{child, WalkEntry::Kind::File, static_cast<std::uintmax_t>(st.st_size), S_ISREG(st.st_mode)});
    }
}

} // namespace vole
