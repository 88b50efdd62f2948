#pragma once

#include "vole/glob.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

#include <sys/types.h>

namespace vole {

struct WalkEntry {
    enum class Kind {
        File,
        Directory,
    };

    std::filesystem::path path;
    Kind kind { Kind::File };
    std::uintmax_t size { 0 };
    bool regular { false };
};

// Recursive scan below one root. Never follows symlinks, never descends
// into another filesystem, prunes excluded directories and keeps going past
// unreadable entries. Children are visited in name order, parents first.
class TreeWalker {
public:
    using Visitor = std::function<void(const WalkEntry&)>;
    using ErrorSink = std::function<void(std::string)>;

    TreeWalker(const GlobMatcher* exclude, ErrorSink on_error);

    void walk(const std::filesystem::path& root, const Visitor& visit) const;

private:
    const GlobMatcher* exclude_;
    ErrorSink on_error_;

    void walk_directory(const std::filesystem::path& dir, const std::filesystem::path& root, ::dev_t device,
        const Visitor& visit) const;
    [[nodiscard]] bool excluded(const std::filesystem::path& relative) const;
};

} // namespace vole
