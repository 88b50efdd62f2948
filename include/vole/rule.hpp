#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vole {

enum class RuleKind {
    Paths,
    Downloads,
    Logs,
};

enum class DownloadsChoice {
    Archives,
    Folders,
};

[[nodiscard]] std::string_view to_string(RuleKind kind) noexcept;
[[nodiscard]] std::string_view to_string(DownloadsChoice choice) noexcept;
[[nodiscard]] std::optional<DownloadsChoice> parse_downloads_choice(std::string_view text);

struct Rule {
    std::string id;
    std::string label;
    std::optional<std::string> description {};
    RuleKind kind { RuleKind::Paths };
    std::vector<std::string> paths {};
    bool requires_sudo { false };
    bool enabled_by_default { false };
    std::vector<std::string> distros {};
    std::vector<std::string> exclude_globs {};
    // Only meaningful for RuleKind::Logs.
    std::optional<std::uint64_t> older_than_days {};
};

} // namespace vole
