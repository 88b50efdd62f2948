#include "vole/rule.hpp"

#include "vole/string_utils.hpp"

#include <map>

namespace vole {

std::string_view to_string(RuleKind kind) noexcept {
    switch (kind) {
    case RuleKind::Paths:
        return "paths";
    case RuleKind::Downloads:
        return "downloads";
    case RuleKind::Logs:
        return "logs";
    }
    return "paths";
}

std::string_view to_string(DownloadsChoice choice) noexcept {
    switch (choice) {
    case DownloadsChoice::Archives:
        return "archives";
    case DownloadsChoice::Folders:
        return "folders";
    }
    return "archives";
}

std::optional<DownloadsChoice> parse_downloads_choice(std::string_view text) {
    static const std::map<std::string, DownloadsChoice, std::less<>> table{
        {"a", DownloadsChoice::Archives},
        {"archive", DownloadsChoice::Archives},
        {"archives", DownloadsChoice::Archives},
        {"f", DownloadsChoice::Folders},
        {"folder", DownloadsChoice::Folders},
        {"folders", DownloadsChoice::Folders},
    };
    auto it = table.find(string_utils::to_lower(string_utils::trim(text)));
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace vole
