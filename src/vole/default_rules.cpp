#include "vole/default_rules.hpp"

namespace vole {

std::vector<Rule> default_rules() {
    std::vector<Rule> rules;

    Rule cache{"user-cache", "User cache"};
    cache.description = "Application caches under ~/.cache";
    cache.paths = {"~/.cache"};
    cache.enabled_by_default = true;
    cache.exclude_globs = {"**/*.lock", "fontconfig", "fontconfig/**"};
    rules.push_back(std::move(cache));

    Rule thumbnails{"thumbnails", "Thumbnail cache"};
    thumbnails.description = "Image previews regenerated on demand";
    thumbnails.paths = {"~/.thumbnails", "~/.cache/thumbnails"};
    thumbnails.enabled_by_default = true;
    rules.push_back(std::move(thumbnails));

    Rule trash{"trash", "Trash"};
    trash.description = "Files already moved to the desktop trash";
    trash.paths = {"~/.local/share/Trash/files", "~/.local/share/Trash/info"};
    rules.push_back(std::move(trash));

    Rule downloads{"downloads", "Extracted downloads"};
    downloads.description = "Archives in ~/Downloads that have a matching extracted folder";
    downloads.kind = RuleKind::Downloads;
    downloads.paths = {"~/Downloads"};
    rules.push_back(std::move(downloads));

    Rule user_logs{"user-logs", "Session logs"};
    user_logs.description = "Stale Xorg and user application logs";
    user_logs.kind = RuleKind::Logs;
    user_logs.paths = {"~/.local/share/xorg", "~/.local/state"};
    user_logs.enabled_by_default = true;
    user_logs.older_than_days = 7;
    rules.push_back(std::move(user_logs));

    Rule system_logs{"system-logs", "Old system logs"};
    system_logs.description = "Rotated and stale logs under /var/log";
    system_logs.kind = RuleKind::Logs;
    system_logs.paths = {"/var/log"};
    system_logs.requires_sudo = true;
    system_logs.exclude_globs = {"journal", "journal/**"};
    system_logs.older_than_days = 7;
    rules.push_back(std::move(system_logs));

    Rule tmp{"system-tmp", "Stale /var/tmp files"};
    tmp.paths = {"/var/tmp"};
    tmp.requires_sudo = true;
    tmp.exclude_globs = {"systemd-private-*", "systemd-private-*/**"};
    rules.push_back(std::move(tmp));

    return rules;
}

} // namespace vole
