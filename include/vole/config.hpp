#pragma once

#include "vole/logger.hpp"
#include "vole/rule.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vole {

class Config {
public:
    struct Data {
        bool dry_run { false };
        bool sudo { false };
        bool yes { false };
        bool list_rules { false };
        std::vector<std::string> rule_ids {};
        std::optional<DownloadsChoice> downloads_choice {};
        std::optional<std::filesystem::path> user_home {};
        Logger::Level log_level { Logger::Level::Error };
    };

    static Config& instance();

    [[nodiscard]] const Data& data() const noexcept { return data_; }
    [[nodiscard]] Data& data() noexcept { return data_; }

private:
    Config() = default;

    Data data_ {};
};

} // namespace vole
