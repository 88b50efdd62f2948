#include "vole/cli.hpp"

#include "vole/version.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <map>
#include <string>

namespace vole {

namespace {

Logger::Level parse_log_level(const std::string& value) {
    static const std::map<std::string, Logger::Level, std::less<>> table{
        {"error", Logger::Level::Error},
        {"warn", Logger::Level::Warn},
        {"warning", Logger::Level::Warn},
        {"info", Logger::Level::Info},
        {"debug", Logger::Level::Debug},
        {"trace", Logger::Level::Trace},
    };
    auto it = table.find(value);
    if (it == table.end()) {
        throw CLI::ValidationError("--log-level", "invalid log level: " + value);
    }
    return it->second;
}

} // namespace

std::optional<int> Cli::parse(int argc, char** argv, Config& config) const {
    auto& data = config.data();
    std::string log_level{"error"};
    std::string downloads;
    std::string user_home;

    CLI::App app{"Safe cleanup of caches, logs and extracted downloads", "vole"};

    auto* version_flag = app.add_flag("-V,--version", "Print version information and exit");
    app.add_flag("--dry-run", data.dry_run, "Preview cleanup without deleting anything");
    app.add_flag("--sudo", data.sudo, "Include system rules that require root");
    app.add_flag("--yes", data.yes, "Delete without asking (required to apply)");
    app.add_flag("--list-rules", data.list_rules, "List available rules and exit");
    app.add_option("--rule", data.rule_ids, "Limit to specific rule IDs (repeatable)")->type_name("ID");
    app.add_option("--downloads-remove", downloads, "Side of archive/folder pairs to remove (archives, folders)")
        ->type_name("WHAT")
        ->check(CLI::IsMember({"archives", "folders", "a", "f", "archive", "folder"}, CLI::ignore_case));
    app.add_option("--user-home", user_home, "Home directory to clean instead of the invoking user's")
        ->type_name("PATH");
    app.add_option("-v,--log-level", log_level, "Set log verbosity (error, warn, info, debug, trace)")
        ->type_name("LEVEL")
        ->default_str("error");

    try {
        app.parse(argc, argv);
        data.log_level = parse_log_level(log_level);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (*version_flag) {
        std::cout << "vole version " << kVersion << std::endl;
        return 0;
    }

    if (!downloads.empty()) {
        data.downloads_choice = parse_downloads_choice(downloads);
    }
    if (!user_home.empty()) {
        data.user_home = std::filesystem::path{user_home};
    }
    Logger::instance().set_level(data.log_level);
    return std::nullopt;
}

} // namespace vole
