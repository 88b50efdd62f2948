#pragma once

#include "vole/apply.hpp"
#include "vole/cli.hpp"
#include "vole/dry_run.hpp"
#include "vole/rule.hpp"
#include "vole/scan.hpp"

#include <filesystem>
#include <vector>

namespace vole {

class App {
public:
    App() = default;
    int run(int argc, char** argv);

private:
    Cli cli_;

    [[nodiscard]] std::vector<Rule> select_rules(const std::vector<Rule>& available, const Config::Data& data) const;
    void print_rules(const std::vector<Rule>& rules) const;
    void print_plan(const std::vector<RuleScan>& scans) const;
    void emit_dry_run(const std::vector<RuleScan>& scans, const std::filesystem::path& home) const;
    void emit_clean_report(const CleanReport& report) const;
};

} // namespace vole
