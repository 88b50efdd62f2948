#pragma once

#include "vole/config.hpp"

#include <optional>

namespace vole {

class Cli {
public:
    // Fills `config` from argv. Returns an exit code when the process should
    // stop (help, version, parse error) and nullopt otherwise.
    [[nodiscard]] std::optional<int> parse(int argc, char** argv, Config& config) const;
};

} // namespace vole
