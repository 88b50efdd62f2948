#pragma once

#include "vole/rule.hpp"

#include <vector>

namespace vole {

[[nodiscard]] std::vector<Rule> default_rules();

} // namespace vole
