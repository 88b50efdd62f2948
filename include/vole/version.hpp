#pragma once

#include <string_view>

namespace vole {

inline constexpr std::string_view kVersion = "0.3.0";

} // namespace vole
