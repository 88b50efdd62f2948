#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace vole::platform {

[[nodiscard]] bool is_root();
[[nodiscard]] std::optional<std::string> environment_variable(std::string_view name);
[[nodiscard]] std::optional<std::filesystem::path> home_of_user(const std::string& user);

// Explicit override first, then the invoking user's home when running under
// sudo, then $HOME.
[[nodiscard]] std::optional<std::filesystem::path> resolve_home(bool is_root,
    const std::optional<std::filesystem::path>& override_home);

} // namespace vole::platform
