#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace vole {

inline constexpr std::array<std::string_view, 7> kArchiveExtensions{
    ".tar.gz", ".tgz", ".tar.xz", ".tar.zst", ".zip", ".7z", ".rar",
};

// Name of the folder an archive would extract to: `project.tar.gz` gives
// `project`. The suffix match ignores case.
[[nodiscard]] std::optional<std::string> archive_base_name(std::string_view file_name);

} // namespace vole
