#pragma once

#include <cstdint>
#include <filesystem>
#include <string_view>

namespace vole {

[[nodiscard]] bool is_log_name(std::string_view file_name);

// now - days * 24h, clamped to the earliest representable instant.
[[nodiscard]] std::filesystem::file_time_type log_cutoff(std::filesystem::file_time_type now, std::uint64_t days) noexcept;

} // namespace vole
