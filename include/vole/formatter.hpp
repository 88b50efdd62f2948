#pragma once

#include <cstdint>
#include <format>
#include <string>

namespace vole::formatter {

inline std::string file_size(std::uintmax_t size) {
    constexpr auto k1024 = 1024.0;
    constexpr const char* suffixes = "KMGTPE";
    double value = static_cast<double>(size);
    std::size_t idx = 0;
    while (value >= k1024 && idx < 6) {
        value /= k1024;
        ++idx;
    }
    if (idx == 0) {
        return std::format("{} B", size);
    }
    return std::format("{:.1f} {}iB", value, suffixes[idx - 1]);
}

} // namespace vole::formatter
