#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace vole::string_utils {

inline std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

inline bool equals_ignore_case(std::string_view a, std::string_view b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

inline bool ends_with_ignore_case(std::string_view value, std::string_view suffix) {
    return value.size() >= suffix.size() && equals_ignore_case(value.substr(value.size() - suffix.size()), suffix);
}

inline std::string trim(std::string_view value) {
    auto is_space = [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; };
    auto begin = std::find_if_not(value.begin(), value.end(), is_space);
    auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

} // namespace vole::string_utils
