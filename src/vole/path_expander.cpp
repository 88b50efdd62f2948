#include "vole/path_expander.hpp"

#include "vole/logger.hpp"
#include "vole/platform.hpp"

#include <cctype>

namespace vole {

namespace {

bool is_name_char(char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

} // namespace

PathExpander::PathExpander(std::filesystem::path home, EnvLookup env)
    : home_(std::move(home)), env_(std::move(env)) {}

std::optional<std::string> PathExpander::lookup(std::string_view name) const {
    if (name == "HOME" && !home_.empty()) {
        return home_.string();
    }
    if (env_) {
        return env_(name);
    }
    return platform::environment_variable(name);
}

std::optional<std::string> PathExpander::expand_variables(std::string_view text) const {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        const char ch = text[i];
        if (ch != '$' || i + 1 >= text.size()) {
            out.push_back(ch);
            ++i;
            continue;
        }
        std::string_view name;
        std::size_t next = 0;
        if (text[i + 1] == '{') {
            const auto close = text.find('}', i + 2);
            if (close == std::string_view::npos) {
                return std::nullopt;
            }
            name = text.substr(i + 2, close - i - 2);
            next = close + 1;
        } else {
            std::size_t end = i + 1;
            while (end < text.size() && is_name_char(text[end])) {
                ++end;
            }
            if (end == i + 1) {
                out.push_back(ch);
                ++i;
                continue;
            }
            name = text.substr(i + 1, end - i - 1);
            next = end;
        }
        auto value = lookup(name);
        if (!value) {
            return std::nullopt;
        }
        out += *value;
        i = next;
    }
    return out;
}

std::filesystem::path PathExpander::expand(std::string_view raw) const {
    std::string text{raw};
    if (!text.empty() && text.front() == '~' && (text.size() == 1 || text[1] == '/')) {
        if (home_.empty()) {
            Logger::instance().log(Logger::Level::Warn, "cannot expand '{}': home directory unknown", raw);
            return std::filesystem::path{text};
        }
        text = home_.string() + text.substr(1);
    }
    auto expanded = expand_variables(text);
    if (!expanded) {
        Logger::instance().log(Logger::Level::Debug, "leaving '{}' unexpanded: undefined variable", raw);
        return std::filesystem::path{std::string{raw}};
    }
    return std::filesystem::path{*expanded};
}

std::vector<std::filesystem::path> PathExpander::expand_all(const std::vector<std::string>& raw_paths) const {
    std::vector<std::filesystem::path> out;
    out.reserve(raw_paths.size());
    for (const auto& raw : raw_paths) {
        out.push_back(expand(raw));
    }
    return out;
}

} // namespace vole
