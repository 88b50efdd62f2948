#include "vole/glob.hpp"

#include "vole/logger.hpp"

#include <format>
#include <string_view>

namespace vole {

namespace {

constexpr std::string_view kRegexSpecials = R"(.^$+()|[]{}\*?)";

void append_literal(std::string& out, char ch) {
    if (kRegexSpecials.find(ch) != std::string_view::npos) {
        out.push_back('\\');
    }
    out.push_back(ch);
}

// Consumes a character class starting at glob[i] == '['. Returns the index
// one past the closing ']' or npos when unterminated.
std::size_t translate_class(std::string_view glob, std::size_t i, std::string& out) {
    std::size_t j = i + 1;
    std::string body;
    if (j < glob.size() && (glob[j] == '!' || glob[j] == '^')) {
        body.push_back('^');
        ++j;
    }
    bool first = true;
    while (j < glob.size()) {
        const char ch = glob[j];
        if (ch == ']' && !first) {
            out += '[';
            out += body;
            out += ']';
            return j + 1;
        }
        if (ch == '\\' || ch == '[' || ch == ']' || ch == '^') {
            body.push_back('\\');
        }
        body.push_back(ch);
        first = false;
        ++j;
    }
    return std::string_view::npos;
}

} // namespace

GlobMatcher::GlobMatcher(std::regex regex, std::vector<std::string> patterns)
    : regex_(std::move(regex)), patterns_(std::move(patterns)) {}

bool GlobMatcher::matches(const std::filesystem::path& relative) const {
    return std::regex_match(relative.generic_string(), regex_);
}

std::optional<std::string> GlobCompiler::to_regex(std::string_view glob, std::string& error) {
    if (glob.empty()) {
        error = "empty pattern";
        return std::nullopt;
    }

    std::string out;
    int brace_depth = 0;
    std::size_t i = 0;
    while (i < glob.size()) {
        const char ch = glob[i];
        switch (ch) {
        case '\\':
            if (i + 1 >= glob.size()) {
                error = "dangling '\\' escape";
                return std::nullopt;
            }
            append_literal(out, glob[i + 1]);
            i += 2;
            continue;
        case '?':
            out += '.';
            break;
        case '*': {
            const bool double_star = i + 1 < glob.size() && glob[i + 1] == '*';
            if (!double_star) {
                out += ".*";
                break;
            }
            const bool at_segment_start = i == 0 || glob[i - 1] == '/';
            const bool slash_follows = i + 2 < glob.size() && glob[i + 2] == '/';
            if (at_segment_start && slash_follows) {
                out += "(?:.*/)?";
                i += 3;
                continue;
            }
            out += ".*";
            i += 2;
            continue;
        }
        case '[': {
            const auto next = translate_class(glob, i, out);
            if (next == std::string_view::npos) {
                error = "unclosed character class";
                return std::nullopt;
            }
            i = next;
            continue;
        }
        case '{':
            ++brace_depth;
            out += "(?:";
            break;
        case '}':
            if (brace_depth > 0) {
                --brace_depth;
                out += ')';
            } else {
                append_literal(out, ch);
            }
            break;
        case ',':
            if (brace_depth > 0) {
                out += '|';
            } else {
                out += ',';
            }
            break;
        default:
            append_literal(out, ch);
            break;
        }
        ++i;
    }

    if (brace_depth != 0) {
        error = "unclosed alternation";
        return std::nullopt;
    }
    return out;
}

GlobCompileResult GlobCompiler::compile(const std::vector<std::string>& patterns) {
    GlobCompileResult result;
    if (patterns.empty()) {
        return result;
    }

    std::string combined;
    std::vector<std::string> accepted;
    for (const auto& pattern : patterns) {
        std::string error;
        auto source = to_regex(pattern, error);
        if (source) {
            try {
                std::regex probe{*source};
            } catch (const std::regex_error& e) {
                error = e.what();
                source.reset();
            }
        }
        if (!source) {
            result.errors.push_back(std::format("invalid exclude glob '{}': {}", pattern, error));
            Logger::instance().log(Logger::Level::Warn, "{}", result.errors.back());
            continue;
        }
        if (!combined.empty()) {
            combined += '|';
        }
        combined += "(?:" + *source + ")";
        accepted.push_back(pattern);
    }

    if (accepted.empty()) {
        return result;
    }

    try {
        result.matcher.emplace(GlobMatcher{std::regex{combined, std::regex::ECMAScript | std::regex::optimize},
            std::move(accepted)});
    } catch (const std::regex_error& e) {
        result.errors.push_back(std::format("could not build exclude matcher: {}", e.what()));
        Logger::instance().log(Logger::Level::Warn, "{}", result.errors.back());
    }
    return result;
}

} // namespace vole
