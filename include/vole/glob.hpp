#pragma once

#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace vole {

// Set of exclusion globs compiled into one regular expression. Paths handed
// to matches() are relative to the root being scanned.
class GlobMatcher {
public:
    [[nodiscard]] bool matches(const std::filesystem::path& relative) const;
    [[nodiscard]] const std::vector<std::string>& patterns() const noexcept { return patterns_; }

private:
    friend struct GlobCompiler;

    GlobMatcher(std::regex regex, std::vector<std::string> patterns);

    std::regex regex_;
    std::vector<std::string> patterns_;
};

struct GlobCompileResult {
    std::optional<GlobMatcher> matcher {};
    std::vector<std::string> errors {};
};

struct GlobCompiler {
    // Translates one glob into ECMAScript regex source. Supports `?`, `*`,
    // `**`, character classes, `{a,b}` alternation and `\` escapes.
    // Returns nullopt and fills `error` when the pattern is malformed.
    [[nodiscard]] static std::optional<std::string> to_regex(std::string_view glob, std::string& error);

    [[nodiscard]] static GlobCompileResult compile(const std::vector<std::string>& patterns);
};

[[nodiscard]] inline GlobCompileResult compile_globs(const std::vector<std::string>& patterns) {
    return GlobCompiler::compile(patterns);
}

} // namespace vole
