#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vole {

// Expands `~`, `$NAME` and `${NAME}` in configured rule paths. A pattern
// referencing an undefined variable is returned unchanged.
class PathExpander {
public:
    using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

    explicit PathExpander(std::filesystem::path home, EnvLookup env = {});

    [[nodiscard]] std::filesystem::path expand(std::string_view raw) const;
    [[nodiscard]] std::vector<std::filesystem::path> expand_all(const std::vector<std::string>& raw_paths) const;

private:
    std::filesystem::path home_;
    EnvLookup env_;

    [[nodiscard]] std::optional<std::string> lookup(std::string_view name) const;
    [[nodiscard]] std::optional<std::string> expand_variables(std::string_view text) const;
};

} // namespace vole
