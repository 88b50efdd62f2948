#include "vole/platform.hpp"

#include "vole/logger.hpp"

#include <cstdlib>
#include <vector>

#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

namespace vole::platform {

bool is_root() {
    return ::geteuid() == 0;
}

std::optional<std::string> environment_variable(std::string_view name) {
    const std::string key{name};
    if (const char* value = std::getenv(key.c_str())) {
        return std::string{value};
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> home_of_user(const std::string& user) {
    long size = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    if (size <= 0) {
        size = 16384;
    }
    std::vector<char> buffer(static_cast<std::size_t>(size));
    struct ::passwd pwd {
    };
    struct ::passwd* result = nullptr;
    if (::getpwnam_r(user.c_str(), &pwd, buffer.data(), buffer.size(), &result) != 0 || result == nullptr) {
        return std::nullopt;
    }
    if (result->pw_dir == nullptr || *result->pw_dir == '\0') {
        return std::nullopt;
    }
    return std::filesystem::path{result->pw_dir};
}

std::optional<std::filesystem::path> resolve_home(bool is_root,
    const std::optional<std::filesystem::path>& override_home) {
    if (override_home) {
        return override_home;
    }
    if (is_root) {
        if (auto user = environment_variable("SUDO_USER")) {
            if (auto home = home_of_user(*user)) {
                Logger::instance().log(Logger::Level::Debug, "using home of sudo user {}: {}", *user, home->string());
                return home;
            }
        }
    }
    if (auto home = environment_variable("HOME")) {
        return std::filesystem::path{*home};
    }
    return std::nullopt;
}

} // namespace vole::platform
