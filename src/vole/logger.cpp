#include "vole/logger.hpp"

#include <array>
#include <iostream>

namespace vole {

namespace {

constexpr std::array<std::string_view, 5> kLevelNames { "ERROR", "WARN", "INFO", "DEBUG", "TRACE" };

} // namespace

Logger& Logger::instance() {
    static Logger shared;
    return shared;
}

void Logger::redirect(std::ostream& sink) {
    std::lock_guard guard(sink_mutex_);
    sink_ = &sink;
}

void Logger::restore_default_output() {
    std::lock_guard guard(sink_mutex_);
    sink_ = nullptr;
}

std::string_view Logger::to_string(Level level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    return index < kLevelNames.size() ? kLevelNames[index] : "UNKNOWN";
}

void Logger::emit(Level level, std::string_view message) {
    std::lock_guard guard(sink_mutex_);
    std::ostream& out = sink_ != nullptr ? *sink_ : std::clog;
    out << std::format("vole [{}] {}\n", to_string(level), message);
}

} // namespace vole
