#pragma once

#include <atomic>
#include <format>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace vole {

// Process-wide diagnostics sink. Messages below the active level are
// dropped before formatting.
class Logger {
public:
    enum class Level {
        Error = 0,
        Warn,
        Info,
        Debug,
        Trace,
    };

    static Logger& instance();

    void set_level(Level level) noexcept { threshold_.store(level, std::memory_order_relaxed); }
    [[nodiscard]] Level level() const noexcept { return threshold_.load(std::memory_order_relaxed); }
    [[nodiscard]] bool enabled(Level level) const noexcept { return level <= this->level(); }

    // Sends output to `sink` until restore_default_output() is called.
    void redirect(std::ostream& sink);
    void restore_default_output();

    template <typename... Args>
    void log(Level level, std::format_string<Args...> fmt, Args&&... args) {
        if (enabled(level)) {
            emit(level, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    [[nodiscard]] static std::string_view to_string(Level level) noexcept;

private:
    Logger() = default;

    void emit(Level level, std::string_view message);

    std::atomic<Level> threshold_ { Level::Error };
    std::ostream* sink_ { nullptr };
    std::mutex sink_mutex_;
};

} // namespace vole
