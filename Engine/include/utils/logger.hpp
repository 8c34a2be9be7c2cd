#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace Russell {

/**
 * @brief Thread-safe logging utility for the engine.
 *
 * Writes to stderr so that tools can keep stdout for JSON records.
 */
class Logger {
public:
    enum class Level {
        Debug = 0,
        Info,
        Step,
        Success,
        Warning,
        Error,
        Silent
    };

    static void set_level(Level level) { threshold().store(level); }
    static Level level() { return threshold().load(); }
    static void set_color(bool enabled) { color_enabled().store(enabled); }

    static bool enabled(Level level) {
        return level != Level::Silent && level >= threshold().load();
    }

    static void log(Level level, const std::string& message) {
        if (!enabled(level)) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;90m"; prefix = "... "; break; // Grey
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
            case Level::Silent:  return;
        }

        if (color_enabled().load()) {
            std::cerr << color << prefix << message << "\033[0m" << std::endl;
        } else {
            std::cerr << prefix << message << std::endl;
        }
    }

    static void debug(const std::string& msg)   { log(Level::Debug, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

    /**
     * @brief Parse "debug", "info", "warn", ... (case-sensitive, lowercase)
     */
    static std::optional<Level> parse_level(std::string_view name) {
        if (name == "debug")   return Level::Debug;
        if (name == "info")    return Level::Info;
        if (name == "step")    return Level::Step;
        if (name == "success") return Level::Success;
        if (name == "warn" || name == "warning") return Level::Warning;
        if (name == "error")   return Level::Error;
        if (name == "silent" || name == "off") return Level::Silent;
        return std::nullopt;
    }

private:
    static std::atomic<Level>& threshold() {
        static std::atomic<Level> value{Level::Info};
        return value;
    }

    static std::atomic<bool>& color_enabled() {
        static std::atomic<bool> value{true};
        return value;
    }
};

} // namespace Russell
