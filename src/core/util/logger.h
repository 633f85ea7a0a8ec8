#pragma once

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <fmt/core.h>

enum class LogLevel : uint8_t { Debug, Info, Warn, Error };
enum class LogOutput : uint8_t { Console, File, Both };

// Parses "debug", "info", "warn"/"warning" and "error" (case-insensitive).
std::optional<LogLevel> parse_log_level(std::string_view text);
const char *log_level_name(LogLevel level);

class Logger {
public:
    static void init(LogOutput output = LogOutput::Console,
                     LogLevel minLevel = LogLevel::Info,
                     const std::string& logDir = "logs");
    static void shutdown();

    static void set_level(LogLevel level) { s_minLevel = level; }
    static void set_output(LogOutput output) { s_output = output; }
    static LogLevel get_level() { return s_minLevel; }
    static LogOutput get_output() { return s_output; }
    static bool enabled(LogLevel level) { return level == LogLevel::Error || s_minLevel <= level; }

    // Messages seen per level since init, filtered ones included.
    static uint64_t count(LogLevel level);
    static void reset_counts();

    template<typename... Args>
    static void debug(fmt::format_string<Args...> f, Args&&... args)
    {
        if (s_minLevel <= LogLevel::Debug)
            log(LogLevel::Debug, fmt::format(f, std::forward<Args>(args)...));
        else
            bump(LogLevel::Debug);
    }

    template<typename... Args>
    static void info(fmt::format_string<Args...> f, Args&&... args)
    {
        if (s_minLevel <= LogLevel::Info)
            log(LogLevel::Info, fmt::format(f, std::forward<Args>(args)...));
        else
            bump(LogLevel::Info);
    }

    template<typename... Args>
    static void warn(fmt::format_string<Args...> f, Args&&... args)
    {
        if (s_minLevel <= LogLevel::Warn)
            log(LogLevel::Warn, fmt::format(f, std::forward<Args>(args)...));
        else
            bump(LogLevel::Warn);
    }

    template<typename... Args>
    static void error(fmt::format_string<Args...> f, Args&&... args)
    {
        log(LogLevel::Error, fmt::format(f, std::forward<Args>(args)...));
    }

    // Dispatches to the given level at runtime.
    template<typename... Args>
    static void at(LogLevel level, fmt::format_string<Args...> f, Args&&... args)
    {
        if (!enabled(level))
        {
            bump(level);
            return;
        }
        log(level, fmt::format(f, std::forward<Args>(args)...));
    }

private:
    static void log(LogLevel level, std::string_view message);
    static void bump(LogLevel level);

    static LogLevel s_minLevel;
    static LogOutput s_output;
    static std::ofstream s_file;
    static bool s_initialized;
    static uint64_t s_counts[4];
};
