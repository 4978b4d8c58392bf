#pragma once

#include <string_view>
#include <utility>

#include <fmt/core.h>

/**
 * Verbosity levels, from quiet to most talkative.
 * The numeric values are the ones accepted by -v/--verbose.
 */
enum class LogLevel
{
    None = 0,
    Error = 1,
    Notice = 2, // default
    Debug = 3,
    Report = 4
};

/**
 * Process-wide console logger.
 *
 * Everything goes to stderr so that stdout only carries results
 * (downloaded file paths, marks, module names).
 */
class Log
{
public:
    static void setLevel(LogLevel level);
    static LogLevel level();

    /**
     * True if messages at the given level would be printed.
     */
    static bool enabled(LogLevel level);

    template <typename... Args>
    static void error(fmt::format_string<Args...> format, Args &&...args)
    {
        write(LogLevel::Error, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void notice(fmt::format_string<Args...> format, Args &&...args)
    {
        write(LogLevel::Notice, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(fmt::format_string<Args...> format, Args &&...args)
    {
        write(LogLevel::Debug, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void report(fmt::format_string<Args...> format, Args &&...args)
    {
        write(LogLevel::Report, fmt::format(format, std::forward<Args>(args)...));
    }

private:
    static void write(LogLevel level, std::string_view message);
};
