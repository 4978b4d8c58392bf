#include "log.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>

namespace
{
std::atomic<int> currentLevel{static_cast<int>(LogLevel::Notice)};
std::mutex writeMutex;
}

void Log::setLevel(LogLevel level)
{
    currentLevel.store(static_cast<int>(level));
}

LogLevel Log::level()
{
    return static_cast<LogLevel>(currentLevel.load());
}

bool Log::enabled(LogLevel level)
{
    return level != LogLevel::None && static_cast<int>(level) <= currentLevel.load();
}

void Log::write(LogLevel level, std::string_view message)
{
    if (!enabled(level))
    {
        return;
    }

    // One line at a time, even if several links log concurrently
    std::lock_guard<std::mutex> lock(writeMutex);
    fmt::print(stderr, "{}\n", message);
    std::fflush(stderr);
}
