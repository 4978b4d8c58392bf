#include "config.hpp"

#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <unistd.h>

#include <fmt/core.h>

std::optional<std::int64_t> parseRateLimit(const std::string &text)
{
    if (text.empty())
    {
        return std::nullopt;
    }

    std::string digits = text;
    std::int64_t multiplier = 1;

    switch (std::tolower(static_cast<unsigned char>(digits.back())))
    {
    case 'k':
        multiplier = 1024;
        break;
    case 'm':
        multiplier = 1024 * 1024;
        break;
    case 'g':
        multiplier = 1024LL * 1024 * 1024;
        break;
    default:
        break;
    }
    if (multiplier != 1)
    {
        digits.pop_back();
    }

    if (digits.empty())
    {
        return std::nullopt;
    }
    for (char ch : digits)
    {
        if (!std::isdigit(static_cast<unsigned char>(ch)))
        {
            return std::nullopt;
        }
    }

    try
    {
        std::int64_t value = std::stoll(digits);
        if (value > std::numeric_limits<std::int64_t>::max() / multiplier)
        {
            return std::nullopt;
        }
        return value * multiplier;
    }
    catch (const std::out_of_range &)
    {
        return std::nullopt;
    }
}

std::filesystem::path defaultModulesFile()
{
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    {
        auto path = std::filesystem::path(xdg) / "linkgrab" / "modules.conf";
        std::error_code ec;
        if (std::filesystem::exists(path, ec))
        {
            return path;
        }
    }
    if (const char *home = std::getenv("HOME"); home && *home)
    {
        auto path = std::filesystem::path(home) / ".config" / "linkgrab" / "modules.conf";
        std::error_code ec;
        if (std::filesystem::exists(path, ec))
        {
            return path;
        }
    }
    return "modules.conf";
}

std::string prepareDirectory(std::string &directory)
{
    while (directory.size() > 1 && directory.back() == '/')
    {
        directory.pop_back();
    }

    try
    {
        std::filesystem::create_directories(directory);
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        return fmt::format("cannot create directory {}: {}", directory, e.what());
    }

    if (::access(directory.c_str(), W_OK) != 0)
    {
        return fmt::format("no write permission ({})", directory);
    }
    return {};
}
