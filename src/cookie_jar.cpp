#include "cookie_jar.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace
{
// Create an empty file named stem.XXXXXX in directory
std::filesystem::path createUniqueFile(const std::filesystem::path &directory, const std::string &stem)
{
    // mkstemp wants a writable, NUL-terminated template
    std::string pattern = (directory / (stem + ".XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    int fd = ::mkstemp(buffer.data());
    if (fd < 0)
    {
        throw std::runtime_error(
            fmt::format("Cannot create cookie file in {}: {}", directory.string(), std::strerror(errno)));
    }
    ::close(fd);
    return std::filesystem::path(buffer.data());
}
}

CookieJar CookieJar::create(const std::optional<std::filesystem::path> &seed,
                            const std::filesystem::path &directory)
{
    CookieJar jar{createUniqueFile(directory, "linkgrab.cookies")};

    if (seed)
    {
        std::error_code ec;
        if (std::filesystem::file_size(*seed, ec) > 0 && !ec)
        {
            std::filesystem::copy_file(*seed, jar.path_,
                                       std::filesystem::copy_options::overwrite_existing, ec);
            if (ec)
            {
                throw std::runtime_error(
                    fmt::format("Cannot copy cookies from {}: {}", seed->string(), ec.message()));
            }
        }
    }

    return jar;
}

CookieJar::CookieJar(std::filesystem::path path) : path_(std::move(path))
{
}

CookieJar::~CookieJar()
{
    release();
}

CookieJar::CookieJar(CookieJar &&other) noexcept : path_(std::move(other.path_))
{
    other.path_.clear();
}

CookieJar &CookieJar::operator=(CookieJar &&other) noexcept
{
    if (this != &other)
    {
        release();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

std::filesystem::path CookieJar::keepCopy() const
{
    std::filesystem::path destination = createUniqueFile(path_.parent_path(), "linkgrab.cookies.kept");
    std::error_code ec;
    std::filesystem::copy_file(path_, destination, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec)
    {
        std::error_code ignored;
        std::filesystem::remove(destination, ignored);
        throw std::filesystem::filesystem_error("Cannot copy cookie file", path_, destination, ec);
    }
    return destination;
}

void CookieJar::release() noexcept
{
    if (path_.empty())
    {
        return;
    }

    // Nothing here may throw: this runs from the destructor
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    path_.clear();
}
