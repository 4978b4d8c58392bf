#include "url_utils.hpp"

#include <cctype>
#include <cstring>

#include <fmt/core.h>

namespace url_utils
{
namespace
{
bool isSpace(char ch)
{
    return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
}

int hexValue(char ch)
{
    if (ch >= '0' && ch <= '9')
        return ch - '0';
    if (ch >= 'a' && ch <= 'f')
        return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F')
        return ch - 'A' + 10;
    return -1;
}
}

std::string strip(const std::string &text)
{
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && isSpace(text[begin]))
        ++begin;
    while (end > begin && isSpace(text[end - 1]))
        --end;
    return text.substr(begin, end - begin);
}

namespace
{
// Lowercase scheme of text, empty if there is no "://"
std::string lowerScheme(const std::string &text)
{
    std::string candidate = strip(text);
    auto schemeEnd = candidate.find("://");
    if (schemeEnd == std::string::npos)
    {
        return {};
    }

    std::string scheme = candidate.substr(0, schemeEnd);
    for (char &ch : scheme)
    {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return scheme;
}
}

bool isRemoteUrl(const std::string &text)
{
    std::string scheme = lowerScheme(text);
    return scheme == "http" || scheme == "https" || scheme == "ftp";
}

bool isHttpUrl(const std::string &url)
{
    std::string scheme = lowerScheme(url);
    return scheme == "http" || scheme == "https";
}

std::string uriEncode(const std::string &url)
{
    static const char *unsafe = " \"<>`{}|";

    std::string result;
    result.reserve(url.size());
    for (char ch : url)
    {
        if (ch != '\0' && std::strchr(unsafe, ch))
        {
            result += fmt::format("%{:02X}", static_cast<unsigned char>(ch));
        }
        else
        {
            result += ch;
        }
    }
    return result;
}

std::string uriDecode(const std::string &text)
{
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '%' && i + 2 < text.size())
        {
            int high = hexValue(text[i + 1]);
            int low = hexValue(text[i + 2]);
            if (high >= 0 && low >= 0)
            {
                result += static_cast<char>(high * 16 + low);
                i += 2;
                continue;
            }
        }
        result += text[i];
    }
    return result;
}

std::string replaceAll(std::string text, const std::string &token, const std::string &value)
{
    if (token.empty())
    {
        return text;
    }

    size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos)
    {
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
    return text;
}

std::string basenameFromUrl(const std::string &url)
{
    std::string path = url.substr(0, url.find_first_of("?#"));

    // Skip "scheme://host" so a bare host does not become the name
    auto schemeEnd = path.find("://");
    if (schemeEnd != std::string::npos)
    {
        auto pathStart = path.find('/', schemeEnd + 3);
        path = (pathStart == std::string::npos) ? std::string() : path.substr(pathStart);
    }

    while (!path.empty() && path.back() == '/')
    {
        path.pop_back();
    }

    auto slash = path.find_last_of('/');
    return (slash == std::string::npos) ? path : path.substr(slash + 1);
}
}
