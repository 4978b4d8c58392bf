#include "link_item.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>

#include "log.hpp"
#include "url_utils.hpp"

namespace
{
// Extensions of files that are certainly not link lists
constexpr std::array<const char *, 8> BINARY_EXTENSIONS = {
    "zip", "rar", "tar", "gz", "7z", "bz2", "mp3", "avi"};

bool looksBinary(const std::filesystem::path &path)
{
    std::string extension = path.extension().string();
    if (extension.empty())
    {
        return false;
    }
    extension.erase(0, 1); // leading dot
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    return std::find(BINARY_EXTENSIONS.begin(), BINARY_EXTENSIONS.end(), extension) !=
           BINARY_EXTENSIONS.end();
}
}

std::vector<LinkItem> classifyItem(const std::string &argument)
{
    std::vector<LinkItem> items;

    if (url_utils::isRemoteUrl(argument))
    {
        LinkItem item;
        item.kind = LinkSource::DirectUrl;
        item.rawLine = url_utils::strip(argument);
        item.url = url_utils::uriEncode(item.rawLine);
        items.push_back(item);
        return items;
    }

    std::error_code ec;
    std::filesystem::path path(argument);
    if (!std::filesystem::is_regular_file(path, ec))
    {
        Log::error("Skip: cannot stat '{}': No such file or directory", argument);
        return items;
    }

    if (looksBinary(path))
    {
        Log::error("Skip: '{}' seems to be a binary file, not a list of links", argument);
        return items;
    }

    std::ifstream in(path);
    if (!in)
    {
        Log::error("Skip: cannot read '{}'", argument);
        return items;
    }

    std::string line;
    while (std::getline(in, line))
    {
        std::string text = url_utils::strip(line);

        // Discard empty lines and comments
        if (text.empty() || text.front() == '#')
        {
            continue;
        }

        LinkItem item;
        item.kind = LinkSource::FromFile;
        item.sourceFile = path;
        item.rawLine = text;
        item.url = url_utils::uriEncode(text);
        items.push_back(item);
    }

    return items;
}
