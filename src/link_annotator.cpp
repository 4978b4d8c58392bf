#include "link_annotator.hpp"

#include <fstream>
#include <sstream>
#include <unistd.h>
#include <vector>

#include "log.hpp"
#include "url_utils.hpp"

LinkAnnotator::LinkAnnotator(bool enabled, std::ostream &out) : enabled_(enabled), out_(out)
{
}

bool LinkAnnotator::mark(const LinkItem &item, const std::string &tag, const std::string &suffix)
{
    if (!enabled_)
    {
        return true;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (item.kind != LinkSource::FromFile)
    {
        out_ << "#" << tag << " " << item.url << std::endl;
        return true;
    }

    if (::access(item.sourceFile.c_str(), W_OK) != 0)
    {
        Log::notice("error: can't mark link, no write permission ({})", item.sourceFile.string());
        return false;
    }

    std::string replacement = "#" + tag + " " + item.rawLine + suffix;
    int count = rewriteFile(item.sourceFile, item.rawLine, replacement);

    if (count < 0)
    {
        Log::error("failed marking link in file: {} (#{})", item.sourceFile.string(), tag);
        return false;
    }
    if (count == 0)
    {
        Log::debug("link not found in file: {} ({})", item.sourceFile.string(), item.rawLine);
        return false;
    }

    Log::notice("link marked in file: {} (#{})", item.sourceFile.string(), tag);
    return true;
}

int LinkAnnotator::rewriteFile(const std::filesystem::path &file, const std::string &line,
                               const std::string &replacement) const
{
    std::ifstream in(file, std::ios::binary);
    if (!in)
    {
        return -1;
    }

    std::ostringstream content;
    content << in.rdbuf();
    in.close();
    const std::string text = content.str();

    // Split keeping track of a final newline so the file shape is preserved
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size())
    {
        auto end = text.find('\n', start);
        if (end == std::string::npos)
        {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    const bool endsWithNewline = !text.empty() && text.back() == '\n';

    int count = 0;
    for (auto &current : lines)
    {
        // Keep a CRLF ending if the file uses them
        bool hasCr = !current.empty() && current.back() == '\r';
        if (url_utils::strip(current) == line)
        {
            current = replacement + (hasCr ? "\r" : "");
            ++count;
        }
    }

    if (count == 0)
    {
        return 0;
    }

    std::filesystem::path tempFile = file;
    tempFile += ".linkgrab-tmp";
    {
        std::ofstream out(tempFile, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            return -1;
        }
        for (size_t i = 0; i < lines.size(); ++i)
        {
            out << lines[i];
            if (i + 1 < lines.size() || endsWithNewline)
            {
                out << '\n';
            }
        }
        if (!out.good())
        {
            std::error_code ec;
            std::filesystem::remove(tempFile, ec);
            return -1;
        }
    }

    std::error_code ec;
    std::filesystem::permissions(tempFile, std::filesystem::status(file, ec).permissions(), ec);
    std::filesystem::rename(tempFile, file, ec);
    if (ec)
    {
        Log::debug("rename {} failed: {}", tempFile.string(), ec.message());
        std::filesystem::remove(tempFile, ec);
        return -1;
    }

    return count;
}
