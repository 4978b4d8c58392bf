#include "file_target.hpp"

#include "log.hpp"
#include "url_utils.hpp"

std::string filenameFromUrl(const std::string &url)
{
    // Decoding may turn %2F into '/', so sanitize afterwards
    return sanitizeFilename(url_utils::uriDecode(url_utils::basenameFromUrl(url)));
}

std::string sanitizeFilename(const std::string &name)
{
    std::string cleaned;
    cleaned.reserve(name.size());
    for (char ch : name)
    {
        // Drop line breaks a module may have left in the URL
        if (ch == '\r' || ch == '\n')
        {
            continue;
        }
        cleaned += (ch == '/') ? '_' : ch;
    }

    if (cleaned == "." || cleaned == "..")
    {
        return {};
    }
    return cleaned;
}

std::string truncateFilename(const std::string &filename)
{
    size_t characters = 0;
    size_t cut = filename.size();

    for (size_t i = 0; i < filename.size(); ++i)
    {
        // Count lead bytes only; continuation bytes are 10xxxxxx
        if ((static_cast<unsigned char>(filename[i]) & 0xC0) != 0x80)
        {
            if (characters == MAX_FILENAME_LENGTH)
            {
                cut = i;
            }
            ++characters;
        }
    }

    if (characters <= MAX_FILENAME_LENGTH)
    {
        return filename;
    }

    Log::debug("filename is too long, truncating it");
    return filename.substr(0, cut);
}

std::filesystem::path createAlternateName(const std::filesystem::path &base)
{
    for (int count = 1; count <= 99; ++count)
    {
        std::filesystem::path candidate = base;
        candidate += "." + std::to_string(count);

        std::error_code ec;
        if (!std::filesystem::is_regular_file(candidate, ec))
        {
            return candidate;
        }
    }
    return base;
}

FileTarget computeFileTarget(const std::string &filename,
                             const std::filesystem::path &tempDir,
                             const std::filesystem::path &outputDir,
                             bool noOverwrite)
{
    FileTarget target;

    if (!tempDir.empty())
    {
        target.tempPath = tempDir / filename;
    }
    else if (!outputDir.empty())
    {
        target.tempPath = outputDir / filename;
    }
    else
    {
        target.tempPath = filename;
    }

    target.finalPath = outputDir.empty() ? std::filesystem::path(filename) : outputDir / filename;

    std::error_code ec;
    if (noOverwrite && std::filesystem::is_regular_file(target.finalPath, ec))
    {
        if (target.finalPath == target.tempPath)
        {
            target.finalPath = createAlternateName(target.finalPath);
            target.tempPath = target.finalPath;
        }
        else
        {
            target.finalPath = createAlternateName(target.finalPath);
        }
        Log::debug("{} exists, using {}", filename, target.finalPath.string());
    }

    return target;
}
