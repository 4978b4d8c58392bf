#pragma once

#include <filesystem>
#include <string>
#include <vector>

/**
 * Where a link came from.
 */
enum class LinkSource
{
    DirectUrl, // given on the command line
    FromFile   // read from a link-list file
};

/**
 * One unit of work for the batch driver. Immutable once created.
 */
struct LinkItem
{
    LinkSource kind = LinkSource::DirectUrl;
    std::string url;                  // stripped and URI-encoded
    std::filesystem::path sourceFile; // set iff kind == FromFile
    std::string rawLine;              // stripped line text, used for annotation
};

/**
 * Turn one command-line argument into link items.
 *
 * - A remote URL yields a single DirectUrl item.
 * - An existing text file yields one FromFile item per line that is not
 *   empty and does not start with '#'.
 * - Archives/media files and missing paths are skipped with an error.
 *
 * @param argument URL or path given by the user
 * @return Items in file order (possibly empty)
 */
std::vector<LinkItem> classifyItem(const std::string &argument);
