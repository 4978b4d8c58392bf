#pragma once

#include <filesystem>
#include <mutex>
#include <ostream>
#include <string>

#include "link_item.hpp"

/**
 * Records the outcome of a link in its link-list file (--mark-downloaded).
 *
 * For a link read from a file, every line equal to the link's original
 * text becomes "#TAG <line><suffix>". The file is rewritten through a temp
 * file and a rename, one writer at a time. For a link given on the command
 * line, "#TAG <url>" is printed instead.
 */
class LinkAnnotator
{
public:
    /**
     * @param enabled Marking requested by the user; otherwise mark() is a no-op
     * @param out Stream receiving marks of command-line links
     */
    LinkAnnotator(bool enabled, std::ostream &out);

    /**
     * @param item Link to mark
     * @param tag NOTFOUND, PASSWORD, NOMODULE, or empty for a completed download
     * @param suffix Appended to the line, e.g. "|/path/to/file"
     * @return true if the mark was written (or marking is disabled)
     */
    bool mark(const LinkItem &item, const std::string &tag, const std::string &suffix = "");

    bool enabled() const { return enabled_; }

private:
    /**
     * @return Number of lines rewritten, or -1 on I/O failure
     */
    int rewriteFile(const std::filesystem::path &file, const std::string &line,
                    const std::string &replacement) const;

    bool enabled_;
    std::ostream &out_;
    std::mutex mutex_;
};
