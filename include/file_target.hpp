#pragma once

#include <filesystem>
#include <string>

/**
 * Where a transfer writes (tempPath) and where the file ends up (finalPath).
 * Both are equal unless a temporary directory is configured.
 */
struct FileTarget
{
    std::filesystem::path tempPath;
    std::filesystem::path finalPath;
};

// Most filesystems limit a name to 255 bytes
constexpr size_t MAX_FILENAME_LENGTH = 254;

/**
 * Filename for a direct URL when the resolver suggested none:
 * basename of the URL path, query string removed, URI-decoded.
 * Returns an empty string if the URL has no path component.
 */
std::string filenameFromUrl(const std::string &url);

/**
 * Make name usable as a single path component: line breaks are dropped,
 * '/' becomes '_', and "." or ".." give an empty name.
 */
std::string sanitizeFilename(const std::string &name);

/**
 * Cut names of 255 characters or more down to MAX_FILENAME_LENGTH
 * characters. Characters are UTF-8 code points; a sequence is never split.
 */
std::string truncateFilename(const std::string &filename);

/**
 * First "base.N" (N = 1..99) that does not exist as a regular file.
 * If all 99 are taken, base itself is returned.
 */
std::filesystem::path createAlternateName(const std::filesystem::path &base);

/**
 * Compute temp and final paths for filename.
 *
 * - tempPath: tempDir/filename, else outputDir/filename, else filename
 * - finalPath: outputDir/filename, else filename
 * - With noOverwrite and an existing finalPath, finalPath gets a numeric
 *   suffix (createAlternateName); tempPath follows it when both were equal.
 */
FileTarget computeFileTarget(const std::string &filename,
                             const std::filesystem::path &tempDir,
                             const std::filesystem::path &outputDir,
                             bool noOverwrite);
