#pragma once

#include <cstdint>
#include <filesystem>
#include <optional> // C++17 feature for optional values
#include <string>
#include <vector>

/**
 * Configuration for the link downloader.
 * Populated by CLI11 from the command line and the optional config file.
 */
struct DownloadConfig
{
    // URLs and/or files containing links
    std::vector<std::string> items;

    // Verbosity: 0=none, 1=err, 2=notice (default), 3=dbg, 4=report
    int verbose = 2;
    bool quiet = false;

    bool checkLink = false;      // Check if a link exists and return
    bool markDownloaded = false; // Mark links in (regular) FILE arguments
    bool noOverwrite = false;    // Do not overwrite existing files

    std::string outputDirectory;
    std::string tempDirectory;
    std::string limitRate;        // e.g. "100k", "2m"
    std::string networkInterface; // Force this interface

    // Seconds of waits allowed per link (unset = unlimited)
    std::optional<int> timeoutSeconds;

    // Captcha retries (unset = infinite, 0 = no retry)
    std::optional<int> maxRetries;

    std::string captchaMethod; // prompt | none
    bool noExtraWait = false;

    std::optional<std::string> globalCookies; // Cookies file seeding every link

    bool getModule = false;      // Print module(s) for URL(s) and exit
    std::string downloadCommand; // --run-download template
    std::string downloadInfo;    // --download-info-only template
    bool moduleFallback = false; // No module found: simple HTTP GET

    // Module manifest (empty = default location)
    std::string modulesFile;

    // --module-option values, handed to resolver modules
    std::vector<std::string> moduleArgs;

    // Flags
    bool showVersion = false; // Display version and exit
};

/**
 * Parse a --limit-rate value: bytes per second with optional k, m or g
 * suffix (powers of 1024, case-insensitive).
 *
 * @return Bytes per second, nullopt if the text is not a valid speed
 */
std::optional<std::int64_t> parseRateLimit(const std::string &text);

/**
 * Default module manifest: $XDG_CONFIG_HOME/linkgrab/modules.conf, falling
 * back to ~/.config/linkgrab/modules.conf, then ./modules.conf.
 */
std::filesystem::path defaultModulesFile();

/**
 * Create directory if needed and check it is writable.
 * A trailing slash is removed from the stored value.
 *
 * @return Empty string on success, error message otherwise
 */
std::string prepareDirectory(std::string &directory);
