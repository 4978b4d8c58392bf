#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "error_kind.hpp"
#include "file_target.hpp"
#include "http_transport.hpp"
#include "resolver.hpp"
#include "waiter.hpp"

struct TransferOptions
{
    std::filesystem::path tempDir;   // empty = download in place
    std::filesystem::path outputDir; // empty = current directory
    bool noOverwrite = false;

    // Restarts allowed after a bad status or a cut transfer
    // (nullopt = unlimited)
    std::optional<int> maxRestarts;

    std::int64_t rateLimit = 0; // bytes per second, 0 = unlimited
    std::string networkInterface;

    // Safety wait before retrying a 503 answer
    static constexpr int UNAVAILABLE_WAIT_SECONDS = 120;
};

struct TransferOutcome
{
    ErrorKind kind = ErrorKind::Success;
    std::filesystem::path finalPath;

    // 416 on a resumable link: the file was already complete
    bool alreadyComplete = false;
};

/**
 * Downloads a resolved direct URL to its final place.
 *
 * Each attempt recomputes the file target, fetches into the temp path and
 * looks at the outcome:
 *  - cut transfer: restart (resumable modules) or network error
 *  - 503: wait 120 seconds, restart
 *  - other transport error: returned as Network
 *  - 416: skip if the module can resume, else delete the temp file and restart
 *  - status not 2xx: restart
 *  - 2xx: move temp file to final path
 */
class TransferEngine
{
public:
    TransferEngine(HttpTransport &transport, Waiter &waiter, TransferOptions options);

    /**
     * @param fileUrl Direct URL from the resolver
     * @param filename Local name (already truncated)
     * @param capabilities Resume and cookie behaviour of the module
     * @param cookieFile Cookie jar of the link, sent if the module needs it
     */
    TransferOutcome run(const std::string &fileUrl,
                        const std::string &filename,
                        const ModuleCapabilities &capabilities,
                        const std::filesystem::path &cookieFile);

    /**
     * Number of fetch() calls made by the last run().
     */
    int attempts() const { return attempts_; }

    const TransferOptions &options() const { return options_; }

private:
    // Count one restart; false once the restart budget is spent
    bool allowRestart(int &restarts) const;

    static bool isSuccessStatus(long httpCode);

    ErrorKind moveIntoPlace(const FileTarget &target) const;

    HttpTransport &transport_;
    Waiter &waiter_;
    TransferOptions options_;
    int attempts_ = 0;
};
