#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

/**
 * One GET of a direct file URL into a local file.
 */
struct TransferRequest
{
    std::string url;
    std::filesystem::path destination;

    // Continue an existing destination file (Range request from its size)
    bool resume = false;

    // Cookie file sent with the request (nullopt = no cookies)
    std::optional<std::filesystem::path> cookieFile;

    // Bytes per second, 0 = unlimited
    std::int64_t rateLimit = 0;

    // Outgoing network interface, empty = system default
    std::string networkInterface;
};

enum class TransferStatus
{
    Completed,      // body received, see httpCode
    HttpError,      // server answered with an error status (>= 400)
    PartialContent, // connection closed before the announced length
    NetworkError,   // DNS, connect, TLS, read errors...
    Interrupted     // stop requested by the user
};

struct TransferResult
{
    TransferStatus status = TransferStatus::NetworkError;
    long httpCode = 0;
    std::string error; // human-readable reason when not Completed
};

/**
 * HTTP primitive used by the transfer engine and the batch driver.
 */
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    /**
     * Download request.url into request.destination.
     * The destination file is only created once the first byte arrives.
     */
    virtual TransferResult fetch(const TransferRequest &request) = 0;

    /**
     * Ask url once, without User-Agent and without following redirects.
     *
     * @return Location header of a 3xx answer, nullopt otherwise
     */
    virtual std::optional<std::string> probeRedirect(const std::string &url) = 0;
};
