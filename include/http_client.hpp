#pragma once

#include <string>
#include <memory>
#include <optional>
#include <curl/curl.h>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>

#include "http_transport.hpp"

/**
 * HTTP transport for direct file links, using libcurl.
 * Uses RAII to manage CURL handle lifecycle.
 */
class HttpClient : public HttpTransport
{
public:
    /**
     * @param stopFlag Set to non-zero by the SIGINT/SIGTERM handler; an
     *                 ongoing transfer is aborted when it becomes non-zero
     * @throws std::runtime_error if libcurl cannot create a handle
     */
    explicit HttpClient(const volatile std::sig_atomic_t *stopFlag = nullptr);
    ~HttpClient() override;

    // Delete copy operations (CURL handles aren't copyable)
    HttpClient(const HttpClient &) = delete;
    HttpClient &operator=(const HttpClient &) = delete;

    /**
     * Download request.url into request.destination.
     *
     * Resume appends to an existing destination file. If the server ignores
     * the range, the file is discarded and the download restarts from
     * byte 0. Error statuses never write a body (fail-on-error).
     */
    TransferResult fetch(const TransferRequest &request) override;

    /**
     * One request without User-Agent and without following redirects.
     *
     * @return Value of the Location header, if any
     */
    std::optional<std::string> probeRedirect(const std::string &url) override;

private:
    // CURL handle with custom deleter (RAII pattern)
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;

    const volatile std::sig_atomic_t *stopFlag_;

    /**
     * Destination file, opened on the first received chunk so that an
     * error answer leaves no empty file behind.
     */
    struct OutputSink
    {
        std::filesystem::path path;
        std::ios::openmode mode = std::ios::binary;
        std::ofstream stream;
        bool failed = false;
    };

    /**
     * Static callback for libcurl to write downloaded data.
     *
     * @param userdata OutputSink* for the current transfer
     * @return Number of bytes written (size * nmemb on success)
     */
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    // Collects the Location header during probeRedirect()
    static size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userdata);

    // Discards bodies during probeRedirect()
    static size_t discardCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    /**
     * Static progress callback for libcurl.
     * Draws the progress bar and aborts the transfer on user interrupt.
     *
     * @param clientp User data pointer (we pass 'this')
     * @return 0 to continue, non-zero to abort
     */
    static int progressCallback(void *clientp,
                                curl_off_t dltotal,
                                curl_off_t dlnow,
                                curl_off_t ultotal,
                                curl_off_t ulnow);

    TransferResult perform(const TransferRequest &request, curl_off_t resumeOffset);

    /**
     * Map a finished curl call onto a transfer status.
     *
     * @param code CURL result of curl_easy_perform
     */
    TransferStatus classifyResult(CURLcode code) const;

    /**
     * Format bytes into human-readable string (e.g., "52.3 MB")
     */
    std::string formatBytes(curl_off_t bytes) const;

    /**
     * Format duration into human-readable string (e.g., "2m 30s")
     */
    std::string formatDuration(long seconds) const;

    /**
     * Get human-readable HTTP status text for a status code.
     */
    std::string getHttpStatusText(long code) const;

    /**
     * Ensure the directory for a file path exists, creating it if needed.
     *
     * @return Empty string on success, error message otherwise
     */
    std::string ensureDirectoryExists(const std::filesystem::path &filePath) const;

    std::chrono::steady_clock::time_point startTime_;
    std::chrono::steady_clock::time_point lastProgressTime_;
    bool isTerminalOutput_ = true;
    bool showProgress_ = true;

    // Resume support: offset the current transfer started from
    curl_off_t resumeOffset_ = 0;

    // Result of the last curl_easy_perform() in perform()
    CURLcode lastCode_ = CURLE_OK;
};
