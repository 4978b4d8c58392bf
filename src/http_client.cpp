#include "http_client.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <unistd.h>

#include <fmt/core.h>

#include "log.hpp"
#include "url_utils.hpp"

HttpClient::HttpClient(const volatile std::sig_atomic_t *stopFlag)
    : curl_(curl_easy_init(), curl_easy_cleanup), stopFlag_(stopFlag)
{
    if (!curl_)
    {
        throw std::runtime_error("Failed to initialized CURL (out of memory or library error)");
    }

    // Progress goes to stderr: decide how we render it from there
    isTerminalOutput_ = ::isatty(fileno(stderr));
}

// Destructor: unique_ptr handles cleanup automatically
HttpClient::~HttpClient() = default;

// Static callback: libcurl calls this with chunks of downloaded data
size_t HttpClient::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    size_t totalSize = size * nmemb;
    auto *sink = static_cast<OutputSink *>(userdata);

    if (!sink->stream.is_open())
    {
        sink->stream.open(sink->path, sink->mode);
        if (!sink->stream)
        {
            sink->failed = true;
            return 0; // Abort transfer: cannot create destination
        }
    }

    sink->stream.write(ptr, static_cast<std::streamsize>(totalSize));
    if (!sink->stream.good())
    {
        sink->failed = true;
        return 0; // Abort transfer if write fails
    }

    return totalSize;
}

size_t HttpClient::headerCallback(char *buffer, size_t size, size_t nitems, void *userdata)
{
    size_t total = size * nitems;
    auto *location = static_cast<std::string *>(userdata);

    std::string header(buffer, total);
    auto colon = header.find(':');
    if (colon != std::string::npos)
    {
        std::string name = header.substr(0, colon);
        for (char &ch : name)
        {
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        if (name == "location")
        {
            *location = url_utils::strip(header.substr(colon + 1));
        }
    }
    return total;
}

size_t HttpClient::discardCallback(char *, size_t, size_t, void *)
{
    // Headers are all we need; stop before the body
    return 0;
}

TransferResult HttpClient::fetch(const TransferRequest &request)
{
    TransferResult result;

    std::string dirError = ensureDirectoryExists(request.destination);
    if (!dirError.empty())
    {
        result.status = TransferStatus::NetworkError;
        result.error = dirError;
        return result;
    }

    // Existing bytes are kept only when resuming
    curl_off_t resumeOffset = 0;
    if (request.resume)
    {
        std::error_code ec;
        if (std::filesystem::is_regular_file(request.destination, ec))
        {
            resumeOffset = static_cast<curl_off_t>(std::filesystem::file_size(request.destination, ec));
            if (ec)
            {
                resumeOffset = 0;
            }
        }
        if (resumeOffset > 0)
        {
            Log::notice("Found partial download ({} already downloaded), resuming", formatBytes(resumeOffset));
        }
    }

    result = perform(request, resumeOffset);

    if (resumeOffset > 0 && lastCode_ == CURLE_RANGE_ERROR)
    {
        // Server sent the whole file instead of the range we asked for
        Log::notice("Server doesn't support resume. Restarting download from beginning...");
        std::error_code ec;
        std::filesystem::remove(request.destination, ec);
        result = perform(request, 0);
    }

    return result;
}

TransferResult HttpClient::perform(const TransferRequest &request, curl_off_t resumeOffset)
{
    CURL *curl = curl_.get();
    curl_easy_reset(curl);

    OutputSink sink;
    sink.path = request.destination;
    sink.mode = std::ios::binary | (resumeOffset > 0 ? std::ios::app : std::ios::trunc);

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "linkgrab/1.0");
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);

    // HTTPS settings
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    // Hosters commonly bounce through a few redirects before the file
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L);

    // Error statuses must not end up in the file
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);

    curl_easy_setopt(curl, CURLOPT_RESUME_FROM_LARGE, resumeOffset);

    if (request.cookieFile)
    {
        curl_easy_setopt(curl, CURLOPT_COOKIEFILE, request.cookieFile->c_str());
    }
    if (request.rateLimit > 0)
    {
        curl_easy_setopt(curl, CURLOPT_MAX_RECV_SPEED_LARGE, static_cast<curl_off_t>(request.rateLimit));
    }
    if (!request.networkInterface.empty())
    {
        curl_easy_setopt(curl, CURLOPT_INTERFACE, request.networkInterface.c_str());
    }

    // Progress callback also watches the stop flag, keep it on
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, this);

    startTime_ = std::chrono::steady_clock::now();
    lastProgressTime_ = startTime_;
    resumeOffset_ = resumeOffset;
    showProgress_ = Log::enabled(LogLevel::Notice);

    CURLcode res = curl_easy_perform(curl);
    lastCode_ = res;

    if (sink.stream.is_open())
    {
        sink.stream.close();
    }
    if (showProgress_ && isTerminalOutput_)
    {
        fmt::print(stderr, "\n");
    }

    TransferResult result;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.httpCode);
    result.status = classifyResult(res);

    if (sink.failed)
    {
        result.status = TransferStatus::NetworkError;
        result.error = fmt::format("Cannot write to {}", request.destination.string());
    }
    else if (result.status == TransferStatus::HttpError)
    {
        result.error = fmt::format("HTTP error {}: {}", result.httpCode, getHttpStatusText(result.httpCode));
    }
    else if (res != CURLE_OK)
    {
        result.error = curl_easy_strerror(res);
    }

    Log::report("curl result {} ({}), HTTP {}", static_cast<int>(res), curl_easy_strerror(res), result.httpCode);
    return result;
}

std::optional<std::string> HttpClient::probeRedirect(const std::string &url)
{
    CURL *curl = curl_.get();
    curl_easy_reset(curl);

    // "User-Agent:" with no value removes the header
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(
        curl_slist_append(nullptr, "User-Agent:"), curl_slist_free_all);

    std::string location;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &location);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discardCallback);

    // A write error is expected (we stop at the body); headers are already in
    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK && res != CURLE_WRITE_ERROR)
    {
        Log::debug("redirection probe failed: {}", curl_easy_strerror(res));
    }

    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
    if (httpCode / 100 != 3 || location.empty())
    {
        return std::nullopt;
    }
    return location;
}

int HttpClient::progressCallback(void *clientp,
                                 curl_off_t dltotal,
                                 curl_off_t dlnow,
                                 curl_off_t ultotal,
                                 curl_off_t ulnow)
{
    // Suppress unused parameter warnings
    (void)ultotal;
    (void)ulnow;

    auto *client = static_cast<HttpClient *>(clientp);

    if (client->stopFlag_ && *client->stopFlag_)
    {
        return 1; // abort: CURLE_ABORTED_BY_CALLBACK
    }

    if (!client->showProgress_)
    {
        return 0;
    }

    auto now = std::chrono::steady_clock::now();
    auto timeSinceStart = std::chrono::duration_cast<std::chrono::milliseconds>(now - client->startTime_).count();
    auto timeSinceLastUpdate =
        std::chrono::duration_cast<std::chrono::milliseconds>(now - client->lastProgressTime_).count();
    bool isComplete = (dltotal > 0 && dlnow >= dltotal);

    // Throttle: nothing in the first 500ms, then 5 updates per second on a
    // terminal and one per second otherwise
    long interval = client->isTerminalOutput_ ? 200 : 1000;
    if (!isComplete && (timeSinceStart < 500 || timeSinceLastUpdate < interval))
    {
        return 0;
    }
    client->lastProgressTime_ = now;

    // For resumed downloads dltotal/dlnow only cover this request
    curl_off_t totalDownloaded = dlnow + client->resumeOffset_;
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - client->startTime_).count();
    double speed = (elapsed > 0) ? static_cast<double>(dlnow) / elapsed : 0.0;

    std::string line;
    if (dltotal == 0)
    {
        line = fmt::format("Downloaded: {} | Elapsed: {}",
                           client->formatBytes(totalDownloaded),
                           client->formatDuration(static_cast<long>(elapsed)));
    }
    else
    {
        curl_off_t totalSize = dltotal + client->resumeOffset_;
        double percentage = (static_cast<double>(totalDownloaded) / totalSize) * 100.0;
        long eta = (speed > 0) ? static_cast<long>((totalSize - totalDownloaded) / speed) : 0;

        // Progress bar (50 characters wide)
        const int barWidth = 50;
        int filled = static_cast<int>((percentage / 100.0) * barWidth);
        std::string bar = "[";
        for (int i = 0; i < barWidth; ++i)
        {
            bar += (i < filled) ? '=' : (i == filled ? '>' : ' ');
        }
        bar += "]";

        line = fmt::format("{} {:.1f}% | {} / {} | {}/s | ETA: {}",
                           bar,
                           percentage,
                           client->formatBytes(totalDownloaded),
                           client->formatBytes(totalSize),
                           client->formatBytes(static_cast<curl_off_t>(speed)),
                           client->formatDuration(eta));
    }

    if (client->isTerminalOutput_)
    {
        fmt::print(stderr, "\r{}\033[K", line);
    }
    else
    {
        fmt::print(stderr, "{}\n", line);
    }
    std::fflush(stderr);

    return 0;
}

// Map curl result onto what the transfer engine cares about
TransferStatus HttpClient::classifyResult(CURLcode code) const
{
    switch (code)
    {
    case CURLE_OK:
        return TransferStatus::Completed;

    // Server answered >= 400 (fail-on-error)
    case CURLE_HTTP_RETURNED_ERROR:
        return TransferStatus::HttpError;

    // Transfer ended early (network interruption)
    case CURLE_PARTIAL_FILE:
        return TransferStatus::PartialContent;

    case CURLE_ABORTED_BY_CALLBACK:
        if (stopFlag_ && *stopFlag_)
        {
            return TransferStatus::Interrupted;
        }
        return TransferStatus::NetworkError;

    default:
        // The engine still looks at httpCode (e.g. 503 with a reset connection)
        return TransferStatus::NetworkError;
    }
}

// Format bytes into human-readable string
std::string HttpClient::formatBytes(curl_off_t bytes) const
{
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    if (bytes >= GB)
    {
        return fmt::format("{:.2f} GB", bytes / GB);
    }
    else if (bytes >= MB)
    {
        return fmt::format("{:.2f} MB", bytes / MB);
    }
    else if (bytes >= KB)
    {
        return fmt::format("{:.2f} KB", bytes / KB);
    }
    else
    {
        return fmt::format("{} B", bytes);
    }
}

// Format duration into human-readable string
std::string HttpClient::formatDuration(long seconds) const
{
    if (seconds < 0)
    {
        return "unknown";
    }
    else if (seconds < 60)
    {
        return fmt::format("{}s", seconds);
    }
    else if (seconds < 3600)
    {
        long minutes = seconds / 60;
        long secs = seconds % 60;
        return fmt::format("{}m {}s", minutes, secs);
    }
    else
    {
        long hours = seconds / 3600;
        long minutes = (seconds % 3600) / 60;
        return fmt::format("{}h {}m", hours, minutes);
    }
}

// Helper: Get human-readable HTTP status text
std::string HttpClient::getHttpStatusText(long code) const
{
    switch (code)
    {
    case 400:
        return "Bad Request";
    case 401:
        return "Unauthorized";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    case 410:
        return "Gone";
    case 416:
        return "Range Not Satisfiable";
    case 429:
        return "Too Many Requests";
    case 500:
        return "Internal Server Error";
    case 502:
        return "Bad Gateway";
    case 503:
        return "Service Unavailable";
    case 504:
        return "Gateway Timeout";
    default:
        return "Unknown Status";
    }
}

// Ensure directory exists for file path
std::string HttpClient::ensureDirectoryExists(const std::filesystem::path &filePath) const
{
    try
    {
        auto directory = filePath.parent_path();

        // File in current dir, nothing to create
        if (directory.empty() || std::filesystem::exists(directory))
        {
            return {};
        }

        // Create all parent directories (like mkdir -p)
        std::filesystem::create_directories(directory);
        return {};
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        return fmt::format("Failed to create directory for {}: {}", filePath.string(), e.what());
    }
}
