#include "transfer_engine.hpp"

#include <chrono>
#include <system_error>
#include <utility>

#include "log.hpp"
#include "url_utils.hpp"

TransferEngine::TransferEngine(HttpTransport &transport, Waiter &waiter, TransferOptions options)
    : transport_(transport), waiter_(waiter), options_(std::move(options))
{
}

bool TransferEngine::isSuccessStatus(long httpCode)
{
    return std::to_string(httpCode).compare(0, 2, "20") == 0;
}

bool TransferEngine::allowRestart(int &restarts) const
{
    ++restarts;
    if (options_.maxRestarts && restarts > *options_.maxRestarts)
    {
        Log::notice("Transfer restart limit reached ({})", *options_.maxRestarts);
        return false;
    }
    return true;
}

TransferOutcome TransferEngine::run(const std::string &fileUrl,
                                    const std::string &filename,
                                    const ModuleCapabilities &capabilities,
                                    const std::filesystem::path &cookieFile)
{
    TransferOutcome outcome;
    attempts_ = 0;
    int restarts = 0;

    while (true)
    {
        FileTarget target = computeFileTarget(filename, options_.tempDir, options_.outputDir,
                                              options_.noOverwrite);

        TransferRequest request;
        request.url = url_utils::uriEncode(fileUrl);
        request.destination = target.tempPath;
        request.resume = !options_.noOverwrite && capabilities.supportsResume;
        if (capabilities.finalLinkNeedsCookie)
        {
            request.cookieFile = cookieFile;
        }
        request.rateLimit = options_.rateLimit;
        request.networkInterface = options_.networkInterface;

        ++attempts_;
        TransferResult result = transport_.fetch(request);

        if (result.status == TransferStatus::Interrupted)
        {
            outcome.kind = ErrorKind::Interrupted;
            return outcome;
        }

        if (result.status == TransferStatus::PartialContent)
        {
            if (capabilities.supportsResume)
            {
                Log::notice("Partial content downloaded, restart transfer");
                if (!allowRestart(restarts))
                {
                    outcome.kind = ErrorKind::MaxTriesReached;
                    return outcome;
                }
                continue;
            }
            Log::error("Transfer failed: {}", result.error);
            outcome.kind = ErrorKind::Network;
            return outcome;
        }

        if (result.httpCode == 503 &&
            (result.status == TransferStatus::NetworkError || result.status == TransferStatus::HttpError))
        {
            Log::error("Unexpected HTTP code {}, retry after a safety wait", result.httpCode);
            ErrorKind waited = waiter_.wait(std::chrono::seconds(TransferOptions::UNAVAILABLE_WAIT_SECONDS));
            if (waited != ErrorKind::Success)
            {
                outcome.kind = waited;
                return outcome;
            }
            continue;
        }

        if (result.status == TransferStatus::NetworkError)
        {
            Log::error("Transfer failed: {}", result.error);
            outcome.kind = ErrorKind::Network;
            return outcome;
        }

        if (result.httpCode == 416)
        {
            // If the module can resume, assume the file was fully
            // downloaded earlier: many hosters refuse HEAD requests, so
            // the length cannot be checked
            if (capabilities.supportsResume)
            {
                Log::error("Resume error (bad range), skip download");
                outcome.alreadyComplete = true;
            }
            else
            {
                Log::error("Resume error (bad range), restart download");
                std::error_code ec;
                std::filesystem::remove(target.tempPath, ec);
                if (!allowRestart(restarts))
                {
                    outcome.kind = ErrorKind::MaxTriesReached;
                    return outcome;
                }
                continue;
            }
        }
        else if (!url_utils::isHttpUrl(fileUrl) && result.status == TransferStatus::Completed)
        {
            // FTP reports its own reply codes (226 on success)
            Log::debug("{} transfer completed with code {}", fileUrl, result.httpCode);
        }
        else if (!isSuccessStatus(result.httpCode))
        {
            Log::error("Unexpected HTTP code {}, restart download", result.httpCode);
            if (!allowRestart(restarts))
            {
                outcome.kind = ErrorKind::MaxTriesReached;
                return outcome;
            }
            continue;
        }

        outcome.kind = moveIntoPlace(target);
        if (outcome.kind == ErrorKind::Success)
        {
            outcome.finalPath = target.finalPath;
        }
        return outcome;
    }
}

ErrorKind TransferEngine::moveIntoPlace(const FileTarget &target) const
{
    if (target.tempPath == target.finalPath)
    {
        return ErrorKind::Success;
    }

    std::error_code ec;
    if (!std::filesystem::exists(target.tempPath, ec))
    {
        // 416 skip with nothing left in the temp directory
        Log::debug("nothing to move from {}", target.tempPath.string());
        return ErrorKind::Success;
    }

    Log::notice("Moving file to output directory: {}",
                options_.outputDir.empty() ? std::string(".") : options_.outputDir.string());

    std::filesystem::rename(target.tempPath, target.finalPath, ec);
    if (ec == std::errc::cross_device_link)
    {
        // Temp dir on another filesystem: copy then delete
        ec.clear();
        std::filesystem::copy_file(target.tempPath, target.finalPath,
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (!ec)
        {
            std::filesystem::remove(target.tempPath, ec);
        }
    }

    if (ec)
    {
        Log::error("Cannot move {} to {}: {}", target.tempPath.string(), target.finalPath.string(), ec.message());
        return ErrorKind::SystemFailure;
    }
    return ErrorKind::Success;
}
