#pragma once

#include <csignal>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "cookie_jar.hpp"
#include "error_kind.hpp"
#include "link_annotator.hpp"
#include "link_item.hpp"
#include "resolver.hpp"
#include "retry_controller.hpp"
#include "transfer_engine.hpp"
#include "waiter.hpp"

/**
 * Per-link knobs that do not belong to the transfer itself.
 */
struct LinkOptions
{
    RetryPolicy retry;

    // Resolve once and report whether the link is alive
    bool checkOnly = false;

    // Run this command instead of the built-in transfer (%url, %filename, %cookies)
    std::string downloadCommand;

    // Print this template instead of downloading (%url, %filename, %cookies)
    std::string downloadInfo;

    // Seed for every link's cookie jar
    std::optional<std::filesystem::path> globalCookies;

    // Where cookie jars are created
    std::filesystem::path scratchDir = std::filesystem::temp_directory_path();

    // Passed through to resolver modules
    std::vector<std::string> moduleArgs;

    // Set to non-zero by the SIGINT/SIGTERM handler (may be null)
    const volatile std::sig_atomic_t *stopRequested = nullptr;
};

/**
 * Processes one link from resolution to local file:
 * retry controller -> resolver -> classifier -> transfer -> annotation.
 */
class LinkPipeline
{
public:
    /**
     * @param options Per-link knobs
     * @param engine Transfer engine (also provides the output directory)
     * @param waiter Wait budget, restarted for every link
     * @param annotator Link-list marking
     * @param out Result stream (downloaded paths, check-link URLs, info lines)
     */
    LinkPipeline(LinkOptions options, TransferEngine &engine, Waiter &waiter,
                 LinkAnnotator &annotator, std::ostream &out);

    /**
     * Process item with the given resolver.
     *
     * @return ErrorKind::Success or the code this link contributes to the
     *         process exit status
     */
    ErrorKind process(const LinkItem &item, Resolver &resolver);

    const LinkOptions &options() const { return options_; }

private:
    // Everything one link needs, passed explicitly between stages
    struct LinkContext
    {
        const LinkItem &item;
        Resolver &resolver;
        CookieJar cookies;
        std::string functionName;
    };

    ErrorKind run(LinkContext &context);
    ErrorKind runDownloadCommand(LinkContext &context, const std::string &fileUrl, const std::string &filename);
    ErrorKind printDownloadInfo(LinkContext &context, const std::string &fileUrl, const std::string &filename);

    bool stopRequested() const { return options_.stopRequested && *options_.stopRequested; }

    static std::string interpolate(const std::string &pattern, const std::string &url,
                                   const std::string &filename, const std::string &cookies);

    LinkOptions options_;
    TransferEngine &engine_;
    Waiter &waiter_;
    LinkAnnotator &annotator_;
    std::ostream &out_;
};
