#pragma once

#include <csignal>
#include <ostream>
#include <string>
#include <vector>

#include "http_transport.hpp"
#include "link_annotator.hpp"
#include "link_item.hpp"
#include "link_pipeline.hpp"
#include "module_registry.hpp"

struct BatchOptions
{
    // No module matched: download with a plain GET
    bool moduleFallback = false;

    // Print the module name of each link and skip the download
    bool getModule = false;

    // Set to non-zero by the SIGINT/SIGTERM handler (may be null)
    const volatile std::sig_atomic_t *stopRequested = nullptr;
};

/**
 * Runs the per-link pipeline over every input item and folds the
 * per-link codes into one process exit code.
 */
class BatchDriver
{
public:
    BatchDriver(ModuleRegistry &registry, LinkPipeline &pipeline, LinkAnnotator &annotator,
                HttpTransport &transport, BatchOptions options, std::ostream &out);

    /**
     * @param arguments URLs and/or link-list files, in command-line order
     * @return Aggregated exit code (see aggregateExitCodes)
     */
    int run(const std::vector<std::string> &arguments);

    /**
     * Codes of the failed links, in processing order, for the last run().
     */
    const std::vector<int> &failures() const { return failures_; }

    /**
     * No failure: 0. One failure: its code. Several: 100 + first code.
     */
    static int aggregateExitCodes(const std::vector<int> &codes);

private:
    /**
     * Find the resolver for url, trying a simple HTTP redirection and the
     * fallback resolver when no module matches. May rewrite url.
     */
    Resolver *selectResolver(std::string &url);

    ModuleRegistry &registry_;
    LinkPipeline &pipeline_;
    LinkAnnotator &annotator_;
    HttpTransport &transport_;
    BatchOptions options_;
    std::ostream &out_;
    std::vector<int> failures_;
};
