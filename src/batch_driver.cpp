#include "batch_driver.hpp"

#include <fmt/core.h>

#include "log.hpp"
#include "url_utils.hpp"

BatchDriver::BatchDriver(ModuleRegistry &registry, LinkPipeline &pipeline, LinkAnnotator &annotator,
                         HttpTransport &transport, BatchOptions options, std::ostream &out)
    : registry_(registry),
      pipeline_(pipeline),
      annotator_(annotator),
      transport_(transport),
      options_(options),
      out_(out)
{
}

int BatchDriver::aggregateExitCodes(const std::vector<int> &codes)
{
    if (codes.empty())
    {
        return 0;
    }
    if (codes.size() == 1)
    {
        return codes.front();
    }

    std::string all;
    for (int code : codes)
    {
        all += fmt::format(" {}", code);
    }
    Log::debug("retvals:{}", all);
    return MULTIPLE_FAILURES_BASE + codes.front();
}

Resolver *BatchDriver::selectResolver(std::string &url)
{
    Resolver *resolver = registry_.find(url);
    if (resolver || !url_utils::isRemoteUrl(url))
    {
        return resolver;
    }

    Log::debug("No module found, try simple redirection");
    if (auto location = transport_.probeRedirect(url))
    {
        url = *location;
        return registry_.find(url);
    }

    if (options_.moduleFallback)
    {
        Log::notice("No module found, do a simple HTTP GET as requested");
        return &registry_.fallback();
    }
    return nullptr;
}

int BatchDriver::run(const std::vector<std::string> &arguments)
{
    failures_.clear();

    for (const auto &argument : arguments)
    {
        for (const auto &classified : classifyItem(argument))
        {
            if (options_.stopRequested && *options_.stopRequested)
            {
                Log::notice("Interrupted, skipping remaining links");
                failures_.push_back(exitCodeOf(ErrorKind::Interrupted));
                return aggregateExitCodes(failures_);
            }

            LinkItem item = classified;
            std::string url = item.url;

            Resolver *resolver = selectResolver(url);
            if (!resolver)
            {
                Log::error("Skip: no module for URL ({})", url);
                failures_.push_back(exitCodeOf(ErrorKind::NoModule));
                annotator_.mark(item, "NOMODULE");
                continue;
            }

            if (options_.getModule)
            {
                out_ << resolver->name() << std::endl;
                continue;
            }

            // A redirection gives the pipeline a new URL; the source line
            // stays as it was so it can still be marked
            item.url = url;

            ErrorKind result = pipeline_.process(item, *resolver);
            if (result != ErrorKind::Success)
            {
                failures_.push_back(exitCodeOf(result));
            }

            if (result == ErrorKind::Interrupted)
            {
                Log::notice("Interrupted, skipping remaining links");
                return aggregateExitCodes(failures_);
            }
        }
    }

    return aggregateExitCodes(failures_);
}
