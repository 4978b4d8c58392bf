#include "link_pipeline.hpp"

#include <exception>
#include <utility>

#include "error_classifier.hpp"
#include "file_target.hpp"
#include "log.hpp"
#include "subprocess.hpp"
#include "url_utils.hpp"

LinkPipeline::LinkPipeline(LinkOptions options, TransferEngine &engine, Waiter &waiter,
                           LinkAnnotator &annotator, std::ostream &out)
    : options_(std::move(options)), engine_(engine), waiter_(waiter), annotator_(annotator), out_(out)
{
}

ErrorKind LinkPipeline::process(const LinkItem &item, Resolver &resolver)
{
    Log::notice("Starting download ({}): {}", resolver.name(), item.url);
    waiter_.reset();

    try
    {
        // The jar is removed when the context goes away, on every path
        LinkContext context{item, resolver,
                            CookieJar::create(options_.globalCookies, options_.scratchDir),
                            resolver.name() + "_download"};
        return run(context);
    }
    catch (const std::exception &e)
    {
        Log::error("System failure ({}): {}", resolver.name(), e.what());
        return ErrorKind::SystemFailure;
    }
}

ErrorKind LinkPipeline::run(LinkContext &context)
{
    const LinkItem &item = context.item;
    // The module shares our process group, so a Ctrl-C reaches it too and
    // it may die with any status
    auto resolveOnce = [&context, this]() {
        if (stopRequested())
        {
            return ResolveOutcome::failure(ErrorKind::Interrupted);
        }
        ResolveOutcome outcome = context.resolver.resolve(context.cookies, options_.moduleArgs, context.item.url);
        return stopRequested() ? ResolveOutcome::failure(ErrorKind::Interrupted) : outcome;
    };

    ResolveOutcome outcome;
    if (options_.checkOnly)
    {
        outcome = resolveOnce();
        if (outcome.kind == ErrorKind::Success ||
            outcome.kind == ErrorKind::TemporarilyUnavailable ||
            outcome.kind == ErrorKind::NeedPermissions ||
            outcome.kind == ErrorKind::PasswordRequired)
        {
            Log::notice("Link active: {}", item.url);
            out_ << item.url << std::endl;
            return ErrorKind::Success;
        }
    }
    else
    {
        RetryController controller(options_.retry, waiter_, context.resolver.name());
        outcome = controller.run(resolveOnce);
    }

    if (!outcome.detail.empty())
    {
        Log::debug("{}: {}", context.functionName, outcome.detail);
    }

    Classification classification = classifyOutcome(outcome.kind, context.functionName);
    if (classification.action == LinkAction::Abort)
    {
        if (classification.isError)
        {
            Log::error("{}", classification.message);
        }
        else
        {
            Log::notice("{}", classification.message);
        }
        if (classification.markTag)
        {
            annotator_.mark(item, *classification.markTag);
        }
        return classification.exitKind;
    }

    // Sanity check
    if (outcome.directUrl.empty())
    {
        Log::error("Output URL expected");
        return ErrorKind::Fatal;
    }
    Log::notice("File URL: {}", outcome.directUrl);

    std::string filename = outcome.filename ? sanitizeFilename(*outcome.filename)
                                            : filenameFromUrl(outcome.directUrl);
    filename = truncateFilename(filename);
    if (filename.empty())
    {
        Log::error("Cannot guess a filename from {}", outcome.directUrl);
        return ErrorKind::Fatal;
    }
    Log::notice("Filename: {}", filename);

    if (!options_.downloadCommand.empty())
    {
        return runDownloadCommand(context, outcome.directUrl, filename);
    }
    if (!options_.downloadInfo.empty())
    {
        return printDownloadInfo(context, outcome.directUrl, filename);
    }

    TransferOutcome transfer = engine_.run(outcome.directUrl, filename,
                                           context.resolver.capabilities(), context.cookies.path());
    if (transfer.kind != ErrorKind::Success)
    {
        return transfer.kind;
    }

    // Downloaded file (local) path
    out_ << transfer.finalPath.string() << std::endl;
    annotator_.mark(item, "", "|" + transfer.finalPath.string());
    return ErrorKind::Success;
}

ErrorKind LinkPipeline::runDownloadCommand(LinkContext &context, const std::string &fileUrl,
                                           const std::string &filename)
{
    const auto &outputDir = engine_.options().outputDir;
    std::string target = outputDir.empty() ? filename : (outputDir / filename).string();

    std::string command = interpolate(options_.downloadCommand, fileUrl, target,
                                      context.cookies.path().string());
    Log::notice("Running command: {}", command);

    CommandOptions commandOptions;
    commandOptions.captureOutput = false;
    CommandResult result = runCommand({"/bin/sh", "-c", command}, commandOptions);
    if (result.spawnError)
    {
        Log::error("Cannot run command: {}", result.error);
        return ErrorKind::SystemFailure;
    }

    if (result.interrupted() || stopRequested())
    {
        Log::notice("Interrupted by user");
        return ErrorKind::Interrupted;
    }

    Log::notice("Command exited with retcode: {}", result.exitCode);
    if (result.exitCode != 0)
    {
        return ErrorKind::Fatal;
    }

    annotator_.mark(context.item, "", "|" + target);
    return ErrorKind::Success;
}

ErrorKind LinkPipeline::printDownloadInfo(LinkContext &context, const std::string &fileUrl,
                                          const std::string &filename)
{
    std::string cookies;
    if (options_.downloadInfo.find("%cookies") != std::string::npos)
    {
        // Keep a copy: the jar itself is gone once this link is done
        try
        {
            cookies = context.cookies.keepCopy().string();
        }
        catch (const std::exception &e)
        {
            Log::error("Cannot keep cookie file: {}", e.what());
            return ErrorKind::SystemFailure;
        }
    }

    out_ << interpolate(options_.downloadInfo, fileUrl, filename, cookies) << std::endl;
    annotator_.mark(context.item, "", "|" + filename);
    return ErrorKind::Success;
}

std::string LinkPipeline::interpolate(const std::string &pattern, const std::string &url,
                                      const std::string &filename, const std::string &cookies)
{
    std::string text = url_utils::replaceAll(pattern, "%url", url);
    text = url_utils::replaceAll(text, "%filename", filename);
    return url_utils::replaceAll(text, "%cookies", cookies);
}
