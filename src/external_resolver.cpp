#include "external_resolver.hpp"

#include <exception>
#include <sstream>
#include <string>
#include <utility>

#include <fmt/core.h>

#include "log.hpp"
#include "subprocess.hpp"
#include "url_utils.hpp"

ExternalResolver::ExternalResolver(std::string name,
                                   std::string command,
                                   ModuleCapabilities capabilities,
                                   std::map<std::string, std::string> environment)
    : name_(std::move(name)),
      command_(std::move(command)),
      capabilities_(capabilities),
      environment_(std::move(environment))
{
}

ResolveOutcome ExternalResolver::resolve(const CookieJar &cookies,
                                         const std::vector<std::string> &moduleArgs,
                                         const std::string &url)
{
    std::vector<std::string> args;
    args.reserve(moduleArgs.size() + 3);
    args.push_back(command_);
    args.insert(args.end(), moduleArgs.begin(), moduleArgs.end());
    args.push_back(cookies.path().string());
    args.push_back(url);

    CommandOptions options;
    options.extraEnv = environment_;
    options.captureOutput = true;

    CommandResult run = runCommand(args, options);
    if (run.spawnError)
    {
        Log::error("Cannot run module {} ({}): {}", name_, command_, run.error);
        ResolveOutcome outcome = ResolveOutcome::failure(ErrorKind::SystemFailure);
        outcome.detail = run.error;
        return outcome;
    }

    if (run.interrupted())
    {
        Log::debug("{} killed by signal {}", command_, run.termSignal);
        return ResolveOutcome::failure(ErrorKind::Interrupted);
    }
    if (run.termSignal != 0)
    {
        Log::error("Module {} killed by signal {}", name_, run.termSignal);
        ResolveOutcome outcome = ResolveOutcome::failure(ErrorKind::Unclassified);
        outcome.detail = fmt::format("signal {}", run.termSignal);
        return outcome;
    }

    Log::report("{} exited with {}", command_, run.exitCode);
    return parseOutput(run.exitCode, run.output);
}

ResolveOutcome ExternalResolver::parseOutput(int exitCode, const std::string &output)
{
    std::istringstream lines(output);
    std::string first;
    std::string second;
    std::getline(lines, first);
    std::getline(lines, second);
    first = url_utils::strip(first);
    second = url_utils::strip(second);

    ErrorKind kind = errorKindFromCode(exitCode);

    if (kind == ErrorKind::Success)
    {
        return ResolveOutcome::success(
            first, second.empty() ? std::nullopt : std::optional<std::string>(second));
    }

    if (kind == ErrorKind::TemporarilyUnavailable)
    {
        std::optional<int> hint;
        if (!first.empty())
        {
            try
            {
                size_t used = 0;
                int seconds = std::stoi(first, &used);
                if (used == first.size() && seconds >= 0)
                {
                    hint = seconds;
                }
            }
            catch (const std::exception &)
            {
                Log::debug("ignoring invalid wait hint '{}'", first);
            }
        }
        return ResolveOutcome::failure(kind, hint);
    }

    ResolveOutcome outcome = ResolveOutcome::failure(kind);
    if (kind == ErrorKind::Unclassified)
    {
        outcome.detail = std::to_string(exitCode);
    }
    return outcome;
}
