#include "error_classifier.hpp"

#include <utility>

#include <fmt/core.h>

namespace
{
Classification abortWith(ErrorKind kind, std::string message,
                         std::optional<std::string> tag = std::nullopt)
{
    Classification result;
    result.action = LinkAction::Abort;
    result.exitKind = kind;
    result.message = std::move(message);
    result.markTag = std::move(tag);
    return result;
}
}

Classification classifyOutcome(ErrorKind kind, const std::string &functionName)
{
    switch (kind)
    {
    case ErrorKind::Success:
    {
        Classification result;
        result.action = LinkAction::Transfer;
        result.exitKind = ErrorKind::Success;
        return result;
    }
    case ErrorKind::LoginFailed:
        return abortWith(kind, "Login process failed. Bad username/password or unexpected content");
    case ErrorKind::TemporarilyUnavailable:
        return abortWith(kind, "Warning: file link is alive but not currently available, try later");
    case ErrorKind::PasswordRequired:
        return abortWith(kind, "You must provide a password", "PASSWORD");
    case ErrorKind::NeedPermissions:
        return abortWith(kind, "Insufficient permissions (premium link?)");
    case ErrorKind::LinkDead:
        return abortWith(kind, "Link is not alive: file not found", "NOTFOUND");
    case ErrorKind::MaxWaitReached:
        return abortWith(kind, fmt::format("Delay limit reached ({})", functionName));
    case ErrorKind::MaxTriesReached:
        return abortWith(kind, fmt::format("Retry limit reached ({})", functionName));
    case ErrorKind::CaptchaFailed:
        return abortWith(kind, fmt::format("Error: decoding captcha ({})", functionName));
    case ErrorKind::SystemFailure:
        return abortWith(kind, fmt::format("System failure ({})", functionName));
    case ErrorKind::NoModule:
        return abortWith(kind, "Skip: no module for URL", "NOMODULE");
    case ErrorKind::Interrupted:
        return abortWith(kind, "Interrupted by user");
    default:
    {
        // Network, Fatal, Unclassified and any future code
        Classification result = abortWith(
            ErrorKind::Fatal,
            fmt::format("failed inside {}() [{}]", functionName, static_cast<int>(kind)));
        result.isError = true;
        return result;
    }
    }
}
