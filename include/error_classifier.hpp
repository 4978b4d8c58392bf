#pragma once

#include <optional>
#include <string>

#include "error_kind.hpp"

/**
 * What the link pipeline does with a terminal resolver outcome.
 */
enum class LinkAction
{
    Transfer, // resolution succeeded, go on with the download
    Abort     // report and stop processing this link
};

struct Classification
{
    LinkAction action = LinkAction::Abort;

    // Code the link reports to the batch driver
    ErrorKind exitKind = ErrorKind::Fatal;

    // User-facing message (empty for success)
    std::string message;

    // Tag written by the link-status annotator, if any (PASSWORD, NOTFOUND)
    std::optional<std::string> markTag;

    // Logged at error level rather than notice level
    bool isError = false;
};

/**
 * Fixed lookup from a terminal resolver outcome to an action.
 *
 * @param kind Terminal outcome of the retry controller
 * @param functionName Resolver entry point name, quoted in messages
 */
Classification classifyOutcome(ErrorKind kind, const std::string &functionName);
