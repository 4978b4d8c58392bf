#pragma once

#include <optional>
#include <string>
#include <utility>

#include "error_kind.hpp"

/**
 * Result of asking a resolver module for the direct file URL.
 *
 * On success, directUrl is set and filename may carry the name suggested
 * by the hosting site. On failure, kind names the reason; waitHint is only
 * meaningful for ErrorKind::TemporarilyUnavailable.
 */
struct ResolveOutcome
{
    ErrorKind kind = ErrorKind::Success;
    std::string directUrl;
    std::optional<std::string> filename;
    std::optional<int> waitHint; // seconds
    std::string detail;          // free text for logs (e.g. unknown code)

    bool ok() const { return kind == ErrorKind::Success; }

    static ResolveOutcome success(std::string url,
                                  std::optional<std::string> filename = std::nullopt)
    {
        ResolveOutcome outcome;
        outcome.directUrl = std::move(url);
        outcome.filename = std::move(filename);
        return outcome;
    }

    static ResolveOutcome failure(ErrorKind kind,
                                  std::optional<int> waitHint = std::nullopt)
    {
        ResolveOutcome outcome;
        outcome.kind = kind;
        outcome.waitHint = waitHint;
        return outcome;
    }
};
