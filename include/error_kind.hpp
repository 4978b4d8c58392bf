#pragma once

#include <string_view>

/**
 * Outcome codes shared by resolver modules, the transfer engine and the
 * process exit status. The numeric value of each kind is the exit code a
 * failing link contributes to the batch.
 */
enum class ErrorKind
{
    Success = 0,
    Fatal = 1,
    NoModule = 2,
    Network = 3,
    LoginFailed = 4,
    MaxWaitReached = 5,
    MaxTriesReached = 6,
    CaptchaFailed = 7,
    SystemFailure = 8,
    TemporarilyUnavailable = 10,
    PasswordRequired = 11,
    NeedPermissions = 12,
    LinkDead = 13,
    Interrupted = 130,

    // Any code a resolver reports that is not listed above.
    // Never used as an exit code: classified as Fatal.
    Unclassified = -1
};

// Added to the first failing link's code when several links fail
constexpr int MULTIPLE_FAILURES_BASE = 100;

/**
 * Map a resolver module exit status onto an ErrorKind.
 *
 * @param code Exit status reported by the module
 * @return Matching kind, or ErrorKind::Unclassified for unknown codes
 */
ErrorKind errorKindFromCode(int code);

/**
 * Numeric exit code for a kind (Unclassified maps to Fatal).
 */
int exitCodeOf(ErrorKind kind);

/**
 * Short symbolic name, used in debug output.
 */
std::string_view errorKindName(ErrorKind kind);
