#pragma once

#include <functional>
#include <optional>
#include <string>

#include "resolve_outcome.hpp"
#include "waiter.hpp"

/**
 * Knobs of the resolution retry loop.
 */
struct RetryPolicy
{
    // Captcha retries allowed. nullopt = retry forever, 0 = never retry
    std::optional<int> maxRetries;

    // Give up as soon as a module reports temporary unavailability
    bool noExtraWait = false;

    // Captcha method forced to "none": a captcha failure is final
    bool captchaMethodNone = false;

    // Wait used when a module reports unavailability without a hint
    static constexpr int DEFAULT_WAIT_SECONDS = 60;
};

/**
 * Drives a resolver call until it yields a terminal outcome.
 *
 * - TemporarilyUnavailable: wait (hint or 60s) and call again. Does not
 *   consume the retry budget.
 * - CaptchaFailed: call again while the retry budget allows it; once it is
 *   exhausted the outcome becomes MaxTriesReached.
 * - Anything else ends the loop unchanged.
 */
class RetryController
{
public:
    using ResolveFn = std::function<ResolveOutcome()>;

    /**
     * @param policy Retry configuration
     * @param waiter Used for unavailability waits
     * @param label Shown in retry notices (usually the module name)
     */
    RetryController(const RetryPolicy &policy, Waiter &waiter, std::string label);

    ResolveOutcome run(const ResolveFn &resolve);

    /**
     * Number of resolver calls made by the last run().
     */
    int attempts() const { return attempts_; }

private:
    RetryPolicy policy_;
    Waiter &waiter_;
    std::string label_;
    int attempts_ = 0;
};
