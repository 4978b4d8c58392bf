#include "retry_controller.hpp"

#include <chrono>
#include <utility>

#include "log.hpp"

RetryController::RetryController(const RetryPolicy &policy, Waiter &waiter, std::string label)
    : policy_(policy), waiter_(waiter), label_(std::move(label))
{
}

ResolveOutcome RetryController::run(const ResolveFn &resolve)
{
    attempts_ = 0;
    int tries = 0; // captcha retries only

    while (true)
    {
        ResolveOutcome outcome = resolve();
        ++attempts_;

        if (outcome.kind == ErrorKind::TemporarilyUnavailable)
        {
            if (policy_.noExtraWait)
            {
                return outcome;
            }

            if (!outcome.waitHint)
            {
                Log::debug("arbitrary wait");
            }

            int seconds = outcome.waitHint.value_or(RetryPolicy::DEFAULT_WAIT_SECONDS);
            ErrorKind waited = waiter_.wait(std::chrono::seconds(seconds));
            if (waited != ErrorKind::Success)
            {
                return ResolveOutcome::failure(waited);
            }
            continue;
        }

        if (outcome.kind != ErrorKind::CaptchaFailed)
        {
            return outcome;
        }

        if (policy_.captchaMethodNone)
        {
            Log::debug("captcha method set to none, abort");
            return outcome;
        }

        ++tries;
        if (policy_.maxRetries)
        {
            if (*policy_.maxRetries == 0)
            {
                Log::debug("no retry explicitly requested");
                return outcome;
            }
            if (*policy_.maxRetries < tries)
            {
                return ResolveOutcome::failure(ErrorKind::MaxTriesReached);
            }
            Log::notice("Starting download ({}): retry {}/{}", label_, tries, *policy_.maxRetries);
        }
        else
        {
            Log::notice("Starting download ({}): retry {}", label_, tries);
        }
    }
}
