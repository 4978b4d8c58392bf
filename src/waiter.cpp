#include "waiter.hpp"

#include <thread>

#include "log.hpp"

SleepWaiter::SleepWaiter(std::optional<std::chrono::seconds> budget,
                         const volatile std::sig_atomic_t *stopFlag)
    : budget_(budget), remaining_(budget), stopFlag_(stopFlag)
{
}

void SleepWaiter::reset()
{
    remaining_ = budget_;
}

ErrorKind SleepWaiter::wait(std::chrono::seconds duration)
{
    if (remaining_ && duration > *remaining_)
    {
        Log::notice("Timeout reached: cannot wait {} more seconds ({}s left)",
                    duration.count(), remaining_->count());
        return ErrorKind::MaxWaitReached;
    }

    Log::notice("Waiting {} seconds...", duration.count());

    auto left = duration;
    while (left.count() > 0)
    {
        if (stopFlag_ && *stopFlag_)
        {
            return ErrorKind::Interrupted;
        }
        std::this_thread::sleep_for(std::chrono::seconds(1));
        --left;
        if (remaining_)
        {
            --*remaining_;
        }
    }

    if (stopFlag_ && *stopFlag_)
    {
        return ErrorKind::Interrupted;
    }
    return ErrorKind::Success;
}
