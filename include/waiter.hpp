#pragma once

#include <chrono>
#include <csignal>
#include <optional>

#include "error_kind.hpp"

/**
 * Blocking wait used by the retry controller and the transfer engine.
 * Abstract so tests can record waits instead of sleeping.
 */
class Waiter
{
public:
    virtual ~Waiter() = default;

    /**
     * Block for the given duration.
     *
     * @return ErrorKind::Success once the time has elapsed,
     *         ErrorKind::MaxWaitReached if the wait budget would be exceeded,
     *         ErrorKind::Interrupted if a stop was requested meanwhile
     */
    virtual ErrorKind wait(std::chrono::seconds duration) = 0;

    /**
     * Start a new budget. Called once at the beginning of each link.
     */
    virtual void reset() {}
};

/**
 * Real waiter: sleeps in one-second slices, honours a per-link wait
 * budget and a stop flag set from a signal handler.
 */
class SleepWaiter : public Waiter
{
public:
    /**
     * @param budget Total waiting allowed per link (nullopt = unlimited)
     * @param stopFlag Set to non-zero by SIGINT/SIGTERM handler (may be null)
     */
    SleepWaiter(std::optional<std::chrono::seconds> budget,
                const volatile std::sig_atomic_t *stopFlag);

    ErrorKind wait(std::chrono::seconds duration) override;
    void reset() override;

    std::optional<std::chrono::seconds> remaining() const { return remaining_; }

private:
    std::optional<std::chrono::seconds> budget_;
    std::optional<std::chrono::seconds> remaining_;
    const volatile std::sig_atomic_t *stopFlag_;
};
