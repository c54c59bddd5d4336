#pragma once
/**
 * @file AlarmTimer.h
 * @brief Single-deadline wall clock timer driven by periodic polling.
 */

#include <stdint.h>
#include <time.h>

/** @brief Fire callback, invoked from `AlarmTimer::poll` with the polling time. */
using AlarmTimerFireFn = void (*)(void* ctx, time_t firedAt);

/**
 * @brief One outstanding deadline, compared to the wall clock on every poll.
 *
 * The owner polls with the current epoch. A forward clock jump past the
 * deadline fires on the next poll; a backward jump never fires early.
 * The callback runs at most once per successful `arm()` and never after
 * `cancel()`. Not thread-safe: the owner serializes arm/cancel/poll.
 */
class AlarmTimer {
public:
    /** @brief Scheduler availability. An offline timer refuses to arm. */
    void setOnline(bool online) { online_ = online; }
    bool online() const { return online_; }

    /**
     * @brief Replace any pending deadline with `fireAt`.
     * @return false when offline, `fn` is null or `fireAt` is not a valid epoch;
     *         the previous deadline is kept in that case.
     */
    bool arm(time_t fireAt, AlarmTimerFireFn fn, void* ctx);

    /** @brief Drop the pending deadline, if any. */
    void cancel();

    /** @brief Fire when `now` reached the deadline. Returns true if it fired. */
    bool poll(time_t now);

    bool armed() const { return armed_; }
    time_t deadline() const { return armed_ ? fireAt_ : 0; }

private:
    bool online_ = false;
    bool armed_ = false;
    time_t fireAt_ = 0;
    AlarmTimerFireFn fn_ = nullptr;
    void* ctx_ = nullptr;
};
