/**
 * @file AlarmTimer.cpp
 * @brief Single-deadline wall clock timer implementation.
 */

#include "Modules/AlarmClockModule/AlarmTimer.h"

bool AlarmTimer::arm(time_t fireAt, AlarmTimerFireFn fn, void* ctx)
{
    if (!online_ || !fn || fireAt <= 0) return false;
    fireAt_ = fireAt;
    fn_ = fn;
    ctx_ = ctx;
    armed_ = true;
    return true;
}

void AlarmTimer::cancel()
{
    armed_ = false;
    fireAt_ = 0;
    fn_ = nullptr;
    ctx_ = nullptr;
}

bool AlarmTimer::poll(time_t now)
{
    if (!armed_ || now < fireAt_) return false;

    AlarmTimerFireFn fn = fn_;
    void* ctx = ctx_;
    cancel();
    // The callback may re-arm this timer.
    fn(ctx, now);
    return true;
}
