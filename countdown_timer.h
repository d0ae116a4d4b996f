#ifndef CHIPVM_COUNTDOWN_TIMER_H
#define CHIPVM_COUNTDOWN_TIMER_H

#include <cstdint>
#include <chrono>

#include "chipvm.h"

// Delay timer.  Nothing ticks it: the remaining count is worked out from the
// time it was set whenever somebody asks.
template <class CLOCK = std::chrono::steady_clock>
struct CountdownTimer
{
    uint8_t delay = 0;
    typename CLOCK::time_point setTime = CLOCK::now();

    void set(uint8_t value)
    {
        delay = value;
        setTime = CLOCK::now();
    }

    uint8_t get() const
    {
        return remaining(delay, setTime, CLOCK::now());
    }

    static uint8_t remaining(uint8_t value, typename CLOCK::time_point then, typename CLOCK::time_point now)
    {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - then);
        if(elapsed.count() < 0) {
            return value;
        }
        auto ticks = elapsed / TimerTick;
        if(ticks >= value) {
            return 0;
        }
        return value - static_cast<uint8_t>(ticks);
    }
};

#endif // CHIPVM_COUNTDOWN_TIMER_H
