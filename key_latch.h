#ifndef CHIPVM_KEY_LATCH_H
#define CHIPVM_KEY_LATCH_H

#include <cassert>
#include <cstdint>
#include <chrono>
#include <optional>

#include "chipvm.h"

// Remembers the last key pressed for at least KeyHold, however briefly the
// host actually held it down.
template <class CLOCK = std::chrono::steady_clock>
struct KeyLatch
{
    std::optional<uint8_t> key;
    typename CLOCK::time_point pressTime = CLOCK::now();

    void press(uint8_t code)
    {
        key = code;
        pressTime = CLOCK::now();
    }

    bool pressed(uint8_t code) const
    {
        return key && (*key == code);
    }

    bool canClear() const
    {
        return key && ((CLOCK::now() - pressTime) >= KeyHold);
    }

    void clear()
    {
        assert(canClear());
        key.reset();
    }
};

#endif // CHIPVM_KEY_LATCH_H
