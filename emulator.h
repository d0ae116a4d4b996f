#ifndef CHIPVM_EMULATOR_H
#define CHIPVM_EMULATOR_H

#include <vector>
#include <cstdio>
#include <cstdint>
#include <chrono>
#include <optional>

#include "chipvm.h"
#include "debug.h"
#include "memory.h"
#include "countdown_timer.h"
#include "key_latch.h"
#include "framebuffer.h"
#include "interpreter.h"

// Ties the machine together and paces it against CLOCK.  Each canX() is the
// gate for the matching call; the calls themselves don't look at the time
// beyond stamping it.
template <class CLOCK = std::chrono::steady_clock>
struct Emulator
{
    typedef CountdownTimer<CLOCK> Timer;
    typedef Framebuffer<CLOCK> Screen;
    typedef KeyLatch<CLOCK> Keypad;
    typedef Chip8Interpreter<Memory, Timer, Screen, Keypad> Interpreter;

    Memory memory;
    Timer timer;
    Screen screen;
    Keypad keypad;
    Interpreter chip8;

    typename CLOCK::time_point stepTime = CLOCK::now();
    StepResult result = CONTINUE;

    Emulator()
    {
        memory.loadDigitSprites();
    }

    void loadProgram(const std::vector<uint8_t>& program)
    {
        memory.loadProgram(program);
    }

    void pressKey(uint8_t code)
    {
        if((debug & DEBUG_KEYS) && !keypad.pressed(code)) {
            printf("pressed %d\n", code);
        }
        keypad.press(code);
    }

    bool canReleaseKey() const
    {
        return keypad.canClear();
    }

    void releaseKey()
    {
        if((debug & DEBUG_KEYS) && keypad.key) {
            printf("released %d\n", *keypad.key);
        }
        keypad.clear();
    }

    bool canStep() const
    {
        return (CLOCK::now() - stepTime) > InstructionInterval;
    }

    StepResult step()
    {
        stepTime = CLOCK::now();
        result = chip8.step(memory, timer, screen, keypad);
        return result;
    }

    bool canFlush() const
    {
        return screen.canFlush();
    }

    template <class DISPLAY>
    bool flush(DISPLAY& display)
    {
        return screen.flush(display);
    }

    // One pass of the host loop.  Returns false once the program has hit a
    // fatal instruction (see result) or the display has gone away.
    template <class DISPLAY>
    bool iterate(std::optional<uint8_t> heldKey, DISPLAY& display)
    {
        if(heldKey) {
            pressKey(*heldKey);
        } else if(canReleaseKey()) {
            releaseKey();
        }

        if(canStep()) {
            if(step() != CONTINUE) {
                return false;
            }
        }

        if(canFlush()) {
            return flush(display);
        }

        return true;
    }
};

#endif // CHIPVM_EMULATOR_H
