#ifndef CHIPVM_FRAMEBUFFER_H
#define CHIPVM_FRAMEBUFFER_H

#include <array>
#include <cstdint>
#include <cstdio>
#include <chrono>

#include "chipvm.h"
#include "debug.h"

typedef std::array<std::array<uint8_t, ScreenWidth>, ScreenHeight> PixelGrid;

template <class CLOCK = std::chrono::steady_clock>
struct Framebuffer
{
    PixelGrid display;
    typename CLOCK::time_point flushTime = CLOCK::now();

    Framebuffer()
    {
        clear();
    }

    void clear()
    {
        for(auto& rowOfPixels : display) {
            rowOfPixels.fill(0);
        }
    }

    uint8_t at(int x, int y) const
    {
        return display.at(y).at(x);
    }

    // XOR one sprite row, MSB first, at (x, y).  Both coordinates wrap, x per
    // pixel.  Returns true if any lit pixel went dark.
    bool drawRow(uint8_t byte, int x, int y)
    {
        bool erased = false;
        int row = y % ScreenHeight;

        for(int bitIndex = 0; bitIndex < 8; bitIndex++) {
            int col = (x + bitIndex) % ScreenWidth;
            uint8_t bit = (byte >> (7 - bitIndex)) & 0x1;
            auto& pixel = display[row][col];
            uint8_t oldValue = pixel;
            pixel = oldValue ^ bit;
            if((oldValue != 0) && (pixel == 0)) {
                erased = true;
            }
            if(bit && (debug & DEBUG_DRAW)) {
                printf("draw %d %d (%d)\n", col, row, col + row * ScreenWidth);
            }
        }

        return erased;
    }

    bool canFlush() const
    {
        return (CLOCK::now() - flushTime) > DisplayInterval;
    }

    template <class DISPLAY>
    bool flush(DISPLAY& target)
    {
        flushTime = CLOCK::now();
        return target.present(display);
    }
};

#endif // CHIPVM_FRAMEBUFFER_H
