#ifndef CHIPVM_MEMORY_H
#define CHIPVM_MEMORY_H

#include <array>
#include <vector>
#include <cstdint>

#include "chipvm.h"

extern const std::vector<uint8_t> digitSprites;

struct Memory
{
    std::array<uint8_t, MemorySize> memory;

    Memory()
    {
        memory.fill(0);
    }

    // Writes the 16 hexadecimal glyphs to 0x000-0x04F.  Must run once, before
    // anything else touches that region.
    void loadDigitSprites();

    // Copies a program image to ProgramOrigin.  Length is the caller's
    // business; an image that runs past the end of memory is truncated.
    void loadProgram(const std::vector<uint8_t>& program);

    static bool isValidAddress(uint32_t addr)
    {
        return addr < MemorySize;
    }

    uint8_t read(uint16_t addr) const;
    void write(uint16_t addr, uint8_t v);

    uint16_t getDigitLocation(uint8_t digit) const
    {
        return digit * DigitSpriteBytes;
    }
};

#endif // CHIPVM_MEMORY_H
