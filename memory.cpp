#include <algorithm>
#include <cassert>
#include <cstdio>

#include "memory.h"

const std::vector<uint8_t> digitSprites = {
    0xF0, 0x90, 0x90, 0x90, 0xF0, // 0
    0x20, 0x60, 0x20, 0x20, 0x70, // 1
    0xF0, 0x10, 0xF0, 0x80, 0xF0, // 2
    0xF0, 0x10, 0xF0, 0x10, 0xF0, // 3
    0x90, 0x90, 0xF0, 0x10, 0x10, // 4
    0xF0, 0x80, 0xF0, 0x10, 0xF0, // 5
    0xF0, 0x80, 0xF0, 0x90, 0xF0, // 6
    0xF0, 0x10, 0x20, 0x40, 0x40, // 7
    0xF0, 0x90, 0xF0, 0x90, 0xF0, // 8
    0xF0, 0x90, 0xF0, 0x10, 0xF0, // 9
    0xF0, 0x90, 0xF0, 0x90, 0x90, // A
    0xE0, 0x90, 0xE0, 0x90, 0xE0, // B
    0xF0, 0x80, 0x80, 0x80, 0xF0, // C
    0xE0, 0x90, 0x90, 0x90, 0xE0, // D
    0xF0, 0x80, 0xF0, 0x80, 0xF0, // E
    0xF0, 0x80, 0xF0, 0x80, 0x80, // F
};

void Memory::loadDigitSprites()
{
    assert(std::all_of(memory.begin(), memory.begin() + digitSprites.size(), [](uint8_t b) { return b == 0; }));

    for(uint16_t i = 0; i < digitSprites.size(); i++) {
        write(i, digitSprites[i]);
    }
}

void Memory::loadProgram(const std::vector<uint8_t>& program)
{
    size_t room = MemorySize - ProgramOrigin;
    if(program.size() > room) {
        fprintf(stderr, "program is %zu bytes, only %zu fit; truncated\n", program.size(), room);
    }
    for(size_t i = 0; i < std::min(program.size(), room); i++) {
        write(ProgramOrigin + i, program[i]);
    }
}

uint8_t Memory::read(uint16_t addr) const
{
    assert(addr < MemorySize);
    return memory[addr];
}

void Memory::write(uint16_t addr, uint8_t v)
{
    assert(addr < MemorySize);
    memory[addr] = v;
}
