#ifndef CHIPVM_CHIPVM_H
#define CHIPVM_CHIPVM_H

#include <cstddef>
#include <cstdint>
#include <chrono>

constexpr size_t MemorySize = 4096;
constexpr uint16_t ProgramOrigin = 0x200;
constexpr uint16_t DigitSpriteBytes = 5;

constexpr int ScreenWidth = 64;
constexpr int ScreenHeight = 32;

constexpr std::chrono::milliseconds TimerTick{16};
constexpr std::chrono::milliseconds KeyHold{200};
constexpr std::chrono::milliseconds InstructionInterval{2};
constexpr std::chrono::milliseconds DisplayInterval{10};

#endif // CHIPVM_CHIPVM_H
