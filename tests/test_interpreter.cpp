#include <catch2/catch.hpp>

#include <vector>
#include <initializer_list>

#include "emulator.h"
#include "fake_clock.h"

using namespace std::chrono_literals;

namespace {

typedef Emulator<FakeClock> TestEmulator;

void loadWords(TestEmulator& emulator, std::initializer_list<uint16_t> words)
{
    std::vector<uint8_t> program;
    for(uint16_t word : words) {
        program.push_back(word >> 8);
        program.push_back(word & 0xFF);
    }
    emulator.loadProgram(program);
}

void stepN(TestEmulator& emulator, int count)
{
    for(int i = 0; i < count; i++) {
        REQUIRE(emulator.step() == CONTINUE);
    }
}

// Points the machine at a single instruction at 0x200.
void runOne(TestEmulator& emulator, uint16_t word)
{
    emulator.memory.write(0x200, word >> 8);
    emulator.memory.write(0x201, word & 0xFF);
    emulator.chip8.pc = 0x200;
    REQUIRE(emulator.step() == CONTINUE);
}

int litPixels(const TestEmulator& emulator)
{
    int count = 0;
    for(int y = 0; y < ScreenHeight; y++) {
        for(int x = 0; x < ScreenWidth; x++) {
            count += emulator.screen.at(x, y);
        }
    }
    return count;
}

}

TEST_CASE("load and add immediate", "[interpreter]")
{
    TestEmulator emulator;
    loadWords(emulator, {0x6005, 0x7005});
    stepN(emulator, 2);

    CHECK(emulator.chip8.registers[0] == 10);
    CHECK(emulator.chip8.pc == 0x204);
}

TEST_CASE("add immediate wraps and leaves VF alone", "[interpreter]")
{
    TestEmulator emulator;
    loadWords(emulator, {0x6F07, 0x63FF, 0x7302});
    stepN(emulator, 3);

    CHECK(emulator.chip8.registers[3] == 1);
    CHECK(emulator.chip8.registers[0xF] == 7);
}

TEST_CASE("add with carry", "[interpreter][alu]")
{
    TestEmulator emulator;
    auto& registers = emulator.chip8.registers;

    for(int a = 0; a < 256; a++) {
        for(int b = 0; b < 256; b++) {
            registers[1] = a;
            registers[2] = b;
            runOne(emulator, 0x8124);
            REQUIRE(registers[1] == ((a + b) & 0xFF));
            REQUIRE(registers[0xF] == ((a + b > 255) ? 1 : 0));
        }
    }
    CHECK(emulator.chip8.pc == 0x202);
}

TEST_CASE("subtract sets VF when there is no borrow", "[interpreter][alu]")
{
    TestEmulator emulator;
    auto& registers = emulator.chip8.registers;

    for(int a = 0; a < 256; a++) {
        for(int b = 0; b < 256; b++) {
            registers[1] = a;
            registers[2] = b;
            runOne(emulator, 0x8125);
            REQUIRE(registers[1] == ((a - b) & 0xFF));
            REQUIRE(registers[0xF] == ((a >= b) ? 1 : 0));
        }
    }
}

TEST_CASE("reverse subtract", "[interpreter][alu]")
{
    TestEmulator emulator;
    auto& registers = emulator.chip8.registers;

    registers[1] = 3;
    registers[2] = 10;
    runOne(emulator, 0x8127);
    CHECK(registers[1] == 7);
    CHECK(registers[0xF] == 1);

    registers[1] = 10;
    registers[2] = 3;
    runOne(emulator, 0x8127);
    CHECK(registers[1] == 249);
    CHECK(registers[0xF] == 0);

    registers[1] = 42;
    registers[2] = 42;
    runOne(emulator, 0x8127);
    CHECK(registers[1] == 0);
    CHECK(registers[0xF] == 1);
}

TEST_CASE("shifts move the lost bit into VF", "[interpreter][alu]")
{
    TestEmulator emulator;
    auto& registers = emulator.chip8.registers;

    for(int v = 0; v < 256; v++) {
        registers[4] = v;
        registers[5] = 0xAA;
        runOne(emulator, 0x8456);
        REQUIRE(registers[4] == (v >> 1));
        REQUIRE(registers[0xF] == (v & 0x01));

        registers[4] = v;
        runOne(emulator, 0x845E);
        REQUIRE(registers[4] == ((v << 1) & 0xFF));
        REQUIRE(registers[0xF] == ((v & 0x80) ? 1 : 0));
    }
    CHECK(registers[5] == 0xAA);
}

TEST_CASE("copy and bitwise operations leave VF alone", "[interpreter][alu]")
{
    TestEmulator emulator;
    auto& registers = emulator.chip8.registers;
    registers[0xF] = 0x55;

    registers[1] = 0x0C;
    registers[2] = 0x0A;
    runOne(emulator, 0x8121);
    CHECK(registers[1] == 0x0E);

    registers[1] = 0x0C;
    runOne(emulator, 0x8122);
    CHECK(registers[1] == 0x08);

    registers[1] = 0x0C;
    runOne(emulator, 0x8123);
    CHECK(registers[1] == 0x06);

    runOne(emulator, 0x8120);
    CHECK(registers[1] == 0x0A);

    CHECK(registers[0xF] == 0x55);
}

TEST_CASE("conditional skips", "[interpreter][flow]")
{
    TestEmulator emulator;
    auto& chip8 = emulator.chip8;
    chip8.registers[1] = 0x33;
    chip8.registers[2] = 0x33;
    chip8.registers[3] = 0x44;

    SECTION("skip if equal to immediate") {
        runOne(emulator, 0x3133);
        CHECK(chip8.pc == 0x204);
        runOne(emulator, 0x3134);
        CHECK(chip8.pc == 0x202);
    }
    SECTION("skip if not equal to immediate") {
        runOne(emulator, 0x4133);
        CHECK(chip8.pc == 0x202);
        runOne(emulator, 0x4134);
        CHECK(chip8.pc == 0x204);
    }
    SECTION("skip if registers equal") {
        runOne(emulator, 0x5120);
        CHECK(chip8.pc == 0x204);
        runOne(emulator, 0x5130);
        CHECK(chip8.pc == 0x202);
    }
    SECTION("skip if registers differ") {
        runOne(emulator, 0x9120);
        CHECK(chip8.pc == 0x202);
        runOne(emulator, 0x9130);
        CHECK(chip8.pc == 0x204);
    }
}

TEST_CASE("jump", "[interpreter][flow]")
{
    TestEmulator emulator;
    loadWords(emulator, {0x1ABC});
    stepN(emulator, 1);
    CHECK(emulator.chip8.pc == 0xABC);
    CHECK(emulator.chip8.stack.empty());
}

TEST_CASE("call and return", "[interpreter][flow]")
{
    TestEmulator emulator;
    loadWords(emulator, {0x6001, 0x2300});
    emulator.memory.write(0x300, 0x23);
    emulator.memory.write(0x301, 0x10);
    emulator.memory.write(0x310, 0x00);
    emulator.memory.write(0x311, 0xEE);
    emulator.memory.write(0x302, 0x00);
    emulator.memory.write(0x303, 0xEE);

    stepN(emulator, 2);
    CHECK(emulator.chip8.pc == 0x300);
    CHECK(emulator.chip8.stack.size() == 1);

    stepN(emulator, 1);
    CHECK(emulator.chip8.pc == 0x310);
    CHECK(emulator.chip8.stack.size() == 2);

    stepN(emulator, 1);
    CHECK(emulator.chip8.pc == 0x302);

    stepN(emulator, 1);
    CHECK(emulator.chip8.pc == 0x204);
    CHECK(emulator.chip8.stack.empty());
}

TEST_CASE("return with an empty stack is fatal", "[interpreter][errors]")
{
    TestEmulator emulator;
    loadWords(emulator, {0x00EE});

    CHECK(emulator.step() == STACK_UNDERFLOW);
    CHECK(emulator.chip8.pc == 0x200);
}

TEST_CASE("unrecognised words are fatal", "[interpreter][errors]")
{
    uint16_t word = GENERATE(as<uint16_t>{}, 0x0000, 0x0123, 0x00E1, 0x5121, 0x8128, 0x812F, 0x9121, 0xE19F, 0xE1A2, 0xF1FF, 0xF100);

    TestEmulator emulator;
    emulator.chip8.registers[1] = 9;
    loadWords(emulator, {word});

    CHECK(emulator.step() == UNSUPPORTED_INSTRUCTION);
    CHECK(emulator.chip8.pc == 0x200);
    CHECK(emulator.chip8.registers[1] == 9);
}

TEST_CASE("index register loads and arithmetic are not masked", "[interpreter][index]")
{
    TestEmulator emulator;
    auto& chip8 = emulator.chip8;

    runOne(emulator, 0xAFFF);
    CHECK(chip8.I == 0xFFF);

    chip8.registers[2] = 0x10;
    runOne(emulator, 0xF21E);
    CHECK(chip8.I == 0x100F);
    CHECK(chip8.registers[0xF] == 0);
}

TEST_CASE("jump with offset adds V0 without masking", "[interpreter][flow]")
{
    TestEmulator emulator;
    auto& chip8 = emulator.chip8;

    chip8.registers[0] = 0x04;
    chip8.registers[3] = 0x80;
    runOne(emulator, 0xB300);
    CHECK(chip8.pc == 0x304);

    chip8.registers[0] = 0xFF;
    runOne(emulator, 0xBFFF);
    CHECK(chip8.pc == 0x10FE);
    CHECK(chip8.registers[0xF] == 0);
}

TEST_CASE("random byte is masked", "[interpreter]")
{
    TestEmulator emulator;
    auto& registers = emulator.chip8.registers;

    for(int i = 0; i < 200; i++) {
        runOne(emulator, 0xC40F);
        REQUIRE((registers[4] & 0xF0) == 0);
    }

    registers[4] = 0x77;
    runOne(emulator, 0xC400);
    CHECK(registers[4] == 0);
}

TEST_CASE("sprites are XORed with collision in VF", "[interpreter][draw]")
{
    TestEmulator emulator;
    loadWords(emulator, {0x6000, 0x6100, 0xF029, 0xD015, 0xD015});
    stepN(emulator, 4);

    // glyph "0" is F0 90 90 90 F0
    CHECK(emulator.chip8.registers[0xF] == 0);
    CHECK(litPixels(emulator) == 14);
    CHECK(emulator.screen.at(0, 0) == 1);
    CHECK(emulator.screen.at(3, 0) == 1);
    CHECK(emulator.screen.at(4, 0) == 0);
    CHECK(emulator.screen.at(0, 1) == 1);
    CHECK(emulator.screen.at(1, 1) == 0);
    CHECK(emulator.screen.at(3, 4) == 1);

    stepN(emulator, 1);
    CHECK(emulator.chip8.registers[0xF] == 1);
    CHECK(litPixels(emulator) == 0);
}

TEST_CASE("sprites wrap row by row off the bottom edge", "[interpreter][draw]")
{
    TestEmulator emulator;
    emulator.chip8.registers[1] = ScreenWidth - 2;
    emulator.chip8.registers[2] = ScreenHeight - 2;
    runOne(emulator, 0xF829); // I = glyph "0", V8 = 0
    runOne(emulator, 0xD125);

    CHECK(emulator.screen.at(ScreenWidth - 2, ScreenHeight - 2) == 1);
    CHECK(emulator.screen.at(ScreenWidth - 1, ScreenHeight - 2) == 1);
    CHECK(emulator.screen.at(0, ScreenHeight - 2) == 1);
    CHECK(emulator.screen.at(1, ScreenHeight - 2) == 1);
    CHECK(emulator.screen.at(ScreenWidth - 2, ScreenHeight - 1) == 1);
    CHECK(emulator.screen.at(1, ScreenHeight - 1) == 1);
    CHECK(emulator.screen.at(ScreenWidth - 2, 0) == 1);
    CHECK(emulator.screen.at(ScreenWidth - 2, 2) == 1);
    CHECK(emulator.screen.at(1, 2) == 1);
    CHECK(litPixels(emulator) == 14);
}

TEST_CASE("zero height sprite draws nothing", "[interpreter][draw]")
{
    TestEmulator emulator;
    emulator.chip8.registers[0xF] = 1;
    runOne(emulator, 0xD010);
    CHECK(litPixels(emulator) == 0);
    CHECK(emulator.chip8.registers[0xF] == 0);
}

TEST_CASE("clear screen after drawing", "[interpreter][draw]")
{
    TestEmulator emulator;
    loadWords(emulator, {0x6A0B, 0xFA29, 0x6114, 0x6207, 0xD125, 0x00E0});
    stepN(emulator, 5);
    REQUIRE(litPixels(emulator) > 0);

    stepN(emulator, 1);
    CHECK(litPixels(emulator) == 0);
    CHECK(emulator.chip8.pc == 0x20C);
}

TEST_CASE("sprite past the end of memory is fatal", "[interpreter][errors]")
{
    TestEmulator emulator;
    emulator.chip8.I = 0xFFE;
    emulator.chip8.registers[0xF] = 7;
    loadWords(emulator, {0xD013});

    CHECK(emulator.step() == ADDRESS_OUT_OF_RANGE);
    CHECK(emulator.chip8.pc == 0x200);
    CHECK(emulator.chip8.registers[0xF] == 7);
    CHECK(litPixels(emulator) == 0);
}

TEST_CASE("key skips follow the latch", "[interpreter][keys]")
{
    TestEmulator emulator;
    auto& chip8 = emulator.chip8;
    chip8.registers[3] = 0xB;

    runOne(emulator, 0xE39E);
    CHECK(chip8.pc == 0x202);
    runOne(emulator, 0xE3A1);
    CHECK(chip8.pc == 0x204);

    emulator.pressKey(0xB);
    runOne(emulator, 0xE39E);
    CHECK(chip8.pc == 0x204);
    runOne(emulator, 0xE3A1);
    CHECK(chip8.pc == 0x202);

    emulator.pressKey(0xC);
    runOne(emulator, 0xE39E);
    CHECK(chip8.pc == 0x202);
}

TEST_CASE("wait for key repeats until a key is latched", "[interpreter][keys]")
{
    TestEmulator emulator;
    loadWords(emulator, {0xF20A});

    stepN(emulator, 3);
    CHECK(emulator.chip8.pc == 0x200);

    emulator.pressKey(0x7);
    stepN(emulator, 1);
    CHECK(emulator.chip8.registers[2] == 0x7);
    CHECK(emulator.chip8.pc == 0x202);
}

TEST_CASE("delay timer read and write", "[interpreter][timer]")
{
    TestEmulator emulator;
    loadWords(emulator, {0x6005, 0xF015, 0xF107, 0xF207});
    stepN(emulator, 3);
    CHECK(emulator.chip8.registers[1] == 5);

    FakeClock::advance(32ms);
    stepN(emulator, 1);
    CHECK(emulator.chip8.registers[2] == 3);
}

TEST_CASE("sound timer is accepted and ignored", "[interpreter][timer]")
{
    TestEmulator emulator;
    emulator.chip8.registers[0] = 0x40;
    runOne(emulator, 0xF018);
    CHECK(emulator.chip8.pc == 0x202);
    CHECK(emulator.chip8.registers[0] == 0x40);
}

TEST_CASE("digit glyph lookup", "[interpreter][index]")
{
    TestEmulator emulator;
    for(uint8_t digit = 0; digit < 16; digit++) {
        emulator.chip8.registers[6] = digit;
        runOne(emulator, 0xF629);
        CHECK(emulator.chip8.I == digit * 5);
    }
}

TEST_CASE("BCD", "[interpreter][index]")
{
    TestEmulator emulator;
    auto& chip8 = emulator.chip8;
    chip8.I = 0x300;

    chip8.registers[7] = 254;
    runOne(emulator, 0xF733);
    CHECK(emulator.memory.read(0x300) == 2);
    CHECK(emulator.memory.read(0x301) == 5);
    CHECK(emulator.memory.read(0x302) == 4);

    chip8.registers[7] = 7;
    runOne(emulator, 0xF733);
    CHECK(emulator.memory.read(0x300) == 0);
    CHECK(emulator.memory.read(0x301) == 0);
    CHECK(emulator.memory.read(0x302) == 7);
    CHECK(chip8.I == 0x300);
}

TEST_CASE("block store and load include the last register", "[interpreter][index]")
{
    TestEmulator emulator;
    auto& chip8 = emulator.chip8;
    chip8.I = 0x300;
    for(int i = 0; i < 16; i++) {
        chip8.registers[i] = 0x10 + i;
    }

    runOne(emulator, 0xF355);
    CHECK(chip8.I == 0x300);
    for(int i = 0; i <= 3; i++) {
        CHECK(emulator.memory.read(0x300 + i) == 0x10 + i);
    }
    CHECK(emulator.memory.read(0x304) == 0);

    for(int i = 0; i < 16; i++) {
        chip8.registers[i] = 0;
    }
    runOne(emulator, 0xF365);
    CHECK(chip8.I == 0x300);
    for(int i = 0; i <= 3; i++) {
        CHECK(chip8.registers[i] == 0x10 + i);
    }
    CHECK(chip8.registers[4] == 0);
}

TEST_CASE("block store and load round trip every register", "[interpreter][index]")
{
    TestEmulator emulator;
    auto& chip8 = emulator.chip8;
    chip8.I = 0x400;
    std::array<uint8_t, 16> saved;
    for(int i = 0; i < 16; i++) {
        saved[i] = 0xF0 - i * 3;
        chip8.registers[i] = saved[i];
    }

    runOne(emulator, 0xFF55);
    chip8.registers.fill(0);
    runOne(emulator, 0xFF65);
    CHECK(chip8.registers == saved);
}

TEST_CASE("block transfers past the end of memory are fatal", "[interpreter][errors]")
{
    TestEmulator emulator;
    emulator.chip8.I = 0xFFE;
    emulator.chip8.registers[2] = 0x99;

    loadWords(emulator, {0xF265});
    CHECK(emulator.step() == ADDRESS_OUT_OF_RANGE);
    CHECK(emulator.chip8.registers[2] == 0x99);

    loadWords(emulator, {0xF255});
    CHECK(emulator.step() == ADDRESS_OUT_OF_RANGE);
    CHECK(emulator.memory.read(0xFFE) == 0);

    loadWords(emulator, {0xF233});
    CHECK(emulator.step() == ADDRESS_OUT_OF_RANGE);

    loadWords(emulator, {0xF155});
    CHECK(emulator.step() == CONTINUE);
    CHECK(emulator.memory.read(0xFFF) == 0);
}

TEST_CASE("fetching past the end of memory is fatal", "[interpreter][errors]")
{
    TestEmulator emulator;
    emulator.chip8.pc = 0xFFF;
    CHECK(emulator.step() == ADDRESS_OUT_OF_RANGE);

    emulator.chip8.pc = 0x10FE;
    CHECK(emulator.step() == ADDRESS_OUT_OF_RANGE);
    CHECK(emulator.chip8.pc == 0x10FE);
}

TEST_CASE("a program may overwrite the glyphs", "[interpreter][index]")
{
    TestEmulator emulator;
    emulator.chip8.I = 0;
    emulator.chip8.registers[0] = 0x12;
    runOne(emulator, 0xF055);
    CHECK(emulator.memory.read(0) == 0x12);
}
