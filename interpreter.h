#ifndef CHIPVM_INTERPRETER_H
#define CHIPVM_INTERPRETER_H

#include <array>
#include <vector>
#include <cstdio>
#include <cstdint>
#include <random>

#include "chipvm.h"
#include "debug.h"
#include "opcodes.h"
#include "disassembler.h"

enum StepResult
{
    CONTINUE,
    UNSUPPORTED_INSTRUCTION,
    STACK_UNDERFLOW,
    ADDRESS_OUT_OF_RANGE,
};

const char *stepResultName(StepResult result);

template <class MEMORY, class TIMER, class SCREEN, class KEYPAD>
struct Chip8Interpreter
{
    uint64_t clock = 0;

    std::array<uint8_t, 16> registers = {0};
    std::vector<uint16_t> stack;
    uint16_t I = 0;
    uint16_t pc = 0;

    std::random_device r;
    std::default_random_engine e1;
    std::uniform_int_distribution<int> uniform_dist;

    Chip8Interpreter(uint16_t initialPC = ProgramOrigin) :
        pc(initialPC),
        e1(r()),
        uniform_dist(0, 255)
    {
    }

    uint16_t readU16(MEMORY& memory, uint16_t addr)
    {
        uint8_t hiByte = memory.read(addr);
        uint8_t loByte = memory.read(addr + 1);
        return hiByte * 256 + loByte;
    }

    // Checks [first, first + count) before an instruction touches it.
    StepResult checkRange(uint32_t first, uint32_t count, uint16_t instructionWord)
    {
        if((count > 0) && !MEMORY::isValidAddress(first + count - 1)) {
            fprintf(stderr, "%04X: instruction %04X accesses %04X-%04X outside memory\n", pc, instructionWord, first, first + count - 1);
            return ADDRESS_OUT_OF_RANGE;
        }
        return CONTINUE;
    }

    void storeALUResult(int destination, uint8_t result, bool f)
    {
        registers[destination] = result;
        registers[0xF] = f ? 1 : 0;
    }

    StepResult step(MEMORY& memory, TIMER& timer, SCREEN& screen, KEYPAD& keypad)
    {
        if(!MEMORY::isValidAddress(pc + 1u)) {
            fprintf(stderr, "%04X: instruction fetch outside memory\n", pc);
            return ADDRESS_OUT_OF_RANGE;
        }

        StepResult stepResult = CONTINUE;
        uint16_t instructionWord = readU16(memory, pc);
        uint8_t imm8Argument = instructionWord & 0x00FF;
        uint8_t imm4Argument = instructionWord & 0x000F;
        uint16_t imm12Argument = instructionWord & 0x0FFF;
        uint16_t xArgument = (instructionWord & 0x0F00) >> 8;
        uint16_t yArgument = (instructionWord & 0x00F0) >> 4;
        int highNybble = instructionWord >> 12;

        if(debug & DEBUG_STATE) {
            printf("CHIP8: clk:%llu pc:%04X I:%04X ", (unsigned long long)clock, pc, I);
            for(int i = 0; i < 16; i++) {
                printf("%02X ", registers[i]);
            }
            puts("");
        }
        clock++;

        if(debug & DEBUG_ASM) {
            puts(disassemble(pc, instructionWord).c_str());
        }

        uint16_t nextPC = pc + 2;

        switch(highNybble) {
            case INSN_SYS: {
                switch(imm12Argument) {
                    case SYS_CLS: { // 00E0 - CLS - Clear the display.
                        screen.clear();
                        break;
                    }
                    case SYS_RET: { // 00EE - RET - Return from a subroutine.
                        if(stack.empty()) {
                            fprintf(stderr, "%04X: RET with empty stack\n", pc);
                            stepResult = STACK_UNDERFLOW;
                            break;
                        }
                        nextPC = stack.back();
                        stack.pop_back();
                        break;
                    }
                    default : { // 0nnn SYS is not supported
                        fprintf(stderr, "%04X: unsupported 0NNN instruction %04X\n", pc, instructionWord);
                        stepResult = UNSUPPORTED_INSTRUCTION;
                        break;
                    }
                }
                break;
            }
            case INSN_JP: { // 1nnn - JP addr - Jump to location nnn.
                nextPC = imm12Argument;
                break;
            }
            case INSN_CALL: { // 2nnn - CALL addr - Push the address of the following instruction, then jump to nnn.
                stack.push_back(nextPC);
                nextPC = imm12Argument;
                break;
            }
            case INSN_SE_IMM: { // 3xkk - SE Vx, byte - Skip next instruction if Vx = kk.
                if(registers[xArgument] == imm8Argument) {
                    nextPC += 2;
                }
                break;
            }
            case INSN_SNE_IMM: { // 4xkk - SNE Vx, byte - Skip next instruction if Vx != kk.
                if(registers[xArgument] != imm8Argument) {
                    nextPC += 2;
                }
                break;
            }
            case INSN_SE_REG: { // 5xy0 - SE Vx, Vy - Skip next instruction if Vx = Vy.
                if(imm4Argument != 0) {
                    fprintf(stderr, "%04X: unsupported 5XYN instruction %04X\n", pc, instructionWord);
                    stepResult = UNSUPPORTED_INSTRUCTION;
                    break;
                }
                if(registers[xArgument] == registers[yArgument]) {
                    nextPC += 2;
                }
                break;
            }
            case INSN_LD_IMM: { // 6xkk - LD Vx, byte - Set Vx = kk.
                registers[xArgument] = imm8Argument;
                break;
            }
            case INSN_ADD_IMM: { // 7xkk - ADD Vx, byte - Set Vx = Vx + kk.  Wraps, VF untouched.
                registers[xArgument] = registers[xArgument] + imm8Argument;
                break;
            }
            case INSN_ALU: {
                switch(imm4Argument) {
                    case ALU_LD: { // 8xy0 - LD Vx, Vy - Set Vx = Vy.
                        registers[xArgument] = registers[yArgument];
                        break;
                    }
                    case ALU_OR: { // 8xy1 - OR Vx, Vy - Set Vx = Vx OR Vy.
                        registers[xArgument] |= registers[yArgument];
                        break;
                    }
                    case ALU_AND: { // 8xy2 - AND Vx, Vy - Set Vx = Vx AND Vy.
                        registers[xArgument] &= registers[yArgument];
                        break;
                    }
                    case ALU_XOR: { // 8xy3 - XOR Vx, Vy -  Set Vx = Vx XOR Vy.
                        registers[xArgument] ^= registers[yArgument];
                        break;
                    }
                    case ALU_ADD: { // 8xy4 - ADD Vx, Vy - Set Vx = Vx + Vy, set VF = carry.
                        int sum = registers[xArgument] + registers[yArgument];
                        storeALUResult(xArgument, sum & 0xFF, sum > 0xFF);
                        break;
                    }
                    case ALU_SUB: { // 8xy5 - SUB Vx, Vy - Set Vx = Vx - Vy, set VF = NOT borrow.
                        uint8_t result = registers[xArgument] - registers[yArgument];
                        storeALUResult(xArgument, result, registers[xArgument] >= registers[yArgument]);
                        break;
                    }
                    case ALU_SUBN: { // 8xy7 - SUBN Vx, Vy - Set Vx = Vy - Vx, set VF = NOT borrow.
                        uint8_t result = registers[yArgument] - registers[xArgument];
                        storeALUResult(xArgument, result, registers[yArgument] >= registers[xArgument]);
                        break;
                    }
                    case ALU_SHR: { // 8xy6 - SHR Vx - VF = LSB of Vx, then Vx = Vx SHR 1.  Vy is ignored.
                        registers[0xF] = registers[xArgument] & 0x01;
                        registers[xArgument] >>= 1;
                        break;
                    }
                    case ALU_SHL: { // 8xyE - SHL Vx - VF = MSB of Vx, then Vx = Vx SHL 1.  Vy is ignored.
                        registers[0xF] = (registers[xArgument] & 0x80) >> 7;
                        registers[xArgument] <<= 1;
                        break;
                    }
                    default : {
                        fprintf(stderr, "%04X: unsupported 8xyN instruction %04X\n", pc, instructionWord);
                        stepResult = UNSUPPORTED_INSTRUCTION;
                        break;
                    }
                }
                break;
            }
            case INSN_SNE_REG: { // 9xy0 - SNE Vx, Vy - Skip next instruction if Vx != Vy.
                if(imm4Argument != 0) {
                    fprintf(stderr, "%04X: unsupported 9XYN instruction %04X\n", pc, instructionWord);
                    stepResult = UNSUPPORTED_INSTRUCTION;
                    break;
                }
                if(registers[xArgument] != registers[yArgument]) {
                    nextPC += 2;
                }
                break;
            }
            case INSN_LD_I: { // Annn - LD I, addr - Set I = nnn.
                I = imm12Argument;
                break;
            }
            case INSN_JP_V0: { // Bnnn - JP V0, addr - Jump to location nnn + V0.  Not masked to 12 bits.
                nextPC = imm12Argument + registers[0];
                break;
            }
            case INSN_RND: { // Cxkk - RND Vx, byte - Set Vx = random byte AND kk.
                registers[xArgument] = uniform_dist(e1) & imm8Argument;
                break;
            }
            case INSN_DRW: { // Dxyn - DRW Vx, Vy, nibble
                // Display n-byte sprite starting at memory location I at (Vx, Vy), set VF = collision.
                // Rows are XORed onto the screen and wrap around both edges; y is wrapped
                // separately for each row rather than clipping the sprite.
                stepResult = checkRange(I, imm4Argument, instructionWord);
                if(stepResult != CONTINUE) {
                    break;
                }
                bool erased = false;
                for(int rowIndex = 0; rowIndex < imm4Argument; rowIndex++) {
                    uint8_t byte = memory.read(I + rowIndex);
                    if(screen.drawRow(byte, registers[xArgument], registers[yArgument] + rowIndex)) {
                        erased = true;
                    }
                }
                registers[0xF] = erased ? 1 : 0;
                break;
            }
            case INSN_SKP: {
                switch(imm8Argument) {
                    case SKP_KEY: { // Ex9E - SKP Vx - Skip next instruction if key with the value of Vx is pressed.
                        if(keypad.pressed(registers[xArgument])) {
                            if(debug & DEBUG_KEYS) {
                                printf("clock %llu, pc %04X, SKP_KEY, key %d pressed\n", (unsigned long long)clock, pc, registers[xArgument]);
                            }
                            nextPC += 2;
                        }
                        break;
                    }
                    case SKNP_KEY: { // ExA1 - SKNP Vx - Skip next instruction if key with the value of Vx is not pressed.
                        if(!keypad.pressed(registers[xArgument])) {
                            nextPC += 2;
                        } else {
                            if(debug & DEBUG_KEYS) {
                                printf("clock %llu, pc %04X, SKNP_KEY, key %d pressed\n", (unsigned long long)clock, pc, registers[xArgument]);
                            }
                        }
                        break;
                    }
                    default : {
                        fprintf(stderr, "%04X: unsupported ExNN instruction %04X\n", pc, instructionWord);
                        stepResult = UNSUPPORTED_INSTRUCTION;
                        break;
                    }
                }
                break;
            }
            case INSN_LD_SPECIAL: {
                switch(imm8Argument) {
                    case SPECIAL_GET_DELAY: { // Fx07 - LD Vx, DT - Set Vx = delay timer value.
                        registers[xArgument] = timer.get();
                        break;
                    }
                    case SPECIAL_KEYWAIT: { // Fx0A - LD Vx, K - Wait for a key press, store the value of the key in Vx.
                        if(keypad.key) {
                            if(debug & DEBUG_KEYS) {
                                printf("key wait over, key %d\n", *keypad.key);
                            }
                            registers[xArgument] = *keypad.key;
                        } else {
                            nextPC = pc;
                        }
                        break;
                    }
                    case SPECIAL_SET_DELAY: { // Fx15 - LD DT, Vx - Set delay timer = Vx.
                        timer.set(registers[xArgument]);
                        break;
                    }
                    case SPECIAL_SET_SOUND: { // Fx18 - LD ST, Vx - Set sound timer = Vx.  There is no sound; accepted and ignored.
                        break;
                    }
                    case SPECIAL_ADD_INDEX: { // Fx1E - ADD I, Vx - Set I = I + Vx.  16-bit, not masked to 12 bits.
                        I += registers[xArgument];
                        break;
                    }
                    case SPECIAL_LD_DIGIT: { // Fx29 - LD F, Vx - Set I = location of sprite for digit Vx.
                        I = memory.getDigitLocation(registers[xArgument]);
                        break;
                    }
                    case SPECIAL_LD_BCD: { // Fx33 - LD B, Vx - Store BCD representation of Vx in memory locations I, I+1, and I+2.
                        stepResult = checkRange(I, 3, instructionWord);
                        if(stepResult != CONTINUE) {
                            break;
                        }
                        memory.write(I + 0, registers[xArgument] / 100);
                        memory.write(I + 1, (registers[xArgument] % 100) / 10);
                        memory.write(I + 2, registers[xArgument] % 10);
                        break;
                    }
                    case SPECIAL_LD_IVX: { // Fx55 - LD [I], Vx - Store registers V0 through Vx in memory starting at location I.  I is unchanged.
                        stepResult = checkRange(I, xArgument + 1, instructionWord);
                        if(stepResult != CONTINUE) {
                            break;
                        }
                        for(int i = 0; i <= xArgument; i++) {
                            memory.write(I + i, registers[i]);
                        }
                        break;
                    }
                    case SPECIAL_LD_VXI: { // Fx65 - LD Vx, [I] - Read registers V0 through Vx from memory starting at location I.  I is unchanged.
                        stepResult = checkRange(I, xArgument + 1, instructionWord);
                        if(stepResult != CONTINUE) {
                            break;
                        }
                        for(int i = 0; i <= xArgument; i++) {
                            registers[i] = memory.read(I + i);
                        }
                        break;
                    }
                    default : {
                        fprintf(stderr, "%04X: unsupported FxNN instruction %04X\n", pc, instructionWord);
                        stepResult = UNSUPPORTED_INSTRUCTION;
                        break;
                    }
                }
                break;
            }
        }

        if(stepResult == CONTINUE) {
            pc = nextPC;
        }
        return stepResult;
    }
};

#endif // CHIPVM_INTERPRETER_H
