#include <cstdio>

#include "disassembler.h"
#include "opcodes.h"

std::string disassemble(uint16_t pc, uint16_t instructionWord)
{
    unsigned int imm8Argument = instructionWord & 0x00FF;
    unsigned int imm4Argument = instructionWord & 0x000F;
    unsigned int imm12Argument = instructionWord & 0x0FFF;
    unsigned int xArgument = (instructionWord & 0x0F00) >> 8;
    unsigned int yArgument = (instructionWord & 0x00F0) >> 4;
    int highNybble = instructionWord >> 12;

    char operation[32] = "???";

    switch(highNybble) {
        case INSN_SYS: {
            switch(imm12Argument) {
                case SYS_CLS: {
                    snprintf(operation, sizeof(operation), "CLS");
                    break;
                }
                case SYS_RET: {
                    snprintf(operation, sizeof(operation), "RET");
                    break;
                }
            }
            break;
        }
        case INSN_JP: {
            snprintf(operation, sizeof(operation), "JP %03X", imm12Argument);
            break;
        }
        case INSN_CALL: {
            snprintf(operation, sizeof(operation), "CALL %03X", imm12Argument);
            break;
        }
        case INSN_SE_IMM: {
            snprintf(operation, sizeof(operation), "SE V%X, %02X", xArgument, imm8Argument);
            break;
        }
        case INSN_SNE_IMM: {
            snprintf(operation, sizeof(operation), "SNE V%X, %02X", xArgument, imm8Argument);
            break;
        }
        case INSN_SE_REG: {
            if(imm4Argument == 0) {
                snprintf(operation, sizeof(operation), "SE V%X, V%X", xArgument, yArgument);
            }
            break;
        }
        case INSN_LD_IMM: {
            snprintf(operation, sizeof(operation), "LD V%X, %02X", xArgument, imm8Argument);
            break;
        }
        case INSN_ADD_IMM: {
            snprintf(operation, sizeof(operation), "ADD V%X, %02X", xArgument, imm8Argument);
            break;
        }
        case INSN_ALU: {
            const char *mnemonic = nullptr;
            switch(imm4Argument) {
                case ALU_LD: mnemonic = "LD"; break;
                case ALU_OR: mnemonic = "OR"; break;
                case ALU_AND: mnemonic = "AND"; break;
                case ALU_XOR: mnemonic = "XOR"; break;
                case ALU_ADD: mnemonic = "ADD"; break;
                case ALU_SUB: mnemonic = "SUB"; break;
                case ALU_SHR: mnemonic = "SHR"; break;
                case ALU_SUBN: mnemonic = "SUBN"; break;
                case ALU_SHL: mnemonic = "SHL"; break;
            }
            if(mnemonic) {
                snprintf(operation, sizeof(operation), "%s V%X, V%X", mnemonic, xArgument, yArgument);
            }
            break;
        }
        case INSN_SNE_REG: {
            if(imm4Argument == 0) {
                snprintf(operation, sizeof(operation), "SNE V%X, V%X", xArgument, yArgument);
            }
            break;
        }
        case INSN_LD_I: {
            snprintf(operation, sizeof(operation), "LD I, %03X", imm12Argument);
            break;
        }
        case INSN_JP_V0: {
            snprintf(operation, sizeof(operation), "JP V0, %03X", imm12Argument);
            break;
        }
        case INSN_RND: {
            snprintf(operation, sizeof(operation), "RND V%X, %02X", xArgument, imm8Argument);
            break;
        }
        case INSN_DRW: {
            snprintf(operation, sizeof(operation), "DRW V%X, V%X, %X", xArgument, yArgument, imm4Argument);
            break;
        }
        case INSN_SKP: {
            switch(imm8Argument) {
                case SKP_KEY: {
                    snprintf(operation, sizeof(operation), "SKP V%X", xArgument);
                    break;
                }
                case SKNP_KEY: {
                    snprintf(operation, sizeof(operation), "SKNP V%X", xArgument);
                    break;
                }
            }
            break;
        }
        case INSN_LD_SPECIAL: {
            switch(imm8Argument) {
                case SPECIAL_GET_DELAY: {
                    snprintf(operation, sizeof(operation), "LD V%X, DT", xArgument);
                    break;
                }
                case SPECIAL_KEYWAIT: {
                    snprintf(operation, sizeof(operation), "LD V%X, K", xArgument);
                    break;
                }
                case SPECIAL_SET_DELAY: {
                    snprintf(operation, sizeof(operation), "LD DT, V%X", xArgument);
                    break;
                }
                case SPECIAL_SET_SOUND: {
                    snprintf(operation, sizeof(operation), "LD ST, V%X", xArgument);
                    break;
                }
                case SPECIAL_ADD_INDEX: {
                    snprintf(operation, sizeof(operation), "ADD I, V%X", xArgument);
                    break;
                }
                case SPECIAL_LD_DIGIT: {
                    snprintf(operation, sizeof(operation), "LD F, V%X", xArgument);
                    break;
                }
                case SPECIAL_LD_BCD: {
                    snprintf(operation, sizeof(operation), "LD B, V%X", xArgument);
                    break;
                }
                case SPECIAL_LD_IVX: {
                    snprintf(operation, sizeof(operation), "LD [I], V%X", xArgument);
                    break;
                }
                case SPECIAL_LD_VXI: {
                    snprintf(operation, sizeof(operation), "LD V%X, [I]", xArgument);
                    break;
                }
            }
            break;
        }
    }

    char line[64];
    snprintf(line, sizeof(line), "%04X: (%04X) %s", static_cast<unsigned int>(pc), static_cast<unsigned int>(instructionWord), operation);
    return line;
}
