#ifndef CHIPVM_OPCODES_H
#define CHIPVM_OPCODES_H

enum InstructionHighNybble
{
    INSN_SYS = 0x0,
    INSN_JP = 0x1,
    INSN_CALL = 0x2,
    INSN_SE_IMM = 0x3,
    INSN_SNE_IMM = 0x4,
    INSN_SE_REG = 0x5,
    INSN_LD_IMM = 0x6,
    INSN_ADD_IMM = 0x7,
    INSN_ALU = 0x8,
    INSN_SNE_REG = 0x9,
    INSN_LD_I = 0xA,
    INSN_JP_V0 = 0xB,
    INSN_RND = 0xC,
    INSN_DRW = 0xD,
    INSN_SKP = 0xE,
    INSN_LD_SPECIAL = 0xF,
};

enum SYSOpcode // 00NN low byte
{
    SYS_CLS = 0xE0,
    SYS_RET = 0xEE,
};

enum SPECIALOpcode // FxNN low byte
{
    SPECIAL_GET_DELAY = 0x07,
    SPECIAL_KEYWAIT = 0x0A,
    SPECIAL_SET_DELAY = 0x15,
    SPECIAL_SET_SOUND = 0x18,
    SPECIAL_ADD_INDEX = 0x1E,
    SPECIAL_LD_DIGIT = 0x29,
    SPECIAL_LD_BCD = 0x33,
    SPECIAL_LD_IVX = 0x55,
    SPECIAL_LD_VXI = 0x65,
};

enum SKPOpcode // ExNN low byte
{
    SKP_KEY = 0x9E,
    SKNP_KEY = 0xA1,
};

enum ALUOpcode // 8xyN low nybble
{
    ALU_LD = 0x0,
    ALU_OR = 0x1,
    ALU_AND = 0x2,
    ALU_XOR = 0x3,
    ALU_ADD = 0x4,
    ALU_SUB = 0x5,
    ALU_SHR = 0x6,
    ALU_SUBN = 0x7,
    ALU_SHL = 0xE,
};

#endif // CHIPVM_OPCODES_H
