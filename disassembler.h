#ifndef CHIPVM_DISASSEMBLER_H
#define CHIPVM_DISASSEMBLER_H

#include <string>
#include <cstdint>

// One line of listing, "PPPP: (WWWW) MNEMONIC operands", or "???" in place
// of the mnemonic for words that aren't instructions.
std::string disassemble(uint16_t pc, uint16_t instructionWord);

#endif // CHIPVM_DISASSEMBLER_H
