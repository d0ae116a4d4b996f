#ifndef CHIPVM_COLORS_H
#define CHIPVM_COLORS_H

#include <map>
#include <string>
#include <cstdint>

typedef std::map<std::string, uint32_t> ColorTable;

extern const ColorTable colorsByName;

uint32_t expand12BitColorTo24(uint32_t color);

// A name from names, "#RGB", "#RRGGBB" or bare hex digits, as the RRGGBB
// string the emulator's --color option takes.  Names win over hex, so "bad"
// is looked up before it is read as #BBAADD.  Throws std::out_of_range for
// anything else.
std::string convertToHexColor(const std::string& name, const ColorTable& names = colorsByName);

#endif // CHIPVM_COLORS_H
