#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <algorithm>

#include "colors.h"

const ColorTable colorsByName = {
    {"aquamarine", 0x7fffd4},
    {"black", 0x000000},
    {"coral", 0xFF7F50},
    {"deeppink", 0xFF1493},
    {"gray", 0x808080},
    {"green", 0x00FF00},
    {"hotpink", 0xFF69B4},
    {"lavender", 0xE6E6FA},
    {"lightcyan", 0xE0FFFF},
    {"lightgray", 0xD3D3D3},
    {"navy", 0x000080},
    {"powderblue", 0xB0E0E6},
    {"red", 0xFF0000},
    {"white", 0xFFFFFF},
};

uint32_t expand12BitColorTo24(uint32_t color)
{
    uint8_t r = (color & 0xF00) >> 8;
    r = (r << 4) | r;
    uint8_t g = (color & 0x0F0) >> 4;
    g = (g << 4) | g;
    uint8_t b = (color & 0x00F) >> 0;
    b = (b << 4) | b;
    return (r << 16) | (g << 8) | (b << 0);
}

static bool isHexColor(const std::string& digits)
{
    return ((digits.length() == 3) || (digits.length() == 6)) &&
        std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isxdigit(c); });
}

std::string convertToHexColor(const std::string& name, const ColorTable& names)
{
    uint32_t color;

    auto found = names.find(name);
    if(found != names.end()) {
        color = found->second;
    } else {
        std::string digits = (!name.empty() && (name[0] == '#')) ? name.substr(1) : name;
        if(!isHexColor(digits)) {
            throw std::out_of_range("unknown color \"" + name + "\"");
        }
        color = strtoul(digits.c_str(), nullptr, 16);
        if(digits.length() == 3) {
            color = expand12BitColorTo24(color);
        }
    }

    std::stringstream ss;
    ss << std::setfill('0') << std::setw(6) << std::hex << color;
    return ss.str();
}
