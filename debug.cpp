#include "debug.h"

std::unordered_map<std::string, int> keywordsToDebugFlags = {
    {"state", DEBUG_STATE},
    {"asm", DEBUG_ASM},
    {"draw", DEBUG_DRAW},
    {"keys", DEBUG_KEYS},
};

int debug = 0;
