#include <map>
#include <string>
#include <vector>
#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <filesystem>

#include "chipvm.h"
#include "debug.h"
#include "emulator.h"
#include "window.h"

void usage(const char *name)
{
    fprintf(stderr, "usage: %s [options] ROM.ch8\n", name);
    fprintf(stderr, "options:\n");
    fprintf(stderr, "\t--color N RRGGBB   - set color N (0 off, 1 on) to RRGGBB\n");
    fprintf(stderr, "\t--scale N          - magnify each pixel N times (default 10)\n");
    fprintf(stderr, "\t--debug name       - enable debug output\n");
    fprintf(stderr, "\t                     \"state\" : registers before each instruction\n");
    fprintf(stderr, "\t                     \"asm\" : disassemble each instruction\n");
    fprintf(stderr, "\t                     \"draw\" : each pixel drawn\n");
    fprintf(stderr, "\t                     \"keys\" : key presses and releases\n");
}

bool readProgram(const std::filesystem::path& path, std::vector<uint8_t>& program)
{
    std::ifstream romFile(path, std::ios::binary);
    if(!romFile) {
        return false;
    }
    program.assign(std::istreambuf_iterator<char>(romFile), std::istreambuf_iterator<char>());
    return !romFile.bad();
}

int main(int argc, char **argv)
{
    const char *progname = argv[0];
    argc -= 1;
    argv += 1;

    int scale = 10;
    std::map<int,vec3ub> colorTable;

    while((argc > 0) && (argv[0][0] == '-')) {
        if(strcmp(argv[0], "--color") == 0) {
            if(argc < 3) {
                fprintf(stderr, "--color option requires a color number and color.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            int colorIndex = atoi(argv[1]);
            if((colorIndex < 0) || (colorIndex > 1)) {
                fprintf(stderr, "color number %d is not 0 or 1.\n", colorIndex);
                usage(progname);
                exit(EXIT_FAILURE);
            }
            uint32_t colorName = strtoul(argv[2], nullptr, 16);
            vec3ub color = vec3ubFromInts((colorName >> 16) & 0xff, (colorName >> 8) & 0xff, colorName & 0xff);
            colorTable[colorIndex] = color;
            argv += 3;
            argc -= 3;
        } else if(strcmp(argv[0], "--scale") == 0) {
            if(argc < 2) {
                fprintf(stderr, "--scale option requires a magnification value.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            scale = atoi(argv[1]);
            if(scale < 1) {
                fprintf(stderr, "scale %s must be at least 1.\n", argv[1]);
                usage(progname);
                exit(EXIT_FAILURE);
            }
            argv += 2;
            argc -= 2;
        } else if(strcmp(argv[0], "--debug") == 0) {
            if(argc < 2) {
                fprintf(stderr, "--debug option requires a debug flag to enable.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            std::string debugKeyword = argv[1];
            if(keywordsToDebugFlags.count(debugKeyword) == 0) {
                fprintf(stderr, "unknown debug flag \"%s\".\n", argv[1]);
                usage(progname);
                exit(EXIT_FAILURE);
            }
            debug |= keywordsToDebugFlags.at(debugKeyword);
            fprintf(stderr, "debug value now 0x%02X\n", debug);
            argv += 2;
            argc -= 2;
        } else if(
            (strcmp(argv[0], "-help") == 0) ||
            (strcmp(argv[0], "-h") == 0) ||
            (strcmp(argv[0], "-?") == 0))
        {
            usage(progname);
            exit(EXIT_SUCCESS);
        } else {
            fprintf(stderr, "unknown parameter \"%s\"\n", argv[0]);
            usage(progname);
            exit(EXIT_FAILURE);
        }
    }

    if(argc < 1) {
        usage(progname);
        exit(EXIT_FAILURE);
    }

    std::filesystem::path romPath(argv[0]);
    std::vector<uint8_t> program;
    if(!readProgram(romPath, program)) {
        fprintf(stderr, "couldn't read ROM \"%s\"\n", argv[0]);
        exit(EXIT_FAILURE);
    }

    Emulator<> emulator;
    emulator.loadProgram(program);

    Window window(romPath.filename().string(), scale);
    if(!window.succeeded) {
        fprintf(stderr, "couldn't open a window\n");
        exit(EXIT_FAILURE);
    }
    for(const auto& [index, color] : colorTable) {
        window.colorTable[index] = color;
    }

    while(window.pollEvents() && emulator.iterate(window.heldKey(), window)) {
    }

    if(emulator.result != CONTINUE) {
        fprintf(stderr, "halted at %04X: %s\n", emulator.chip8.pc, stepResultName(emulator.result));
        exit(EXIT_FAILURE);
    }

    exit(EXIT_SUCCESS);
}
