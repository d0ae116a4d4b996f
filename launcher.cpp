#include <string>
#include <vector>
#include <cstdlib>
#include <iostream>
#include <iomanip>
#include <fstream>
#include <stdexcept>
#include <algorithm>
#include <nlohmann/json.hpp>

#include "colors.h"

int main(int argc, char **argv)
{
    if(argc < 2) {
        std::cerr << "usage: " << argv[0] << " programs.json [romsdir programToRun]\n";
        exit(EXIT_FAILURE);
    }

    std::ifstream programsFile(argv[1]);
    if(!programsFile) {
        std::cerr << "couldn't open \"" << argv[1] << "\"\n";
        exit(EXIT_FAILURE);
    }

    nlohmann::json programs;
    try {
        programsFile >> programs;
    } catch(const nlohmann::json::exception& e) {
        std::cerr << argv[1] << ": " << e.what() << "\n";
        exit(EXIT_FAILURE);
    }

    if(argc < 4) {
        size_t maxlength = 0;
        for (const auto& [program, specifics] : programs.items()) {
            maxlength = std::max(program.length(), maxlength);
        }
        for (const auto& [program, specifics] : programs.items()) {
            std::cout << std::setw(maxlength) << program << std::setw(0) << " : " << specifics.value("title", "") << "\n";
            std::cout << std::setw(maxlength) << "" << std::setw(0) << "   " << specifics.value("desc", "") << "\n";
        }
        exit(EXIT_SUCCESS);
    }

    std::string romsDir = argv[2];
    std::string chosenProgram = argv[3];

    if(!programs.contains(chosenProgram)) {
        std::cerr << "unknown program \"" << chosenProgram << "\"\n";
        exit(EXIT_FAILURE);
    }

    const auto& program = programs[chosenProgram];

    std::vector<std::string> emulatorArgs;

    emulatorArgs.push_back("chipvm");

    try {
        if(program.contains("options")) {
            const auto& options = program["options"];

            if(options.contains("backgroundColor")) {
                emulatorArgs.push_back("--color 0 " + convertToHexColor(options["backgroundColor"].get<std::string>()));
            }
            if(options.contains("fillColor")) {
                emulatorArgs.push_back("--color 1 " + convertToHexColor(options["fillColor"].get<std::string>()));
            }
            if(options.contains("scale")) {
                emulatorArgs.push_back("--scale " + std::to_string(options["scale"].get<int>()));
            }
        }
    } catch(const nlohmann::json::exception& e) {
        std::cerr << "bad options for \"" << chosenProgram << "\": " << e.what() << "\n";
        exit(EXIT_FAILURE);
    } catch(const std::out_of_range& e) {
        std::cerr << "bad options for \"" << chosenProgram << "\": " << e.what() << "\n";
        exit(EXIT_FAILURE);
    }

    emulatorArgs.push_back(romsDir + "/" + chosenProgram + ".ch8");

    bool first = true;
    for(const auto& arg: emulatorArgs) {
        if(!first) {
            std::cout << " ";
        }
        std::cout << arg;
        first = false;
    }
    std::cout << "\n";

    exit(EXIT_SUCCESS);
}
