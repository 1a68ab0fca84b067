/**
 * @file main.cpp
 * @brief Entry point for the typolab command-line tool.
 */

#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include "app/TypoLabCli.hpp"

int main(int argc, char** argv) {
    typolab::app::CommandLine cl;
    try {
        cl = typolab::app::CommandLine::Parse(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[typolab] Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    return typolab::app::RunCommandLine(cl, std::cout);
}
