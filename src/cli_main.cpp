#include <iostream>
#include <string>
#include <vector>
#include "pathmap/Cli.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return pathmap::run_cli(args, std::cout, std::cerr);
}
