#include "offchain_matcher_lib.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    const std::vector<std::string> args(argv, argv + argc);
    return matching::run_offchain_matcher(args, std::cin, std::cout, std::cerr);
}
