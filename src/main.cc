#include "cli.hpp"

#include <iostream>


int main(int argc, const char** argv) {
    return cli_main(argc, argv, std::cout, std::cerr);
}
