#include "commands.hpp"
#include <common/oneline_utils.hpp>
#include <iostream>

int main(int argc, char **argv) {
    std::ios_base::sync_with_stdio(false);
    return blasttab::RunCommand(oneline::initialize<std::string, char*>(argv + 1, argv + argc), std::cout);
}
