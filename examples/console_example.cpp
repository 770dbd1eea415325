#include <iostream>
#include <string>

#include "command_set.hpp"

// Minimal host: one line in, one answer out.
int main() {
    thumb::Processor processor("Test command set");
    processor.suggestions();
    demo::registerCommandSet(processor);

    std::cout << "Friendly command line processor test console, type \"help\", to show command list!\n";

    std::string line;
    while (std::getline(std::cin, line)) {
        std::cout << processor.processLine(line) << "\n";
    }
    return 0;
}
