#include "commands/deconstruct.hpp"
#include "commands/sections.hpp"

#include <iostream>
#include <string>

static int print_usage(int code) {
    std::cerr
        << "usage:\n"
        << "  paper-deconstructor deconstruct --input <pdf|txt> --output <md> --section <name> [...]\n"
        << "  paper-deconstructor sections --input <pdf|txt> [--json <path>]\n"
        << "  paper-deconstructor help\n"
        << "\n"
        << "run `paper-deconstructor <command> --help` for command options\n";
    return code;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage(2);

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") return print_usage(0);

    if (cmd == "deconstruct") return cmd_deconstruct(argc - 1, argv + 1);
    if (cmd == "sections")    return cmd_sections(argc - 1, argv + 1);

    std::cerr << "unknown command: " << cmd << "\n";
    return print_usage(2);
}
