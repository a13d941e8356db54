// imgopt.cpp
// MIT License (c) 2026 Pedro

#include "commands/commands.h"

#include <iostream>
#include <string>

namespace {

void print_usage() {
    std::cout << "Usage: imgopt <command> [OPTIONS]\n\n"
              << "Generate, track and serve resized image variants.\n\n"
              << "Commands:\n"
              << "  process [--force]      Generate missing or outdated variants\n"
              << "  clean                  Delete the output directory\n"
              << "  manifest               Rewrite manifest.json without encoding\n"
              << "  fetch <target>         Resolve one image request, generating it when needed\n"
              << "  srcset <image>         Print the srcset of a processed image\n\n"
              << "Run 'imgopt <command> --help' for the options of a command.\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string command = argv[1];
    if (command == "--help" || command == "-h" || command == "help") {
        print_usage();
        return 0;
    }

    using namespace imgopt::commands;
    if (command == "process") {
        return run_process(argc - 1, argv + 1);
    }
    if (command == "clean") {
        return run_clean(argc - 1, argv + 1);
    }
    if (command == "manifest") {
        return run_manifest(argc - 1, argv + 1);
    }
    if (command == "fetch") {
        return run_fetch(argc - 1, argv + 1);
    }
    if (command == "srcset") {
        return run_srcset(argc - 1, argv + 1);
    }

    std::cerr << "Error: Unknown command: " << command << '\n';
    print_usage();
    return 1;
}
