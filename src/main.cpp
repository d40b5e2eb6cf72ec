#include <iostream>
#include <string>
#include <vector>

#include "polyp/commands.h"
#include "polyp/config.h"
#include "polyp/ui.h"

std::vector<std::string> collect_args(int start_index, int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = start_index; i < argc; ++i) {
        args.push_back(argv[i]);
    }
    return args;
}

int main(int argc, char* argv[]) {
    PolypConfig config = load_config_from_env();
    set_color_enabled(config.color && stdout_is_terminal());

    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string command = argv[1];

    try {
        if (command == "-h" || command == "--help") {
            print_usage();
            return 0;
        } else if (command == "-v" || command == "--version") {
            std::cout << "git-polyp version " << POLYP_VERSION << std::endl;
            return 0;
        } else if (command == "rebase-stack") {
            return handle_rebase_stack(collect_args(2, argc, argv), config);
        } else if (command[0] == '-') {
            std::cerr << format_error("Invalid options: " + command) << std::endl << std::endl;
            std::cerr << "Run 'git-polyp --help' for usage information." << std::endl;
            return 1;
        } else {
            std::cerr << format_error("Unknown command: " + command) << std::endl << std::endl;
            std::cerr << "Run 'git-polyp --help' for usage information." << std::endl;
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
