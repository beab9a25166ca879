// bk.cpp - Directory bookmark selector main program

#include "bk_core.h"
#include "bk_store.h"
#include "bk_selector.h"
#include "bk_commands.h"
#include <clocale>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "bk_ui.h"

// Interactive mode: prints the chosen path, and nothing else, to stdout
static int select_mode(Config& config) {
    BookmarkStore store(resolve_store_path(config));
    Selector selector(store);

    try {
        InteractiveUI ui(selector, config);
        ui.run();
    } catch (const std::runtime_error& e) {
        spdlog::error("ui: {}", e.what());
        std::cerr << "Error opening tty: " << e.what() << "\n";
        return 1;
    }

    if (!selector.save_error().empty()) {
        std::cerr << "Warning: failed to save bookmarks: " << selector.save_error() << "\n";
    }

    if (selector.result()) {
        std::cout << *selector.result() << "\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    std::setlocale(LC_ALL, "");

    Config config;
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string error;

    if (!parse_arguments(args, config, error)) {
        std::cerr << error << "\n";
        std::cerr << "Try '" << argv[0] << " --help' for more information.\n";
        return 1;
    }

    switch (config.command) {
        case Command::Help:
            print_usage(std::cout, argv[0]);
            return 0;

        case Command::Version:
            print_version(std::cout);
            return 0;

        case Command::Init:
            print_shell_init(std::cout);
            return 0;

        case Command::Add: {
            setup_logging(config);
            fs::path cwd;
            try {
                cwd = fs::current_path();
            } catch (const fs::filesystem_error& e) {
                std::cerr << "Error getting current directory: " << e.what() << "\n";
                return 1;
            }
            BookmarkStore store(resolve_store_path(config));
            return add_mode(config, store, cwd, std::cin, std::cout, std::cerr);
        }

        case Command::Select:
        default:
            setup_logging(config);
            return select_mode(config);
    }
}
