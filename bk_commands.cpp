// bk_commands.cpp - Subcommand implementations
#include "bk_commands.h"
#include <spdlog/spdlog.h>

bool parse_arguments(const std::vector<std::string>& args, Config& config, std::string& error) {
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help" || arg == "help") {
            config.command = Command::Help;
        } else if (arg == "-v" || arg == "--version") {
            config.command = Command::Version;
        } else if (arg == "add") {
            config.command = Command::Add;
        } else if (arg == "init") {
            config.command = Command::Init;
        } else if (arg == "--no-colors") {
            config.no_colors = true;
        } else if (arg == "--debug") {
            config.debug = true;
        } else if (arg == "-s" || arg == "--store") {
            if (i + 1 >= args.size()) {
                error = "Option " + arg + " requires a file argument";
                return false;
            }
            config.store_path = args[++i];
        } else {
            error = "Unknown option: " + arg;
            return false;
        }

        // help and version win over anything that follows
        if (config.command == Command::Help || config.command == Command::Version) {
            return true;
        }
    }
    return true;
}

void print_usage(std::ostream& out, const char* program_name) {
    out << "bk - directory bookmarks\n\n";
    out << "Usage: " << program_name << " [COMMAND] [OPTIONS]\n\n";
    out << "Commands:\n";
    out << "  bk                Open bookmark selector\n";
    out << "  bk add            Add current directory to bookmarks\n";
    out << "  bk init           Print the shell function that changes directory\n";
    out << "  bk help           Show this help message\n\n";
    out << "Options:\n";
    out << "  -h, --help        Show this help message\n";
    out << "  -v, --version     Show version information\n";
    out << "  -s, --store FILE  Use FILE instead of the default bookmark store\n";
    out << "  --no-colors       Disable colored output\n";
    out << "  --debug           Write debug messages to the log file\n\n";
    out << "Keys:\n";
    out << "  ↑/↓, j/k  Navigate\n";
    out << "  Enter     Go to selected directory\n";
    out << "  e         Edit bookmark name\n";
    out << "  d         Delete bookmark\n";
    out << "  Esc       Clear filter\n";
    out << "  q         Quit\n\n";
    out << "Bookmarks are stored in " << default_store_path().string() << "\n";
}

void print_version(std::ostream& out) {
    out << "bk " << BK_VERSION << "\n";
    out << "Build date: " << BUILD_DATE << "\n";
    out << "Git hash: " << GIT_HASH << "\n";
}

void print_shell_init(std::ostream& out) {
    out << "# Add ~/.local/bin to PATH if bk is installed there:\n";
    out << "#   export PATH=\"$HOME/.local/bin:$PATH\"\n";
    out << "#\n";
    out << "# Add to ~/.bashrc or ~/.zshrc:  eval \"$(bk init)\"\n";
    out << "bk() {\n";
    out << "  if [[ $# -gt 0 ]]; then\n";
    out << "    command bk \"$@\"\n";
    out << "  else\n";
    out << "    local dir\n";
    out << "    dir=$(command bk)\n";
    out << "    if [[ -n \"$dir\" && -d \"$dir\" ]]; then\n";
    out << "      cd \"$dir\"\n";
    out << "    fi\n";
    out << "  fi\n";
    out << "}\n";
}

int add_mode(const Config& config, const BookmarkStore& store, const fs::path& cwd,
             std::istream& in, std::ostream& out, std::ostream& err) {
    bool color = colors_enabled(config);
    std::string path = cwd.string();
    auto bookmarks = store.load();

    for (const auto& b : bookmarks) {
        if (b.path == path) {
            out << "Bookmark already exists: " << path << "\n";
            return 0;
        }
    }

    out << "Adding: " << path << "\n";
    out << "Alias (enter to skip): " << std::flush;

    std::string alias;
    std::getline(in, alias);
    alias = trim(alias);

    Bookmark bookmark;
    bookmark.path = path;
    bookmark.name = alias;
    bookmark.count = 0;
    bookmarks.push_back(bookmark);

    std::string error;
    if (!store.save(bookmarks, error)) {
        err << "Error saving bookmarks: " << error << "\n";
        return 1;
    }
    spdlog::info("add: bookmarked {}", path);

    out << (color ? GREEN : "") << "Added bookmark: " << (color ? RESET : "");
    if (!alias.empty()) {
        out << (color ? BOLD : "") << alias << (color ? RESET : "") << " (" << path << ")\n";
    } else {
        out << path << "\n";
    }
    return 0;
}
