// bk_commands.h - Non-interactive subcommands and argument parsing
#ifndef BK_COMMANDS_H
#define BK_COMMANDS_H

#include "bk_core.h"
#include "bk_store.h"

// Fills config from the arguments following the program name.
// Returns false and sets error on an unknown option or missing value.
bool parse_arguments(const std::vector<std::string>& args, Config& config, std::string& error);

void print_usage(std::ostream& out, const char* program_name);
void print_version(std::ostream& out);

// Shell function that changes directory to the path bk prints
void print_shell_init(std::ostream& out);

// Bookmarks cwd unless it is already stored, prompting on in for an alias.
// Returns the process exit code.
int add_mode(const Config& config, const BookmarkStore& store, const fs::path& cwd,
             std::istream& in, std::ostream& out, std::ostream& err);

#endif // BK_COMMANDS_H
