// bk_core.h - Core types and helpers for the bk directory bookmark tool
#ifndef BK_CORE_H
#define BK_CORE_H

#include <iostream>
#include <filesystem>
#include <vector>
#include <algorithm>
#include <string>
#include <cstring>
#include <cstdlib>
#include <optional>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

#ifndef BK_VERSION
#define BK_VERSION "0.0.0"
#endif
#ifndef BUILD_DATE
#define BUILD_DATE "unknown"
#endif
#ifndef GIT_HASH
#define GIT_HASH "unknown"
#endif

constexpr const char* APP_NAME = "bk";
constexpr const char* STORE_FILE_NAME = "bookmarks.json";
constexpr const char* LOG_FILE_NAME = "bk.log";

// ANSI color codes
extern const std::string RESET;
extern const std::string GREEN;
extern const std::string YELLOW;
extern const std::string CYAN;
extern const std::string BOLD;
extern const std::string GRAY;

// Subcommands understood by the entry point
enum class Command {
    Select,
    Add,
    Init,
    Help,
    Version
};

// Configuration structure
struct Config {
    Command command = Command::Select;
    bool no_colors = false;
    bool debug = false;
    fs::path store_path;    // empty = default location
};

// A saved directory with an optional alias and a usage counter
struct Bookmark {
    std::string path;
    std::string name;
    int count = 0;

    // Alias if set, else the path
    const std::string& display_name() const;
    bool operator==(const Bookmark& other) const;
    bool operator!=(const Bookmark& other) const;
};

// Utility functions
std::string to_lower(const std::string& s);
bool contains_ci(const std::string& haystack, const std::string& needle);
std::string trim(const std::string& s);
void pop_utf8_char(std::string& s);
fs::path config_directory();
fs::path default_store_path();
fs::path resolve_store_path(const Config& config);
bool colors_enabled(const Config& config);

// Installs the default spdlog logger; never writes to the terminal
void setup_logging(const Config& config);

#endif // BK_CORE_H
