// bk_core.cpp - Core functionality implementation
#include "bk_core.h"
#include <cctype>
#include <memory>
#include <pwd.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

// Define color constants
const std::string RESET = "\033[0m";
const std::string GREEN = "\033[32m";
const std::string YELLOW = "\033[33m";
const std::string CYAN = "\033[36m";
const std::string BOLD = "\033[1m";
const std::string GRAY = "\033[90m";

const std::string& Bookmark::display_name() const {
    return name.empty() ? path : name;
}

bool Bookmark::operator==(const Bookmark& other) const {
    return path == other.path && name == other.name && count == other.count;
}

bool Bookmark::operator!=(const Bookmark& other) const {
    return !(*this == other);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool contains_ci(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return true;
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

// Removes the last UTF-8 encoded character, continuation bytes included
void pop_utf8_char(std::string& s) {
    if (s.empty()) return;
    size_t pos = s.size() - 1;
    while (pos > 0 && (static_cast<unsigned char>(s[pos]) & 0xC0) == 0x80) {
        pos--;
    }
    s.erase(pos);
}

static fs::path home_directory() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home);
    }
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return fs::path(pw->pw_dir);
    }
    return fs::temp_directory_path();
}

fs::path config_directory() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg && fs::path(xdg).is_absolute()) {
        return fs::path(xdg) / APP_NAME;
    }
    return home_directory() / ".config" / APP_NAME;
}

fs::path default_store_path() {
    return config_directory() / STORE_FILE_NAME;
}

fs::path resolve_store_path(const Config& config) {
    if (!config.store_path.empty()) {
        return config.store_path;
    }
    return default_store_path();
}

bool colors_enabled(const Config& config) {
    if (config.no_colors) return false;
    const char* no_color = std::getenv("NO_COLOR");
    return !(no_color && *no_color);
}

void setup_logging(const Config& config) {
    std::shared_ptr<spdlog::logger> logger;
    fs::path log_path = resolve_store_path(config).parent_path() / LOG_FILE_NAME;

    try {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string(), false);
        logger = std::make_shared<spdlog::logger>(APP_NAME, file_sink);
    } catch (const spdlog::spdlog_ex&) {
        // Unwritable config directory: keep running without a log
        logger = std::make_shared<spdlog::logger>(APP_NAME, std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S][%l] %v");
    spdlog::set_level(config.debug ? spdlog::level::debug : spdlog::level::warn);
    spdlog::flush_on(spdlog::level::warn);
}
