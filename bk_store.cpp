// bk_store.cpp - Bookmark document load/save
#include "bk_store.h"
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

using json = nlohmann::ordered_json;

void to_json(json& j, const Bookmark& b) {
    j = json::object();
    j["path"] = b.path;
    if (!b.name.empty()) {
        j["name"] = b.name;
    }
    j["count"] = b.count;
}

void from_json(const json& j, Bookmark& b) {
    j.at("path").get_to(b.path);
    b.name.clear();
    if (j.contains("name") && !j.at("name").is_null()) {
        j.at("name").get_to(b.name);
    }
    b.count = 0;
    if (j.contains("count") && !j.at("count").is_null()) {
        const json& count = j.at("count");
        if (!count.is_number_integer()) {
            throw std::domain_error("count must be an integer");
        }
        // Clamped into [0, INT_MAX]
        if (count.is_number_unsigned()) {
            auto value = count.get<std::uint64_t>();
            b.count = value > static_cast<std::uint64_t>(INT_MAX) ? INT_MAX : static_cast<int>(value);
        } else {
            auto value = count.get<std::int64_t>();
            b.count = static_cast<int>(std::max<std::int64_t>(0, std::min<std::int64_t>(value, INT_MAX)));
        }
    }
}

BookmarkStore::BookmarkStore(fs::path path) : store_path(std::move(path)) {}

const fs::path& BookmarkStore::path() const {
    return store_path;
}

std::vector<Bookmark> BookmarkStore::load() const {
    std::error_code ec;
    if (!fs::exists(store_path, ec)) {
        spdlog::debug("store: no document at {}", store_path.string());
        return {};
    }

    std::ifstream file(store_path);
    if (!file) {
        spdlog::warn("store: cannot open {}", store_path.string());
        return {};
    }

    try {
        json j = json::parse(file);
        if (!j.is_object() || !j.contains("bookmarks") || j["bookmarks"].is_null()) {
            spdlog::debug("store: {} holds no bookmark list", store_path.string());
            return {};
        }
        auto bookmarks = j["bookmarks"].get<std::vector<Bookmark>>();
        spdlog::debug("store: loaded {} bookmarks from {}", bookmarks.size(), store_path.string());
        return bookmarks;
    } catch (const std::exception& e) {
        spdlog::warn("store: discarding malformed document {}: {}", store_path.string(), e.what());
        return {};
    }
}

// Follows symlinks so dotfile-managed documents are updated in place
static fs::path resolve_link_target(const fs::path& path) {
    constexpr int MAX_LINK_DEPTH = 40;
    fs::path target = path;
    std::error_code ec;
    for (int depth = 0; depth < MAX_LINK_DEPTH && fs::is_symlink(target, ec); depth++) {
        fs::path link = fs::read_symlink(target, ec);
        if (ec) break;
        target = link.is_absolute() ? link : target.parent_path() / link;
    }
    return target;
}

bool BookmarkStore::save(const std::vector<Bookmark>& bookmarks, std::string& error_message) const {
    std::error_code ec;
    fs::path target = resolve_link_target(store_path);
    fs::path dir = target.parent_path();
    if (!dir.empty()) {
        fs::create_directories(dir, ec);
        if (ec) {
            error_message = "cannot create " + dir.string() + ": " + ec.message();
            spdlog::error("store: {}", error_message);
            return false;
        }
    }

    // Paths are arbitrary bytes; invalid UTF-8 is written as U+FFFD
    std::string document;
    try {
        json j;
        j["bookmarks"] = bookmarks;
        document = j.dump(2, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        error_message = std::string("cannot serialize bookmarks: ") + e.what();
        spdlog::error("store: {}", error_message);
        return false;
    }

    std::string tmp = target.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            error_message = "cannot open " + tmp + ": " + std::strerror(errno);
            spdlog::error("store: {}", error_message);
            return false;
        }
        out << document << "\n";
        out.flush();
        if (!out.good()) {
            error_message = "write error on " + tmp;
            spdlog::error("store: {}", error_message);
            out.close();
            std::remove(tmp.c_str());
            return false;
        }
    }

    if (std::rename(tmp.c_str(), target.c_str()) != 0) {
        error_message = "cannot replace " + target.string() + ": " + std::strerror(errno);
        std::remove(tmp.c_str());
        spdlog::error("store: {}", error_message);
        return false;
    }

    spdlog::debug("store: saved {} bookmarks to {}", bookmarks.size(), target.string());
    return true;
}
