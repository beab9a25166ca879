// bk_store.h - Persistent bookmark list
#ifndef BK_STORE_H
#define BK_STORE_H

#include "bk_core.h"
#include <nlohmann/json.hpp>

// JSON serialization for Bookmark. Ordered so records keep path, name, count.
void to_json(nlohmann::ordered_json& j, const Bookmark& b);
void from_json(const nlohmann::ordered_json& j, Bookmark& b);

// The whole bookmark list as one JSON document. Every save rewrites the
// document; there are no partial updates.
class BookmarkStore {
private:
    fs::path store_path;

public:
    explicit BookmarkStore(fs::path path);

    const fs::path& path() const;

    // Missing or malformed documents load as an empty list
    std::vector<Bookmark> load() const;

    // Creates parent directories, writes a temporary sibling and renames it
    // over the document. On failure returns false and fills error_message.
    bool save(const std::vector<Bookmark>& bookmarks, std::string& error_message) const;
};

#endif // BK_STORE_H
