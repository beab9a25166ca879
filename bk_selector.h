// bk_selector.h - Keystroke-driven bookmark selector state machine
#ifndef BK_SELECTOR_H
#define BK_SELECTOR_H

#include "bk_core.h"
#include "bk_store.h"

// Terminal-independent key events
enum class KeyType {
    Character,
    Up,
    Down,
    Enter,
    Escape,
    Backspace,
    Interrupt,
    Other
};

struct KeyEvent {
    KeyType type = KeyType::Other;
    char ch = 0;

    static KeyEvent character(char c);
    static KeyEvent of(KeyType t);
};

// Session state for one interactive run
struct SelectorState {
    std::vector<Bookmark> bookmarks;
    std::vector<size_t> filtered;       // indices into bookmarks
    size_t cursor = 0;                  // index into filtered
    std::string filter;
    bool editing = false;
    std::string edit_buffer;            // only meaningful while editing
    std::optional<std::string> result;  // path to report on exit
    std::string status;                 // last persistence error, if any
};

// What the caller must do after a key has been applied
struct StepResult {
    bool running = true;
    bool persist = false;
};

// Stable sort, highest usage count first
void sort_by_usage(std::vector<Bookmark>& bookmarks);

// Indices of bookmarks whose name or path contains filter, case-insensitively
std::vector<size_t> filter_bookmarks(const std::vector<Bookmark>& bookmarks, const std::string& filter);

// Sorted, unfiltered session over the given bookmarks
SelectorState make_session(std::vector<Bookmark> bookmarks);

// Applies one key to the state. No I/O: persistence is requested through the result.
StepResult step(SelectorState& state, const KeyEvent& key);

// Rendered view
enum class ViewStyle {
    Normal,
    Dim,
    Selected,
    FilterLabel,
    Error
};

struct ViewSpan {
    std::string text;
    ViewStyle style = ViewStyle::Normal;
};

struct ViewLine {
    std::vector<ViewSpan> spans;
    bool is_cursor = false;

    std::string text() const;
};

std::vector<ViewLine> render_view(const SelectorState& state);

// Binds a session to its store: applies keys and saves when a key mutated the list
class Selector {
private:
    SelectorState state;
    const BookmarkStore& store;
    std::string last_error;

public:
    explicit Selector(const BookmarkStore& bookmark_store);
    Selector(const BookmarkStore& bookmark_store, std::vector<Bookmark> bookmarks);

    // Returns false once the session has terminated
    bool dispatch(const KeyEvent& key);

    const SelectorState& session() const;
    const std::optional<std::string>& result() const;

    // Message of the failed save if the latest save failed, else empty
    const std::string& save_error() const;
};

#endif // BK_SELECTOR_H
