// bk_selector.cpp - Selector state machine implementation
#include "bk_selector.h"
#include <climits>
#include <spdlog/spdlog.h>

static const char* HELP_LINE = "  ↑/↓ navigate • enter select • e rename • d delete • esc clear • q quit";
static const char* EMPTY_MESSAGE = "  No bookmarks yet. Use 'bk add' to add the current directory.";

KeyEvent KeyEvent::character(char c) {
    KeyEvent key;
    key.type = KeyType::Character;
    key.ch = c;
    return key;
}

KeyEvent KeyEvent::of(KeyType t) {
    KeyEvent key;
    key.type = t;
    return key;
}

void sort_by_usage(std::vector<Bookmark>& bookmarks) {
    std::stable_sort(bookmarks.begin(), bookmarks.end(),
        [](const Bookmark& a, const Bookmark& b) {
            return a.count > b.count;
        });
}

std::vector<size_t> filter_bookmarks(const std::vector<Bookmark>& bookmarks, const std::string& filter) {
    std::vector<size_t> indices;
    indices.reserve(bookmarks.size());
    for (size_t i = 0; i < bookmarks.size(); i++) {
        if (filter.empty() || contains_ci(bookmarks[i].name, filter) ||
            contains_ci(bookmarks[i].path, filter)) {
            indices.push_back(i);
        }
    }
    return indices;
}

SelectorState make_session(std::vector<Bookmark> bookmarks) {
    SelectorState state;
    state.bookmarks = std::move(bookmarks);
    sort_by_usage(state.bookmarks);
    state.filtered = filter_bookmarks(state.bookmarks, state.filter);
    return state;
}

// Always rebuilt from scratch: deletions shift every later index
static void refilter(SelectorState& state) {
    state.filtered = filter_bookmarks(state.bookmarks, state.filter);
}

static void move_up(SelectorState& state) {
    if (state.cursor > 0) {
        state.cursor--;
    }
}

static void move_down(SelectorState& state) {
    if (state.cursor + 1 < state.filtered.size()) {
        state.cursor++;
    }
}

static void end_edit(SelectorState& state) {
    state.editing = false;
    state.edit_buffer.clear();
}

static StepResult step_editing(SelectorState& state, const KeyEvent& key) {
    StepResult result;

    switch (key.type) {
        case KeyType::Enter:
            if (!state.filtered.empty()) {
                state.bookmarks[state.filtered[state.cursor]].name = state.edit_buffer;
                result.persist = true;
            }
            end_edit(state);
            break;

        case KeyType::Escape:
        case KeyType::Interrupt:
            end_edit(state);
            break;

        case KeyType::Backspace:
            pop_utf8_char(state.edit_buffer);
            break;

        case KeyType::Character:
            state.edit_buffer += key.ch;
            break;

        default:
            break;
    }

    return result;
}

static void delete_selected(SelectorState& state, StepResult& result) {
    size_t idx = state.filtered[state.cursor];
    state.bookmarks.erase(state.bookmarks.begin() + static_cast<std::ptrdiff_t>(idx));
    result.persist = true;

    refilter(state);
    if (state.cursor >= state.filtered.size() && state.cursor > 0) {
        state.cursor--;
    }
}

// Single-key commands, only active while the filter is empty.
// Returns true if the key was consumed.
static bool handle_command_key(SelectorState& state, char ch, StepResult& result) {
    switch (ch) {
        case 'q':
            result.running = false;
            return true;

        case 'e':
            if (!state.filtered.empty()) {
                state.editing = true;
                state.edit_buffer = state.bookmarks[state.filtered[state.cursor]].name;
            }
            return true;

        case 'd':
            if (!state.filtered.empty()) {
                delete_selected(state, result);
            }
            return true;

        case 'j':
            move_down(state);
            return true;

        case 'k':
            move_up(state);
            return true;

        default:
            return false;
    }
}

StepResult step(SelectorState& state, const KeyEvent& key) {
    if (state.editing) {
        return step_editing(state, key);
    }

    StepResult result;

    switch (key.type) {
        case KeyType::Interrupt:
            result.running = false;
            break;

        case KeyType::Escape:
            if (!state.filter.empty()) {
                state.filter.clear();
                refilter(state);
                state.cursor = 0;
            } else {
                result.running = false;
            }
            break;

        case KeyType::Up:
            move_up(state);
            break;

        case KeyType::Down:
            move_down(state);
            break;

        case KeyType::Enter:
            if (!state.filtered.empty()) {
                Bookmark& selected = state.bookmarks[state.filtered[state.cursor]];
                if (selected.count < INT_MAX) {
                    selected.count++;
                }
                state.result = selected.path;
                result.persist = true;
                result.running = false;
            }
            break;

        case KeyType::Backspace:
            if (!state.filter.empty()) {
                pop_utf8_char(state.filter);
                refilter(state);
                state.cursor = 0;
            }
            break;

        case KeyType::Character:
            if (key.ch == ' ') {
                break;
            }
            if (state.filter.empty() && handle_command_key(state, key.ch, result)) {
                break;
            }
            state.filter += key.ch;
            refilter(state);
            state.cursor = 0;
            break;

        default:
            break;
    }

    return result;
}

std::string ViewLine::text() const {
    std::string s;
    for (const auto& span : spans) {
        s += span.text;
    }
    return s;
}

static ViewLine plain_line(const std::string& text, ViewStyle style = ViewStyle::Normal) {
    ViewLine line;
    if (!text.empty()) {
        line.spans.push_back({text, style});
    }
    return line;
}

std::vector<ViewLine> render_view(const SelectorState& state) {
    std::vector<ViewLine> lines;

    if (state.bookmarks.empty()) {
        lines.push_back(plain_line(""));
        lines.push_back(plain_line(EMPTY_MESSAGE));
        lines.push_back(plain_line(""));
        lines.push_back(plain_line("  Press q to quit."));
        return lines;
    }

    lines.push_back(plain_line(""));

    if (!state.filter.empty()) {
        ViewLine filter_line;
        filter_line.spans.push_back({"  ", ViewStyle::Normal});
        filter_line.spans.push_back({"filter:", ViewStyle::FilterLabel});
        filter_line.spans.push_back({" " + state.filter, ViewStyle::Normal});
        lines.push_back(filter_line);
        lines.push_back(plain_line(""));
    }

    if (state.editing) {
        lines.push_back(plain_line("  Rename bookmark: " + state.edit_buffer));
        lines.push_back(plain_line("  (Enter to save, Esc to cancel)"));
        lines.push_back(plain_line(""));
    }

    if (state.filtered.empty()) {
        lines.push_back(plain_line("  No matches", ViewStyle::Dim));
    } else {
        for (size_t i = 0; i < state.filtered.size(); i++) {
            const Bookmark& b = state.bookmarks[state.filtered[i]];
            ViewLine line;
            line.is_cursor = (i == state.cursor);
            if (line.is_cursor) {
                line.spans.push_back({"  > ", ViewStyle::Normal});
                line.spans.push_back({b.display_name(), ViewStyle::Selected});
            } else {
                line.spans.push_back({"    " + b.display_name(), ViewStyle::Normal});
            }
            if (!b.name.empty()) {
                line.spans.push_back({" " + b.path, ViewStyle::Dim});
            }
            lines.push_back(line);
        }
    }

    lines.push_back(plain_line(""));
    lines.push_back(plain_line(HELP_LINE));

    if (!state.status.empty()) {
        lines.push_back(plain_line("  " + state.status, ViewStyle::Error));
    }

    return lines;
}

Selector::Selector(const BookmarkStore& bookmark_store)
    : state(make_session(bookmark_store.load())), store(bookmark_store) {}

Selector::Selector(const BookmarkStore& bookmark_store, std::vector<Bookmark> bookmarks)
    : state(make_session(std::move(bookmarks))), store(bookmark_store) {}

bool Selector::dispatch(const KeyEvent& key) {
    state.status.clear();
    StepResult r = step(state, key);

    if (r.persist) {
        std::string error;
        if (store.save(state.bookmarks, error)) {
            last_error.clear();
            spdlog::info("selector: saved {} bookmarks", state.bookmarks.size());
        } else {
            last_error = error;
            state.status = "Failed to save bookmarks: " + error;
            spdlog::error("selector: failed to save bookmarks: {}", error);
        }
    }

    if (!r.running && state.result) {
        spdlog::info("selector: selected {}", *state.result);
    }

    return r.running;
}

const SelectorState& Selector::session() const {
    return state;
}

const std::optional<std::string>& Selector::result() const {
    return state.result;
}

const std::string& Selector::save_error() const {
    return last_error;
}
