// bk_ui.cpp - ncurses front end for the bookmark selector
#include <cerrno>
#include <stdexcept>
#include <spdlog/spdlog.h>
// curses macros (move, clear, ...) must come after every other header
#include "bk_ui.h"

static constexpr int ESCAPE_DELAY_MS = 25;

KeyEvent translate_key(int ch) {
    switch (ch) {
        case KEY_UP:
            return KeyEvent::of(KeyType::Up);
        case KEY_DOWN:
            return KeyEvent::of(KeyType::Down);
        case KEY_ENTER:
        case '\n':
        case '\r':
            return KeyEvent::of(KeyType::Enter);
        case 27:  // ESC
            return KeyEvent::of(KeyType::Escape);
        case KEY_BACKSPACE:
        case 127:
        case '\b':
            return KeyEvent::of(KeyType::Backspace);
        case 3:   // Ctrl+C, delivered as a key in raw mode
            return KeyEvent::of(KeyType::Interrupt);
        default:
            break;
    }

    // Printable ASCII plus the raw bytes of multi-byte UTF-8 characters
    if (ch >= 32 && ch <= 255) {
        return KeyEvent::character(static_cast<char>(ch));
    }
    return KeyEvent::of(KeyType::Other);
}

// Longest prefix of s that fits in max_cols terminal columns
static std::string utf8_prefix(const std::string& s, int max_cols) {
    int cols = 0;
    size_t i = 0;
    while (i < s.size()) {
        size_t len = 1;
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c >= 0xF0) len = 4;
        else if (c >= 0xE0) len = 3;
        else if (c >= 0xC0) len = 2;
        if (cols + 1 > max_cols) break;
        cols++;
        i += len;
    }
    return s.substr(0, std::min(i, s.size()));
}

InteractiveUI::InteractiveUI(Selector& sel, Config& cfg)
    : selector(sel), config(cfg) {}

InteractiveUI::~InteractiveUI() {
    close_terminal();
}

void InteractiveUI::open_terminal() {
    tty = std::fopen("/dev/tty", "r+");
    if (!tty) {
        throw std::runtime_error(std::string("/dev/tty: ") + std::strerror(errno));
    }

    screen = newterm(nullptr, tty, tty);
    if (!screen) {
        std::fclose(tty);
        tty = nullptr;
        throw std::runtime_error("cannot initialize terminal");
    }
    set_term(screen);

    raw();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);
    set_escdelay(ESCAPE_DELAY_MS);

    use_colors = colors_enabled(config) && has_colors();
    if (use_colors) {
        start_color();
        use_default_colors();
        short dim = COLORS >= 256 ? 245 : (COLORS >= 16 ? 8 : COLOR_WHITE);
        init_pair(PAIR_FILTER, COLORS >= 256 ? 214 : COLOR_YELLOW, -1);
        init_pair(PAIR_DIM, dim, -1);
        init_pair(PAIR_ERROR, COLOR_RED, -1);
    }

    spdlog::debug("ui: terminal opened ({}x{})", COLS, LINES);
}

void InteractiveUI::close_terminal() {
    if (main_win) {
        delwin(main_win);
        main_win = nullptr;
    }
    if (screen) {
        endwin();
        delscreen(screen);
        screen = nullptr;
    }
    if (tty) {
        std::fclose(tty);
        tty = nullptr;
    }
}

void InteractiveUI::update_window_layout() {
    if (main_win) {
        delwin(main_win);
        main_win = nullptr;
    }

    clear();
    refresh();

    main_win = newwin(LINES, COLS, 0, 0);
    keypad(main_win, TRUE);
}

void InteractiveUI::handle_resize() {
    endwin();
    refresh();
    update_window_layout();
}

void InteractiveUI::run() {
    open_terminal();
    update_window_layout();

    bool running = true;
    while (running) {
        draw();

        int ch = wgetch(main_win);
        if (ch == ERR) {
            spdlog::warn("ui: lost terminal input");
            break;
        }
        if (ch == KEY_RESIZE) {
            handle_resize();
            continue;
        }

        running = selector.dispatch(translate_key(ch));
    }

    close_terminal();
}

int InteractiveUI::attributes_for(ViewStyle style) const {
    switch (style) {
        case ViewStyle::Selected:
            return A_REVERSE;
        case ViewStyle::Dim:
            return use_colors ? COLOR_PAIR(PAIR_DIM) : A_DIM;
        case ViewStyle::FilterLabel:
            return A_BOLD | (use_colors ? COLOR_PAIR(PAIR_FILTER) : 0);
        case ViewStyle::Error:
            return A_BOLD | (use_colors ? COLOR_PAIR(PAIR_ERROR) : 0);
        default:
            return A_NORMAL;
    }
}

// Keeps the cursor row on screen when the list is taller than the window
void InteractiveUI::adjust_view_offset(const std::vector<ViewLine>& lines, int height) {
    size_t visible = static_cast<size_t>(std::max(height, 1));
    if (lines.size() <= visible) {
        view_offset = 0;
        return;
    }

    auto it = std::find_if(lines.begin(), lines.end(),
                           [](const ViewLine& l) { return l.is_cursor; });
    if (it != lines.end()) {
        size_t cursor_row = static_cast<size_t>(it - lines.begin());
        if (cursor_row < view_offset) {
            view_offset = cursor_row;
        } else if (cursor_row >= view_offset + visible) {
            view_offset = cursor_row - visible + 1;
        }
    }

    view_offset = std::min(view_offset, lines.size() - visible);
}

void InteractiveUI::draw_line(const ViewLine& line, int y, int width) {
    wmove(main_win, y, 0);
    wclrtoeol(main_win);

    int col = 0;
    for (const auto& span : line.spans) {
        if (col >= width) break;
        std::string text = utf8_prefix(span.text, width - col);
        int attrs = attributes_for(span.style);
        wattron(main_win, attrs);
        mvwaddstr(main_win, y, col, text.c_str());
        wattroff(main_win, attrs);
        col = getcurx(main_win);
        if (col == 0 && !text.empty()) break;  // wrapped past the last column
    }
}

void InteractiveUI::draw() {
    int height = getmaxy(main_win);
    int width = getmaxx(main_win);

    werase(main_win);

    auto lines = render_view(selector.session());
    adjust_view_offset(lines, height);

    int y = 0;
    for (size_t i = view_offset; i < lines.size() && y < height; i++) {
        draw_line(lines[i], y, width);
        y++;
    }

    wrefresh(main_win);
}
