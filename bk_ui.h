// bk_ui.h - Terminal front end for the bookmark selector
#ifndef BK_UI_H
#define BK_UI_H

#include "bk_core.h"
#include "bk_selector.h"
#include <cstdio>
#include <ncurses.h>

// Color pairs
enum ColorPair {
    PAIR_FILTER = 1,
    PAIR_DIM = 2,
    PAIR_ERROR = 3
};

// Translates a curses key code into a selector key event
KeyEvent translate_key(int ch);

// Interactive UI class. Draws on the controlling terminal rather than on
// stdout, so the chosen path can still be captured by a wrapping shell.
class InteractiveUI {
private:
    Selector& selector;
    Config& config;

    FILE* tty = nullptr;
    SCREEN* screen = nullptr;
    WINDOW* main_win = nullptr;
    size_t view_offset = 0;
    bool use_colors = false;

    // Terminal management
    void open_terminal();
    void close_terminal();
    void update_window_layout();
    void handle_resize();

    // Drawing
    void draw();
    void draw_line(const ViewLine& line, int y, int width);
    void adjust_view_offset(const std::vector<ViewLine>& lines, int height);
    int attributes_for(ViewStyle style) const;

public:
    InteractiveUI(Selector& sel, Config& cfg);
    ~InteractiveUI();

    InteractiveUI(const InteractiveUI&) = delete;
    InteractiveUI& operator=(const InteractiveUI&) = delete;

    // Runs until the selector terminates. Throws std::runtime_error if the
    // terminal cannot be acquired.
    void run();
};

#endif // BK_UI_H
