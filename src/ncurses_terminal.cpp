#include "ncurses_terminal.hpp"
#include <locale.h>
#include <ncurses.h>

NcursesTerminal::NcursesTerminal() {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  nonl();
  keypad(stdscr, TRUE);
  set_escdelay(25);
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) init_pair(1, -1, -1);
    else init_pair(1, COLOR_WHITE, COLOR_BLACK); // fallback
    colors_ = true;
  }
}

NcursesTerminal::~NcursesTerminal() { endwin(); }

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (colors_) attron(COLOR_PAIR(1));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (colors_) attroff(COLOR_PAIR(1));
}

void NcursesTerminal::draw_reverse(int row, int col, const std::string& text) {
  attron(A_REVERSE);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(A_REVERSE);
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}
