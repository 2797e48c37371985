#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal on top of ncurses. Owns the tty session: the constructor
 *          enters raw/noecho/keypad mode, the destructor calls endwin().
 * Note: raw mode so Ctrl-A/Ctrl-R/Ctrl-N reach the key codec as TypeChar;
 *       one instance per process.
 */
#include "iterminal.hpp"

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  ~NcursesTerminal() override;
  NcursesTerminal(const NcursesTerminal&) = delete;
  NcursesTerminal& operator=(const NcursesTerminal&) = delete;

  TermSize get_size() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_reverse(int row, int col, const std::string& text) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;
private:
  bool colors_ = false;
};
