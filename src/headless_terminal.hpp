#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal; keeps a character grid and the cursor so
 *          rendering can be checked without a tty.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols) : rows_(rows), cols_(cols) { clear(); }
  TermSize get_size() const override { return {rows_, cols_}; }
  void clear() override { screen_.assign(static_cast<size_t>(rows_), std::string(static_cast<size_t>(cols_), ' ')); }
  void draw_text(int row, int col, const std::string& text) override { put(row, col, text); }
  void draw_reverse(int row, int col, const std::string& text) override { put(row, col, text); reverse_row_ = row; }
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void refresh() override { refreshes_++; }
  void clear_to_eol(int row, int col) override {
    if (row < 0 || row >= rows_) return;
    for (int c = col; c < cols_; ++c) screen_[row][c] = ' ';
  }

  std::string row_text(int row) const {
    std::string s = screen_[row];
    while (!s.empty() && s.back() == ' ') s.pop_back();
    return s;
  }
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  int reverse_row() const { return reverse_row_; }
  int refreshes() const { return refreshes_; }

private:
  void put(int row, int col, const std::string& text) {
    if (row < 0 || row >= rows_) return;
    for (size_t i = 0; i < text.size() && col + (int)i < cols_; ++i) {
      if (col + (int)i >= 0) screen_[row][col + i] = text[i];
    }
  }
  int rows_;
  int cols_;
  std::vector<std::string> screen_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  int reverse_row_ = -1;
  int refreshes_ = 0;
};
