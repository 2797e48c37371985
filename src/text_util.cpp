#include "text_util.hpp"
#include <algorithm>
#include <cctype>

static inline bool is_space(unsigned char c) {
  return std::isspace(c) != 0;
}
static inline bool is_symbol(unsigned char c) {
  return !is_space(c) && !is_word_char(c);
}

bool is_word_char(unsigned char c) {
  return std::isalnum(c) != 0 || c == '_';
}

bool is_blank_text(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](char c){ return c == ' ' || c == '\t'; });
}

int next_word_start_same_line(const std::string& line, int col) {
  int len = static_cast<int>(line.size());
  col = std::clamp(col, 0, len);
  if (col >= len) return len;
  unsigned char c = static_cast<unsigned char>(line[col]);
  if (is_word_char(c)) {
    while (col < len && is_word_char(static_cast<unsigned char>(line[col]))) col++;
  } else if (is_symbol(c)) {
    while (col < len && is_symbol(static_cast<unsigned char>(line[col]))) col++;
  }
  while (col < len && is_space(static_cast<unsigned char>(line[col]))) col++;
  return col;
}

int first_non_blank(const std::string& line) {
  int i = 0;
  while (i < (int)line.size() && (line[i] == ' ' || line[i] == '\t')) i++;
  return i;
}

std::string normalize_blanks(const std::string& s, int tab_width) {
  if (tab_width < 1) return s;
  std::string out;
  int width = 0;
  auto flush = [&](){
    out.append(static_cast<size_t>(width / tab_width), '\t');
    out.append(static_cast<size_t>(width % tab_width), ' ');
    width = 0;
  };
  for (char c : s) {
    if (c == ' ') { width++; continue; }
    if (c == '\t') { width += tab_width - (width % tab_width); continue; }
    flush();
    out.push_back(c);
  }
  flush();
  return out;
}
