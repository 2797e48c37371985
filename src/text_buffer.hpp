#pragma once
/*
 * TextBuffer
 *
 * Purpose: line-based text buffer with (row, col) <-> offset mapping and
 *          multi-line replace, plus file I/O.
 * Offsets: a line break counts as one character.
 * Files: read through mmap (CRLF folded to LF, no trailing empty line);
 *        safe writes (write .tmp -> fdatasync -> atomic rename).
 */
#include <filesystem>
#include <string>
#include <vector>
#include "types.hpp"

class TextBuffer {
public:
  TextBuffer();
  explicit TextBuffer(std::vector<std::string> lines);

  bool empty() const { return lines_.empty(); }
  int line_count() const { return static_cast<int>(lines_.size()); }
  const std::string& line(int r) const { return lines_[static_cast<size_t>(r)]; }
  const std::vector<std::string>& lines() const { return lines_; }
  void ensure_not_empty();
  void init_from_lines(std::vector<std::string> lines);

  void insert_line(int row, const std::string& s);
  void erase_line(int row);
  void erase_lines(int start_row, int end_row);
  void replace_line(int row, const std::string& s);

  int offset_of(Cursor c) const;
  Cursor cursor_at(int offset) const;
  int size() const;
  std::string text() const;
  std::string slice(Cursor at, int len) const;
  /*erase erase_len chars at `at`, insert text; returns the cursor after text*/
  Cursor replace_text(Cursor at, int erase_len, const std::string& text);

  static TextBuffer from_file(const std::filesystem::path& path, std::string& msg, bool& ok);
  bool write_file(const std::filesystem::path& path, std::string& msg) const;

private:
  std::vector<std::string> lines_;
};

std::vector<std::string> split_lines(const std::string& block);
