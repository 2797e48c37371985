#include "renderer.hpp"
#include <algorithm>
#include <sstream>

std::string Renderer::expand_tabs(const std::string& s, int tab_width) {
  std::string out;
  for (char c : s) {
    if (c == '\t') out.append(static_cast<size_t>(tab_width - (int)out.size() % tab_width), ' ');
    else out.push_back(c);
  }
  return out;
}

int Renderer::display_col(const std::string& s, int col, int tab_width) {
  int w = 0;
  for (int i = 0; i < col && i < (int)s.size(); ++i) {
    w += s[i] == '\t' ? tab_width - (w % tab_width) : 1;
  }
  return w;
}

void Renderer::render(ITerminal& term, const RenderState& st, Viewport& vp) {
  const TextBuffer& buf = *st.buf;
  TermSize sz = term.get_size();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  int max_text_rows = rows - 1;
  if (st.cur.row < vp.top_line) vp.top_line = st.cur.row;
  if (st.cur.row >= vp.top_line + max_text_rows) vp.top_line = st.cur.row - max_text_rows + 1;
  int ln_width = 0;
  int indent = 0;
  if (st.show_line_numbers) {
    int digits = 1;
    int total = std::max(1, buf.line_count());
    while (total >= 10) { total /= 10; digits++; }
    ln_width = digits;
    indent = ln_width + 1; // one space after numbers
  }
  int text_cols = std::max(0, cols - indent);
  int cur_dcol = display_col(buf.line(st.cur.row), st.cur.col, st.tab_width);
  if (text_cols <= 0) vp.left_col = 0;
  if (text_cols > 0) {
    if (cur_dcol < vp.left_col) vp.left_col = cur_dcol;
    else if (cur_dcol >= vp.left_col + text_cols) vp.left_col = cur_dcol - text_cols + 1;
    if (vp.left_col < 0) vp.left_col = 0;
  }
  for (int i = 0; i < max_text_rows; ++i) {
    int line_idx = vp.top_line + i;
    if (line_idx >= buf.line_count()) {
      term.draw_text(i, 0, "~");
      continue;
    }
    std::string s = expand_tabs(buf.line(line_idx), st.tab_width);
    int s_len = static_cast<int>(s.size());
    int start_col = std::min(vp.left_col, s_len);
    int end_col = std::min(s_len, start_col + text_cols);
    if (st.show_line_numbers) {
      std::string num = std::to_string(line_idx + 1);
      std::string pad(std::max(0, ln_width - static_cast<int>(num.size())), ' ');
      term.draw_text(i, 0, pad + num + " ");
    }
    std::string vis = s.substr(start_col, end_col - start_col);
    term.draw_text(i, indent, vis);
    term.clear_to_eol(i, indent + static_cast<int>(vis.size()));
  }
  if (st.mode == Mode::Command) {
    term.draw_text(rows - 1, 0, ":" + st.cmdline);
    term.clear_to_eol(rows - 1, 1 + static_cast<int>(st.cmdline.size()));
    term.move_cursor(rows - 1, std::min(cols - 1, 1 + static_cast<int>(st.cmdline.size())));
    term.refresh();
    return;
  }
  std::string mode_str = st.mode == Mode::Insert ? "INSERT" : "NORMAL";
  std::ostringstream oss;
  oss << mode_str << "  "
      << (st.file_path ? st.file_path->string() : "[no file]")
      << (st.modified ? " [+]" : "")
      << "  row:" << (st.cur.row + 1) << " col:" << (st.cur.col + 1);
  if (st.recording) oss << "  recording @" << *st.recording;
  if (!st.message.empty()) oss << "  | " << st.message;
  std::string status = oss.str();
  if ((int)status.size() > cols) status.resize(static_cast<size_t>(std::max(0, cols)));
  term.draw_reverse(rows - 1, 0, status);
  int screen_row = st.cur.row - vp.top_line;
  if (screen_row >= 0 && screen_row < max_text_rows) {
    int screen_col = indent + std::max(0, cur_dcol - vp.left_col);
    screen_col = std::min(screen_col, cols - 1);
    term.move_cursor(screen_row, screen_col);
  } else {
    term.move_cursor(rows - 1, 0);
  }
  term.refresh();
}
