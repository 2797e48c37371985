#pragma once
/*
 * Renderer
 *
 * Purpose: render text/status/command line and manage viewport scrolling.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives a snapshot from Editor to render.
 */
#include <filesystem>
#include <optional>
#include <string>
#include "iterminal.hpp"
#include "text_buffer.hpp"
#include "types.hpp"

struct RenderState {
  const TextBuffer* buf = nullptr;
  Cursor cur{};
  Mode mode = Mode::Normal;
  std::optional<std::filesystem::path> file_path;
  bool modified = false;
  std::optional<char> recording;
  std::string message;
  std::string cmdline;
  bool show_line_numbers = false;
  int tab_width = VL_DEFAULT_TAB_WIDTH;
};

class Renderer {
public:
  void render(ITerminal& term, const RenderState& st, Viewport& vp);
  static std::string expand_tabs(const std::string& s, int tab_width);
  static int display_col(const std::string& s, int col, int tab_width);
};
