#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Mode/Cursor/Viewport/Settings).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include "config.hpp"

enum class Mode { Normal, Insert, Command };

struct Cursor {
  int row = 0;
  int col = 0;
  bool operator==(const Cursor&) const = default;
};

struct Viewport { int top_line = 0; int left_col = 0; };

struct Settings {
  int tab_width = VL_DEFAULT_TAB_WIDTH;
  bool expand_tab = false;
  bool virtual_edit_onemore = false;
};
