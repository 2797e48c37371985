#pragma once
/*
 * UndoManager
 *
 * Purpose: grouped undo/redo of text replacements.
 * Groups nest: only the outermost commit produces an undo entry, so a macro
 * run or a counted command undoes as one step. cancel_group rolls back the
 * ops pushed since the matching begin_group.
 */
#include <cstddef>
#include <string>
#include <vector>
#include "types.hpp"
#include "text_buffer.hpp"

struct Operation {
  Cursor at;
  std::string removed;
  std::string inserted;
};

struct UndoEntry {
  std::vector<Operation> ops;
  Cursor pre;
  Cursor post;
  std::string name;
};

class UndoManager {
public:
  void begin_group(const Cursor& pre, const std::string& name = {});
  void push_op(const Operation& op);
  void commit_group(const Cursor& post);
  void cancel_group(TextBuffer& buf, Cursor& cur);
  bool in_group() const { return depth_ > 0; }
  int depth() const { return depth_; }
  bool can_undo() const;
  bool can_redo() const;
  size_t undo_size() const { return undo_entries_.size(); }
  const UndoEntry* last_entry() const { return undo_entries_.empty() ? nullptr : &undo_entries_.back(); }
  bool undo(TextBuffer& buf, Cursor& cur);
  bool redo(TextBuffer& buf, Cursor& cur);

private:
  void close_level(const Cursor& post);

  std::vector<UndoEntry> undo_entries_;
  std::vector<UndoEntry> redo_entries_;
  std::vector<size_t> marks_;
  int depth_ = 0;
  UndoEntry current_;
};
