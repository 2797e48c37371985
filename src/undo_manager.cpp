#include "undo_manager.hpp"

void UndoManager::begin_group(const Cursor& pre, const std::string& name) {
  if (depth_ == 0) {
    current_.ops.clear();
    current_.pre = pre;
    current_.name = name;
  }
  marks_.push_back(current_.ops.size());
  depth_++;
}

void UndoManager::push_op(const Operation& op) {
  if (depth_ > 0) current_.ops.push_back(op);
}

void UndoManager::close_level(const Cursor& post) {
  depth_--;
  marks_.pop_back();
  if (depth_ > 0) return;
  current_.post = post;
  if (!current_.ops.empty()) {
    undo_entries_.push_back(current_);
    redo_entries_.clear();
  }
  current_.ops.clear();
}

void UndoManager::commit_group(const Cursor& post) {
  if (depth_ > 0) close_level(post);
}

void UndoManager::cancel_group(TextBuffer& buf, Cursor& cur) {
  if (depth_ == 0) return;
  size_t mark = marks_.back();
  for (size_t i = current_.ops.size(); i > mark; --i) {
    const Operation& op = current_.ops[i - 1];
    buf.replace_text(op.at, static_cast<int>(op.inserted.size()), op.removed);
  }
  current_.ops.resize(mark);
  if (depth_ == 1) cur = current_.pre;
  close_level(cur);
}

bool UndoManager::can_undo() const { return !undo_entries_.empty(); }
bool UndoManager::can_redo() const { return !redo_entries_.empty(); }

bool UndoManager::undo(TextBuffer& buf, Cursor& cur) {
  if (undo_entries_.empty()) return false;
  UndoEntry e = undo_entries_.back();
  undo_entries_.pop_back();
  for (int i = (int)e.ops.size() - 1; i >= 0; --i) {
    const Operation& op = e.ops[i];
    buf.replace_text(op.at, static_cast<int>(op.inserted.size()), op.removed);
  }
  cur = e.pre;
  redo_entries_.push_back(e);
  return true;
}

bool UndoManager::redo(TextBuffer& buf, Cursor& cur) {
  if (redo_entries_.empty()) return false;
  UndoEntry e = redo_entries_.back();
  redo_entries_.pop_back();
  for (const Operation& op : e.ops) {
    buf.replace_text(op.at, static_cast<int>(op.removed.size()), op.inserted);
  }
  cur = e.post;
  undo_entries_.push_back(e);
  return true;
}
