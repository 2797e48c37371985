#include "vim_buffer.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <climits>
#include <glog/logging.h>
#include "key_notation.hpp"
#include "text_util.hpp"

VimBuffer::VimBuffer() : VimBuffer(std::vector<std::string>{""}) {}

VimBuffer::VimBuffer(std::vector<std::string> lines)
  : buf_(std::move(lines)),
    tracker_([this](const std::string& s){ return normalize_blanks(s, settings_.tab_width); }),
    macros_(*this, *this) {
  tracker_.on_change_completed([this](const TextChange& c){ session_change_ = c; });
  tracker_.on_changed([](const TextChange& c){ VLOG(3) << "change: " << c.to_string(); });
}

void VimBuffer::set_text(std::vector<std::string> lines) {
  buf_.init_from_lines(std::move(lines));
  um_ = UndoManager();
  cur_ = {0, 0};
  modified_ = false;
}

void VimBuffer::set_cursor(Cursor c) {
  cur_ = c;
  clamp_cursor();
}

int VimBuffer::max_col_for_row(int row) const {
  int len = static_cast<int>(buf_.line(row).size());
  if (mode_ == Mode::Insert || settings_.virtual_edit_onemore) return len;
  return len > 0 ? len - 1 : 0;
}

void VimBuffer::clamp_cursor() {
  cur_.row = std::clamp(cur_.row, 0, buf_.line_count() - 1);
  cur_.col = std::clamp(cur_.col, 0, max_col_for_row(cur_.row));
}

void VimBuffer::remember(std::vector<KeyEvent> keys, int count) {
  if (repeating_) return;
  last_command_ = RepeatableCommand{std::move(keys), count, std::nullopt};
}

bool VimBuffer::can_process(const KeyEvent& k) const {
  if (mode_ == Mode::Insert || input_.has_pending()) return true;
  return !k.is_char(':');
}

ProcessResult VimBuffer::process(const KeyEvent& k) {
  if (macros_.is_recording() && !macros_.is_replaying()) {
    if (mode_ == Mode::Normal && !input_.has_pending() && !input_.has_count() && k.is_char('q')) {
      macros_.stop_recording();
      message_.clear();
      return ProcessResult::handled();
    }
    macros_.record_key(k);
  }
  ProcessResult r = mode_ == Mode::Insert ? process_insert(k) : process_normal(k);
  if (r.is_error()) {
    VLOG(1) << "key " << to_notation(k) << " failed: " << r.reason;
    message_ = r.reason;
  }
  return r;
}

ProcessResult VimBuffer::process(std::string_view keys) {
  ProcessResult first = ProcessResult::handled();
  bool failed = false;
  for (const KeyEvent& k : parse_key_notation(keys)) {
    ProcessResult r = process(k);
    if (!failed && r.is_error()) { first = r; failed = true; }
    else if (!failed) first = r;
  }
  return first;
}

UndoTransactionHandle VimBuffer::open_transaction(const std::string& name) {
  um_.begin_group(cur_, name);
  int id = next_transaction_id_++;
  transactions_.push_back(id);
  VLOG(2) << "open undo transaction " << id << " (" << name << ")";
  return {id};
}

void VimBuffer::complete_transaction(UndoTransactionHandle h) {
  if (transactions_.empty() || transactions_.back() != h.id) {
    LOG(WARNING) << "undo transaction " << h.id << " completed out of order";
    return;
  }
  transactions_.pop_back();
  um_.commit_group(cur_);
}

void VimBuffer::cancel_transaction(UndoTransactionHandle h) {
  if (transactions_.empty() || transactions_.back() != h.id) {
    LOG(WARNING) << "undo transaction " << h.id << " cancelled out of order";
    return;
  }
  transactions_.pop_back();
  um_.cancel_group(buf_, cur_);
  clamp_cursor();
}

Cursor VimBuffer::edit(Cursor at, int erase_len, const std::string& text) {
  int pos = buf_.offset_of(at);
  Cursor from = buf_.cursor_at(pos);
  std::string removed = buf_.slice(from, erase_len);
  if (removed.empty() && text.empty()) return from;
  int caret_before = caret();
  Cursor end = buf_.replace_text(from, static_cast<int>(removed.size()), text);
  um_.push_op({from, removed, text});
  modified_ = true;
  if (tracker_.enabled()) tracker_.on_buffer_edit({pos, removed, text, caret_before});
  return end;
}

/* ---------- normal mode ---------- */

ProcessResult VimBuffer::process_normal(const KeyEvent& k) {
  bool outer = !um_.in_group();
  um_.begin_group(cur_);
  ProcessResult r = input_.has_pending() ? process_pending(k) : dispatch_normal(k);
  if (mode_ == Mode::Insert && outer) {
    insert_group_open_ = true;
    return r;
  }
  um_.commit_group(cur_);
  return r;
}

ProcessResult VimBuffer::dispatch_normal(const KeyEvent& k) {
  if (k.key == VimKey::Escape) { input_.reset(); return ProcessResult::handled(); }
  if (k.key == VimKey::RawCharacter && k.modifiers == KeyMod::None && k.ch && input_.consume_digit(*k.ch)) {
    return ProcessResult::handled();
  }
  int n = input_.take_count();
  int count = std::max(1, n);
  switch (k.key) {
    case VimKey::Left: return move_left(count);
    case VimKey::Right: return move_right(count);
    case VimKey::Up: return move_up(count);
    case VimKey::Down: return move_down(count);
    case VimKey::Home: cur_.col = 0; return ProcessResult::handled();
    case VimKey::End: cur_.col = max_col_for_row(cur_.row); return ProcessResult::handled();
    case VimKey::Delete: return delete_chars(k, count, n);
    case VimKey::RawCharacter: break;
    default: return ProcessResult::not_handled();
  }
  if (!k.ch) return ProcessResult::not_handled();
  if (k.modifiers == KeyMod::Control) {
    switch (*k.ch) {
      case 'r': return redo_steps(count);
      case 'a': return increment(count, n);
      case 'x': return increment(-count, n);
      default: return ProcessResult::not_handled();
    }
  }
  if (k.modifiers != KeyMod::None) return ProcessResult::not_handled();
  switch (*k.ch) {
    case 'h': return move_left(count);
    case 'l': return move_right(count);
    case 'k': return move_up(count);
    case 'j': return move_down(count);
    case 'w': return move_word_forward(count);
    case '0': cur_.col = 0; return ProcessResult::handled();
    case '^': cur_.col = std::min(first_non_blank(buf_.line(cur_.row)), max_col_for_row(cur_.row)); return ProcessResult::handled();
    case '$': cur_.col = max_col_for_row(cur_.row); return ProcessResult::handled();
    case 'x': return delete_chars(k, count, n);
    case '~': return toggle_case(count, n);
    case 'D': return delete_to_eol({k}, n);
    case 'Y': return yank_lines(count);
    case 'p': return put(true, count, n);
    case 'P': return put(false, count, n);
    case 'i': case 'a': case 'I': case 'A': case 'o': case 'O':
      return begin_insert(*k.ch, count);
    case 'u': return undo_steps(count);
    case '.': return repeat_last_change(n);
    case 'q':
      if (macros_.is_recording()) return ProcessResult::handled();
      input_.set_pending('q', n);
      return ProcessResult::handled();
    case 'd': case 'y': case 'r': case '@':
      input_.set_pending(*k.ch, n);
      return ProcessResult::handled();
    default: return ProcessResult::not_handled();
  }
}

ProcessResult VimBuffer::process_pending(const KeyEvent& k) {
  char op = input_.pending();
  int n = input_.pending_count();
  int count = std::max(1, n);
  input_.reset();
  if (k.key == VimKey::Escape) return ProcessResult::handled();
  if (k.key != VimKey::RawCharacter || k.modifiers != KeyMod::None || !k.ch) {
    return ProcessResult::error(std::string("invalid argument for ") + op);
  }
  char c = *k.ch;
  switch (op) {
    case 'd':
      if (c == 'd') return delete_lines(count, n);
      if (c == 'w') return delete_words(count, n);
      if (c == '$') return delete_to_eol({char_to_key_event('d'), k}, n);
      return ProcessResult::error(std::string("unknown motion: d") + c);
    case 'y':
      if (c == 'y') return yank_lines(count);
      return ProcessResult::error(std::string("unknown motion: y") + c);
    case 'r': return replace_chars(c, count, n);
    case 'q': return start_recording(c);
    case '@': return run_macro(c, count);
    default: break;
  }
  return ProcessResult::error("unknown pending operator");
}

ProcessResult VimBuffer::move_left(int count) {
  if (cur_.col == 0) return ProcessResult::error("cannot move left");
  cur_.col = std::max(0, cur_.col - count);
  return ProcessResult::handled();
}

ProcessResult VimBuffer::move_right(int count) {
  int maxc = max_col_for_row(cur_.row);
  if (cur_.col >= maxc) return ProcessResult::error("cannot move right");
  cur_.col = count >= maxc - cur_.col ? maxc : cur_.col + count;
  return ProcessResult::handled();
}

ProcessResult VimBuffer::move_up(int count) {
  if (cur_.row == 0) return ProcessResult::error("cannot move up");
  cur_.row = std::max(0, cur_.row - count);
  cur_.col = std::min(cur_.col, max_col_for_row(cur_.row));
  return ProcessResult::handled();
}

ProcessResult VimBuffer::move_down(int count) {
  int last = buf_.line_count() - 1;
  if (cur_.row >= last) return ProcessResult::error("cannot move down");
  cur_.row = count >= last - cur_.row ? last : cur_.row + count;
  cur_.col = std::min(cur_.col, max_col_for_row(cur_.row));
  return ProcessResult::handled();
}

ProcessResult VimBuffer::move_word_forward(int count) {
  for (int i = 0; i < count; ++i) {
    const std::string& s = buf_.line(cur_.row);
    int next = next_word_start_same_line(s, cur_.col);
    if (next < (int)s.size()) { cur_.col = next; continue; }
    if (cur_.row + 1 < buf_.line_count()) {
      cur_.row++;
      cur_.col = std::min(first_non_blank(buf_.line(cur_.row)), max_col_for_row(cur_.row));
      continue;
    }
    int maxc = max_col_for_row(cur_.row);
    if (cur_.col >= maxc) {
      if (i == 0) return ProcessResult::error("no next word");
      break;
    }
    cur_.col = maxc;
  }
  return ProcessResult::handled();
}

ProcessResult VimBuffer::delete_chars(const KeyEvent& k, int count, int n) {
  const std::string& s = buf_.line(cur_.row);
  int len = static_cast<int>(s.size());
  if (len == 0) return ProcessResult::handled();
  int take = std::min(count, len - cur_.col);
  yank_ = Yank{s.substr(cur_.col, take), false};
  edit(cur_, take, "");
  clamp_cursor();
  remember({k}, n);
  return ProcessResult::handled();
}

ProcessResult VimBuffer::toggle_case(int count, int n) {
  const std::string& s = buf_.line(cur_.row);
  int len = static_cast<int>(s.size());
  if (len == 0) return ProcessResult::handled();
  int take = std::min(count, len - cur_.col);
  std::string part = s.substr(cur_.col, take);
  for (char& c : part) {
    unsigned char u = static_cast<unsigned char>(c);
    if (std::islower(u)) c = static_cast<char>(std::toupper(u));
    else if (std::isupper(u)) c = static_cast<char>(std::tolower(u));
  }
  edit(cur_, take, part);
  cur_.col = std::min(cur_.col + take, max_col_for_row(cur_.row));
  remember({char_to_key_event('~')}, n);
  return ProcessResult::handled();
}

ProcessResult VimBuffer::replace_chars(char c, int count, int n) {
  int len = static_cast<int>(buf_.line(cur_.row).size());
  if (count > len - cur_.col) return ProcessResult::error("not enough characters to replace");
  edit(cur_, count, std::string(static_cast<size_t>(count), c));
  cur_.col += count - 1;
  remember({char_to_key_event('r'), char_to_key_event(c)}, n);
  return ProcessResult::handled();
}

ProcessResult VimBuffer::delete_lines(int count, int n) {
  int row = cur_.row;
  int last = count >= buf_.line_count() - row ? buf_.line_count() - 1 : row + count - 1;
  std::string block = buf_.line(row);
  for (int r = row + 1; r <= last; ++r) block += "\n" + buf_.line(r);
  yank_ = Yank{block, true};
  int len = static_cast<int>(block.size());
  if (last + 1 < buf_.line_count()) {
    edit({row, 0}, len + 1, "");
  } else if (row > 0) {
    edit({row - 1, static_cast<int>(buf_.line(row - 1).size())}, len + 1, "");
    row--;
  } else {
    edit({0, 0}, len, "");
  }
  cur_.row = std::min(row, buf_.line_count() - 1);
  cur_.col = first_non_blank(buf_.line(cur_.row));
  clamp_cursor();
  remember({char_to_key_event('d'), char_to_key_event('d')}, n);
  return ProcessResult::handled();
}

ProcessResult VimBuffer::delete_words(int count, int n) {
  const std::string& s = buf_.line(cur_.row);
  int end = cur_.col;
  for (int i = 0; i < count; ++i) end = next_word_start_same_line(s, end);
  if (end <= cur_.col) return ProcessResult::handled();
  yank_ = Yank{s.substr(cur_.col, end - cur_.col), false};
  edit(cur_, end - cur_.col, "");
  clamp_cursor();
  remember({char_to_key_event('d'), char_to_key_event('w')}, n);
  return ProcessResult::handled();
}

ProcessResult VimBuffer::delete_to_eol(std::vector<KeyEvent> keys, int n) {
  const std::string& s = buf_.line(cur_.row);
  int take = static_cast<int>(s.size()) - cur_.col;
  if (take <= 0) return ProcessResult::handled();
  yank_ = Yank{s.substr(cur_.col), false};
  edit(cur_, take, "");
  clamp_cursor();
  remember(std::move(keys), n);
  return ProcessResult::handled();
}

ProcessResult VimBuffer::yank_lines(int count) {
  int last = count >= buf_.line_count() - cur_.row ? buf_.line_count() - 1 : cur_.row + count - 1;
  std::string block = buf_.line(cur_.row);
  for (int r = cur_.row + 1; r <= last; ++r) block += "\n" + buf_.line(r);
  yank_ = Yank{block, true};
  return ProcessResult::handled();
}

ProcessResult VimBuffer::put(bool after, int count, int n) {
  if (!yank_) return ProcessResult::error("nothing to put");
  std::string block;
  for (int i = 0; i < count; ++i) {
    if (i && yank_->linewise) block += "\n";
    block += yank_->text;
  }
  if (yank_->linewise) {
    int row = cur_.row;
    if (after) {
      edit({row, static_cast<int>(buf_.line(row).size())}, 0, "\n" + block);
      row++;
    } else {
      edit({row, 0}, 0, block + "\n");
    }
    cur_ = {row, first_non_blank(buf_.line(row))};
  } else {
    int len = static_cast<int>(buf_.line(cur_.row).size());
    Cursor at{cur_.row, after && len > 0 ? std::min(cur_.col + 1, len) : cur_.col};
    Cursor end = edit(at, 0, block);
    cur_ = buf_.cursor_at(std::max(buf_.offset_of(at), buf_.offset_of(end) - 1));
  }
  clamp_cursor();
  remember({char_to_key_event(after ? 'p' : 'P')}, n);
  return ProcessResult::handled();
}

ProcessResult VimBuffer::increment(int delta, int n) {
  const std::string& s = buf_.line(cur_.row);
  int len = static_cast<int>(s.size());
  int i = cur_.col;
  auto digit_at = [&](int p){ return p >= 0 && p < len && std::isdigit(static_cast<unsigned char>(s[p])) != 0; };
  if (digit_at(i)) {
    while (digit_at(i - 1)) i--;
  } else {
    while (i < len && !digit_at(i)) i++;
    if (i >= len) return ProcessResult::error("no number under cursor");
  }
  int j = i;
  while (digit_at(j)) j++;
  long long value = 0;
  auto parsed = std::from_chars(s.data() + i, s.data() + j, value);
  if (parsed.ec != std::errc() || value > LLONG_MAX - VL_MAX_COUNT) return ProcessResult::error("number too large");
  int start = i;
  if (start > 0 && s[start - 1] == '-') { start--; value = -value; }
  std::string rep = std::to_string(value + delta);
  edit({cur_.row, start}, j - start, rep);
  cur_.col = start + static_cast<int>(rep.size()) - 1;
  remember({char_with_control(delta > 0 ? 'a' : 'x')}, n);
  return ProcessResult::handled();
}

bool VimBuffer::undo() {
  bool ok = um_.undo(buf_, cur_);
  clamp_cursor();
  return ok;
}

bool VimBuffer::redo() {
  bool ok = um_.redo(buf_, cur_);
  clamp_cursor();
  return ok;
}

ProcessResult VimBuffer::undo_steps(int count) {
  for (int i = 0; i < count; ++i) {
    if (!undo()) {
      if (i == 0) message_ = "already at oldest change";
      break;
    }
  }
  modified_ = um_.can_undo();
  return ProcessResult::handled();
}

ProcessResult VimBuffer::redo_steps(int count) {
  for (int i = 0; i < count; ++i) {
    if (!redo()) {
      if (i == 0) message_ = "already at newest change";
      break;
    }
  }
  modified_ = um_.can_undo();
  return ProcessResult::handled();
}

ProcessResult VimBuffer::repeat_last_change(int n) {
  if (!last_command_) return ProcessResult::error("no previous change to repeat");
  RepeatableCommand cmd = *last_command_;
  int count = n > 0 ? n : cmd.count;
  repeating_ = true;
  ProcessResult r = ProcessResult::handled();
  if (cmd.insert_change) {
    r = process_normal(cmd.keys.front());
    if (!r.is_error() && mode_ == Mode::Insert) {
      apply_text_change(*cmd.insert_change);
      insert_count_ = std::max(1, count);
      r = finish_insert();
    }
  } else {
    if (count > 0) {
      for (char d : std::to_string(count)) input_.consume_digit(d);
    }
    for (const KeyEvent& k : cmd.keys) {
      r = process_normal(k);
      if (r.is_error()) break;
    }
  }
  repeating_ = false;
  if (!r.is_error() && n > 0) last_command_->count = n;
  return r;
}

ProcessResult VimBuffer::start_recording(char reg) {
  MacroResult r = macros_.start_recording(reg);
  if (r != MacroResult::Ok) return ProcessResult::error(macro_result_message(r));
  message_ = std::string("recording @") + reg;
  return ProcessResult::handled();
}

ProcessResult VimBuffer::run_macro(char reg, int count) {
  MacroResult r = reg == '@' ? macros_.run_last(count) : macros_.run(reg, count);
  if (r != MacroResult::Ok) return ProcessResult::error(macro_result_message(r));
  return ProcessResult::handled();
}

/* ---------- insert mode ---------- */

ProcessResult VimBuffer::begin_insert(char entry, int count) {
  const std::string& s = buf_.line(cur_.row);
  int len = static_cast<int>(s.size());
  switch (entry) {
    case 'a': if (len > 0) cur_.col = std::min(cur_.col + 1, len); break;
    case 'I': cur_.col = first_non_blank(s); break;
    case 'A': cur_.col = len; break;
    case 'o':
      edit({cur_.row, len}, 0, "\n");
      cur_ = {cur_.row + 1, 0};
      break;
    case 'O':
      edit({cur_.row, 0}, 0, "\n");
      cur_.col = 0;
      break;
    default: break;
  }
  insert_entry_ = entry;
  insert_count_ = count;
  session_change_.reset();
  mode_ = Mode::Insert;
  tracker_.set_enabled(true);
  return ProcessResult::handled();
}

ProcessResult VimBuffer::finish_insert() {
  tracker_.complete_change();
  std::optional<TextChange> change = session_change_;
  tracker_.set_enabled(false);
  if (change) {
    for (int i = 1; i < insert_count_; ++i) {
      if (insert_entry_ == 'o' || insert_entry_ == 'O') insert_text("\n");
      apply_text_change(*change);
    }
  }
  if (!repeating_ && change) last_command_ = RepeatableCommand{{char_to_key_event(insert_entry_)}, insert_count_, change};
  mode_ = Mode::Normal;
  if (cur_.col > 0) cur_.col--;
  clamp_cursor();
  if (insert_group_open_) {
    insert_group_open_ = false;
    um_.commit_group(cur_);
  }
  return ProcessResult::handled();
}

void VimBuffer::insert_text(const std::string& text) {
  cur_ = edit(cur_, 0, text);
}

void VimBuffer::apply_text_change(const TextChange& c) {
  switch (c.kind()) {
    case TextChange::Kind::Insert:
      insert_text(c.text());
      break;
    case TextChange::Kind::DeleteLeft: {
      int caret_pos = caret();
      int start = std::max(0, caret_pos - c.count());
      Cursor at = buf_.cursor_at(start);
      edit(at, caret_pos - start, "");
      cur_ = at;
    } break;
    case TextChange::Kind::DeleteRight:
      edit(cur_, c.count(), "");
      break;
    case TextChange::Kind::Combination:
      apply_text_change(c.first());
      apply_text_change(c.second());
      break;
  }
}

ProcessResult VimBuffer::process_insert(const KeyEvent& k) {
  if (!um_.in_group()) {
    um_.begin_group(cur_);
    insert_group_open_ = true;
  }
  if (is_direct_insert(k) && k.key != VimKey::Enter && k.key != VimKey::Tab) {
    insert_text(std::string(1, *k.ch));
    return ProcessResult::handled();
  }
  switch (k.key) {
    case VimKey::Escape: return finish_insert();
    case VimKey::Enter:
    case VimKey::KeypadEnter:
      insert_text("\n");
      return ProcessResult::handled();
    case VimKey::Tab:
      if (k.modifiers != KeyMod::None) return ProcessResult::not_handled();
      if (settings_.expand_tab) {
        int tw = std::clamp(settings_.tab_width, 1, VL_MAX_TAB_WIDTH);
        int width = tw - (cur_.col % tw);
        insert_text(std::string(static_cast<size_t>(width), ' '));
      } else {
        insert_text("\t");
      }
      return ProcessResult::handled();
    case VimKey::Back: return insert_backspace();
    case VimKey::Delete: return insert_delete();
    case VimKey::Left: case VimKey::Right: case VimKey::Up: case VimKey::Down:
    case VimKey::Home: case VimKey::End:
      return insert_move(k.key);
    case VimKey::RawCharacter:
      if (k.is_control('n')) return complete_word(true);
      if (k.is_control('p')) return complete_word(false);
      return ProcessResult::not_handled();
    default: return ProcessResult::not_handled();
  }
}

ProcessResult VimBuffer::insert_backspace() {
  if (cur_.col > 0) {
    Cursor at{cur_.row, cur_.col - 1};
    edit(at, 1, "");
    cur_ = at;
    return ProcessResult::handled();
  }
  if (cur_.row == 0) return ProcessResult::error("cannot backspace past start of buffer");
  Cursor at{cur_.row - 1, static_cast<int>(buf_.line(cur_.row - 1).size())};
  edit(at, 1, "");
  cur_ = at;
  return ProcessResult::handled();
}

ProcessResult VimBuffer::insert_delete() {
  bool at_end = cur_.col >= (int)buf_.line(cur_.row).size();
  if (at_end && cur_.row + 1 >= buf_.line_count()) return ProcessResult::handled();
  edit(cur_, 1, "");
  return ProcessResult::handled();
}

ProcessResult VimBuffer::insert_move(VimKey key) {
  tracker_.complete_change();
  int len = static_cast<int>(buf_.line(cur_.row).size());
  switch (key) {
    case VimKey::Left:
      if (cur_.col == 0) return ProcessResult::error("cannot move left");
      cur_.col--;
      break;
    case VimKey::Right:
      if (cur_.col >= len) return ProcessResult::error("cannot move right");
      cur_.col++;
      break;
    case VimKey::Up:
      if (cur_.row == 0) return ProcessResult::error("cannot move up");
      cur_.row--;
      break;
    case VimKey::Down:
      if (cur_.row + 1 >= buf_.line_count()) return ProcessResult::error("cannot move down");
      cur_.row++;
      break;
    case VimKey::Home: cur_.col = 0; break;
    case VimKey::End: cur_.col = len; break;
    default: break;
  }
  clamp_cursor();
  return ProcessResult::handled();
}

ProcessResult VimBuffer::complete_word(bool forward) {
  const std::string& s = buf_.line(cur_.row);
  int start = cur_.col;
  while (start > 0 && is_word_char(static_cast<unsigned char>(s[start - 1]))) start--;
  std::string prefix = s.substr(start, cur_.col - start);
  if (prefix.empty()) {
    message_ = "no word to complete";
    return ProcessResult::handled();
  }
  std::vector<std::string> candidates;
  for (const std::string& l : buf_.lines()) {
    size_t i = 0;
    while (i < l.size()) {
      if (!is_word_char(static_cast<unsigned char>(l[i]))) { i++; continue; }
      size_t j = i;
      while (j < l.size() && is_word_char(static_cast<unsigned char>(l[j]))) j++;
      std::string word = l.substr(i, j - i);
      if (word.size() > prefix.size() && word.compare(0, prefix.size(), prefix) == 0 &&
          std::find(candidates.begin(), candidates.end(), word) == candidates.end()) {
        candidates.push_back(word);
      }
      i = j;
    }
  }
  if (candidates.empty()) {
    message_ = "no match for " + prefix;
    return ProcessResult::handled();
  }
  const std::string& pick = forward ? candidates.front() : candidates.back();
  insert_text(pick.substr(prefix.size()));
  return ProcessResult::handled();
}
