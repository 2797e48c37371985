#pragma once
/*
 * VimBuffer
 *
 * Purpose: headless modal buffer. Every key, live or replayed by a macro, is
 *          dispatched through process(); it also owns the undo transactions
 *          macros run in.
 * Modes: Normal and Insert. ':' and unknown keys come back NotHandled so the
 *        host can deal with them.
 * Repeat: '.' re-dispatches the keys of the last normal change, or re-enters
 *         insert mode and re-applies the TextChange the tracker captured.
 * Undo: every command is one group; an insert session stays one group from
 *       the entry key to <Esc>.
 */
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "dispatcher.hpp"
#include "input.hpp"
#include "key_event.hpp"
#include "macro_engine.hpp"
#include "text_buffer.hpp"
#include "text_change.hpp"
#include "text_change_tracker.hpp"
#include "types.hpp"
#include "undo_manager.hpp"
#include "undo_transaction.hpp"

class VimBuffer : public ICommandDispatcher, public IUndoTransactionManager {
public:
  VimBuffer();
  explicit VimBuffer(std::vector<std::string> lines);
  VimBuffer(const VimBuffer&) = delete;
  VimBuffer& operator=(const VimBuffer&) = delete;

  bool can_process(const KeyEvent& k) const override;
  ProcessResult process(const KeyEvent& k) override;
  /*keys in <Esc> notation; all are processed, the first error is returned*/
  ProcessResult process(std::string_view keys);

  UndoTransactionHandle open_transaction(const std::string& name) override;
  void complete_transaction(UndoTransactionHandle h) override;
  void cancel_transaction(UndoTransactionHandle h) override;
  bool has_open_transaction() const { return !transactions_.empty(); }

  Mode mode() const { return mode_; }
  const TextBuffer& buffer() const { return buf_; }
  const std::string& line(int r) const { return buf_.line(r); }
  void set_text(std::vector<std::string> lines);
  Cursor cursor() const { return cur_; }
  void set_cursor(Cursor c);
  int caret() const { return buf_.offset_of(cur_); }

  Settings& settings() { return settings_; }
  const Settings& settings() const { return settings_; }
  MacroEngine& macros() { return macros_; }
  const MacroEngine& macros() const { return macros_; }
  const TextChangeTracker& tracker() const { return tracker_; }

  const std::string& message() const { return message_; }
  void set_message(std::string m) { message_ = std::move(m); }
  bool modified() const { return modified_; }
  void set_modified(bool m) { modified_ = m; }

  bool undo();
  bool redo();

private:
  struct Yank {
    std::string text;
    bool linewise = false;
  };
  struct RepeatableCommand {
    std::vector<KeyEvent> keys;
    int count = 0;
    std::optional<TextChange> insert_change;
  };

  ProcessResult process_normal(const KeyEvent& k);
  ProcessResult dispatch_normal(const KeyEvent& k);
  ProcessResult process_pending(const KeyEvent& k);
  ProcessResult process_insert(const KeyEvent& k);

  int max_col_for_row(int row) const;
  void clamp_cursor();
  void remember(std::vector<KeyEvent> keys, int count);

  ProcessResult move_left(int count);
  ProcessResult move_right(int count);
  ProcessResult move_up(int count);
  ProcessResult move_down(int count);
  ProcessResult move_word_forward(int count);

  Cursor edit(Cursor at, int erase_len, const std::string& text);
  ProcessResult delete_chars(const KeyEvent& k, int count, int n);
  ProcessResult toggle_case(int count, int n);
  ProcessResult replace_chars(char c, int count, int n);
  ProcessResult delete_lines(int count, int n);
  ProcessResult delete_words(int count, int n);
  ProcessResult delete_to_eol(std::vector<KeyEvent> keys, int n);
  ProcessResult yank_lines(int count);
  ProcessResult put(bool after, int count, int n);
  ProcessResult increment(int delta, int n);
  ProcessResult undo_steps(int count);
  ProcessResult redo_steps(int count);
  ProcessResult repeat_last_change(int n);
  ProcessResult start_recording(char reg);
  ProcessResult run_macro(char reg, int count);

  ProcessResult begin_insert(char entry, int count);
  ProcessResult finish_insert();
  void insert_text(const std::string& text);
  void apply_text_change(const TextChange& c);
  ProcessResult insert_backspace();
  ProcessResult insert_delete();
  ProcessResult insert_move(VimKey key);
  ProcessResult complete_word(bool forward);

  TextBuffer buf_;
  Cursor cur_;
  Mode mode_ = Mode::Normal;
  Settings settings_;
  UndoManager um_;
  Input input_;
  TextChangeTracker tracker_;
  std::optional<Yank> yank_;
  std::optional<RepeatableCommand> last_command_;
  bool repeating_ = false;
  char insert_entry_ = 'i';
  int insert_count_ = 1;
  bool insert_group_open_ = false;
  std::optional<TextChange> session_change_;
  std::vector<int> transactions_;
  int next_transaction_id_ = 0;
  std::string message_;
  bool modified_ = false;
  MacroEngine macros_;
};
