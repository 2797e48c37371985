#pragma once
/*
 * MacroEngine
 *
 * Purpose: record live key events into registers and replay them through the
 *          dispatcher, count times, as one undo transaction.
 * Replay: the first dispatch error ends the whole run (remaining repeats
 *         included); edits made before it stay. Nested runs (a macro invoking
 *         @x) share the outermost transaction.
 * Limit: VL_MAX_MACRO_DEPTH nested runs, beyond that the run fails.
 */
#include <optional>
#include <string>
#include <vector>
#include "dispatcher.hpp"
#include "key_event.hpp"
#include "register_map.hpp"
#include "undo_transaction.hpp"

enum class MacroResult {
  Ok,
  AlreadyRecording,
  NotRecording,
  InvalidRegister,
  UnknownRegister,
  NoLastMacro,
  DispatchError,
};

const char* macro_result_message(MacroResult r);

class MacroEngine {
public:
  MacroEngine(IUndoTransactionManager& undo, ICommandDispatcher& dispatcher);

  MacroResult start_recording(char reg);
  void record_key(const KeyEvent& k);
  MacroResult stop_recording();

  MacroResult run(char reg, int count = 1);
  MacroResult run_last(int count = 1);

  bool is_recording() const { return recording_.has_value(); }
  std::optional<char> recording_register() const { return recording_; }
  const std::vector<KeyEvent>& recording_buffer() const { return buffer_; }
  bool is_replaying() const { return replay_depth_ > 0; }
  int replay_depth() const { return replay_depth_; }
  std::optional<char> last_run_register() const { return last_run_; }
  void set_last_run_register(char reg) { last_run_ = RegisterMap::canonical_name(reg); }

  RegisterMap& registers() { return registers_; }
  const RegisterMap& registers() const { return registers_; }

private:
  IUndoTransactionManager& undo_;
  ICommandDispatcher& dispatcher_;
  RegisterMap registers_;
  std::optional<char> recording_;
  std::vector<KeyEvent> buffer_;
  int replay_depth_ = 0;
  std::optional<char> last_run_;
};
