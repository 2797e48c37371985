#undef NDEBUG
#include "macro_engine.hpp"
#include <algorithm>
#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>
#include "config.hpp"
#include "key_notation.hpp"

class FakeUndo : public IUndoTransactionManager {
public:
  UndoTransactionHandle open_transaction(const std::string& name) override {
    opened.push_back(name);
    open++;
    return {next++};
  }
  void complete_transaction(UndoTransactionHandle) override { open--; completed++; }
  void cancel_transaction(UndoTransactionHandle) override { open--; cancelled++; }
  std::vector<std::string> opened;
  int open = 0;
  int completed = 0;
  int cancelled = 0;
  int next = 0;
};

/*records keys; '!' fails, '#' throws, '@x' re-enters the engine*/
class FakeDispatcher : public ICommandDispatcher {
public:
  bool can_process(const KeyEvent&) const override { return true; }
  ProcessResult process(const KeyEvent& k) override {
    seen += to_notation(k);
    if (engine && engine->is_recording()) engine->record_key(k);
    if (k.is_char('!')) return ProcessResult::error("bang");
    if (k.is_char('#')) throw std::runtime_error("dispatcher failure");
    if (pending_at) {
      pending_at = false;
      depth_seen = std::max(depth_seen, engine->replay_depth());
      MacroResult r = engine->run(*k.ch);
      if (r != MacroResult::Ok) return ProcessResult::error(macro_result_message(r));
      return ProcessResult::handled();
    }
    if (k.is_char('@')) pending_at = true;
    return ProcessResult::handled();
  }
  MacroEngine* engine = nullptr;
  std::string seen;
  bool pending_at = false;
  int depth_seen = 0;
};

struct Fixture {
  FakeUndo undo;
  FakeDispatcher dispatcher;
  MacroEngine engine{undo, dispatcher};
  Fixture() { dispatcher.engine = &engine; }
};

static void test_recording() {
  Fixture f;
  assert(f.engine.stop_recording() == MacroResult::NotRecording);
  assert(f.engine.start_recording('!') == MacroResult::InvalidRegister);
  assert(f.engine.start_recording('a') == MacroResult::Ok);
  assert(f.engine.is_recording());
  assert(f.engine.recording_register() == 'a');
  assert(f.engine.start_recording('b') == MacroResult::AlreadyRecording);
  for (const KeyEvent& k : parse_key_notation("dw<Esc>")) f.engine.record_key(k);
  assert(f.engine.recording_buffer().size() == 3);
  assert(f.engine.stop_recording() == MacroResult::Ok);
  assert(!f.engine.is_recording());
  assert(to_notation(*f.engine.registers().get('a')) == "dw<Esc>");

  // append through the upper case name
  assert(f.engine.start_recording('A') == MacroResult::Ok);
  f.engine.record_key(char_to_key_event('x'));
  f.engine.stop_recording();
  assert(to_notation(*f.engine.registers().get('a')) == "dw<Esc>x");
}

static void test_run() {
  Fixture f;
  assert(f.engine.run('c') == MacroResult::UnknownRegister);
  assert(f.engine.run('#') == MacroResult::InvalidRegister);
  assert(f.engine.run_last() == MacroResult::NoLastMacro);
  assert(f.undo.opened.empty());

  f.engine.registers().set('c', parse_key_notation("ab"));
  assert(f.engine.run('c', 3) == MacroResult::Ok);
  assert(f.dispatcher.seen == "ababab");
  assert(f.undo.opened.size() == 1);
  assert(f.undo.open == 0 && f.undo.completed == 1);
  assert(f.engine.last_run_register() == 'c');
  assert(!f.engine.is_replaying());

  f.dispatcher.seen.clear();
  assert(f.engine.run_last(2) == MacroResult::Ok);
  assert(f.dispatcher.seen == "abab");

  f.engine.set_last_run_register('C');
  assert(f.engine.last_run_register() == 'c');
}

static void test_error_stops_all_repeats() {
  Fixture f;
  f.engine.registers().set('e', parse_key_notation("a!b"));
  assert(f.engine.run('e', 5) == MacroResult::DispatchError);
  assert(f.dispatcher.seen == "a!");
  // the work before the error is kept, not rolled back
  assert(f.undo.completed == 1 && f.undo.cancelled == 0);
  assert(f.undo.open == 0);
}

static void test_nested_runs_share_one_transaction() {
  Fixture f;
  f.engine.registers().set('a', parse_key_notation("x@b"));
  f.engine.registers().set('b', parse_key_notation("y"));
  assert(f.engine.run('a', 2) == MacroResult::Ok);
  assert(f.dispatcher.seen == "x@byx@by");
  assert(f.undo.opened.size() == 1);
  assert(f.dispatcher.depth_seen == 1);
  assert(f.engine.last_run_register() == 'b');
}

static void test_recursion_is_capped() {
  Fixture f;
  f.engine.registers().set('r', parse_key_notation("@r"));
  assert(f.engine.run('r') == MacroResult::DispatchError);
  assert(f.dispatcher.depth_seen == VL_MAX_MACRO_DEPTH);
  assert(f.engine.replay_depth() == 0);
  assert(f.undo.open == 0 && f.undo.opened.size() == 1);
}

static void test_replay_is_not_recorded() {
  Fixture f;
  f.engine.registers().set('c', parse_key_notation("ab"));
  f.engine.start_recording('d');
  f.engine.record_key(char_to_key_event('@'));
  f.engine.record_key(char_to_key_event('c'));
  assert(f.engine.run('c') == MacroResult::Ok);
  f.engine.stop_recording();
  assert(to_notation(*f.engine.registers().get('d')) == "@c");
}

static void test_throwing_dispatcher_unwinds_depth() {
  Fixture f;
  f.engine.registers().set('o', parse_key_notation("@t"));
  f.engine.registers().set('t', parse_key_notation("#"));
  bool thrown = false;
  try {
    f.engine.run('o');
  } catch (const std::runtime_error&) {
    thrown = true;
  }
  assert(thrown);
  assert(!f.engine.is_replaying());
  assert(f.engine.replay_depth() == 0);
  assert(f.undo.open == 0);
  // the engine is usable again afterwards
  f.engine.registers().set('y', parse_key_notation("y"));
  assert(f.engine.run('y') == MacroResult::Ok);
}

int main() {
  test_recording();
  test_run();
  test_error_stops_all_repeats();
  test_nested_runs_share_one_transaction();
  test_recursion_is_capped();
  test_replay_is_not_recorded();
  test_throwing_dispatcher_unwinds_depth();
  return 0;
}
