#undef NDEBUG
#include <cassert>
#include <string>
#include <vector>
#include "key_notation.hpp"
#include "vim_buffer.hpp"

using Lines = std::vector<std::string>;

static void set_register(VimBuffer& vb, const char* keys) {
  vb.macros().registers().set('c', parse_key_notation(keys));
}

/*a finished scenario never leaves an undo transaction open*/
static void check_closed(const VimBuffer& vb) {
  assert(!vb.has_open_transaction());
  assert(!vb.macros().is_replaying());
}

static void run_insert_text() {
  VimBuffer vb(Lines{"world"});
  set_register(vb, "ihello ");
  vb.process("@c");
  assert(vb.mode() == Mode::Insert);
  assert(vb.line(0) == "hello world");
  check_closed(vb);
}

static void run_insert_text_with_escape() {
  VimBuffer vb(Lines{"world"});
  set_register(vb, "ihello <Esc>");
  vb.process("@c");
  assert(vb.mode() == Mode::Normal);
  assert(vb.line(0) == "hello world");
  check_closed(vb);
}

static void run_repeat_last_command() {
  VimBuffer vb(Lines{"hello world again"});
  set_register(vb, ".");
  vb.process("dw@c");
  assert(vb.line(0) == "again");
  assert(vb.macros().last_run_register() == 'c');
  check_closed(vb);
}

static void run_with_count() {
  VimBuffer vb(Lines{"cat", "dog", "bear"});
  set_register(vb, "~<Left><Down>");
  vb.process("2@c");
  assert(vb.line(0) == "Cat");
  assert(vb.line(1) == "Dog");
  assert(vb.line(2) == "bear");
  check_closed(vb);
}

static void run_numbered_list() {
  VimBuffer vb(Lines{"1. Heading"});
  vb.process("qaYp");
  vb.process(*key_from_notation("C-a"));
  vb.process("q3@a");
  assert(vb.buffer().line_count() == 5);
  for (int i = 0; i < 5; ++i) {
    assert(vb.line(i) == std::to_string(i + 1) + ". Heading");
  }
  check_closed(vb);
}

static void run_word_completion_without_match() {
  VimBuffer vb(Lines{"z "});
  vb.set_cursor({0, 1});
  set_register(vb, "i<C-n>s");
  vb.process("@c");
  assert(vb.line(0) == "zs ");
  check_closed(vb);
}

static void error_right_move() {
  VimBuffer vb(Lines{"cat", "cat"});
  vb.settings().virtual_edit_onemore = false;
  set_register(vb, "llidone<Esc>");
  vb.process("@c");
  assert(vb.line(0) == "cadonet");

  vb.set_cursor({1, 2});
  ProcessResult r = vb.process("@c");
  assert(r.is_error());
  assert(vb.line(1) == "cat");
  check_closed(vb);
}

static void error_recursive_right_move() {
  VimBuffer vb(Lines{"cat", "dog"});
  set_register(vb, "l@c");
  vb.process("@c");
  assert(vb.caret() == 2);
  check_closed(vb);
}

static void error_up_move() {
  VimBuffer vb(Lines{"dog cat tree", "dog cat tree"});
  set_register(vb, "lkdw");
  vb.process("@c");
  assert(vb.line(0) == "dog cat tree");
  assert(vb.caret() == 1);
  check_closed(vb);
}

static void record_insert_text_and_escape() {
  VimBuffer vb(Lines{""});
  vb.process("qcidog");
  vb.process(vim_key_to_key_event(VimKey::Escape));
  vb.process("q");
  assert(vb.mode() == Mode::Normal);
  assert(!vb.macros().is_recording());
  assert(to_notation(*vb.macros().registers().get('c')) == "idog<Esc>");
  vb.set_cursor({0, 0});
  vb.process("@c");
  assert(vb.line(0) == "dogdog");
  assert(vb.mode() == Mode::Normal);
  assert(vb.caret() == 2);
  check_closed(vb);
}

static void record_append_values() {
  VimBuffer vb(Lines{""});
  set_register(vb, "iw");
  vb.process("qCin");
  vb.process(vim_key_to_key_event(VimKey::Escape));
  vb.process("q");
  assert(vb.mode() == Mode::Normal);
  vb.set_text({""});
  vb.process("@c");
  assert(vb.line(0) == "win");
  assert(vb.mode() == Mode::Normal);
  assert(vb.caret() == 2);
  check_closed(vb);
}

static void repeat_command_after_run_macro() {
  VimBuffer vb(Lines{"hello world", "kick tree"});
  set_register(vb, "dwra");
  vb.process("@c");
  assert(vb.line(0) == "aorld");
  vb.set_cursor({1, 0});
  vb.process(".");
  assert(vb.line(1) == "aick tree");
  check_closed(vb);
}

static void run_last_macro_reads_the_register() {
  VimBuffer vb(Lines{""});
  set_register(vb, "iwin");
  vb.macros().set_last_run_register('c');
  vb.process("@@");
  assert(vb.line(0) == "win");
  check_closed(vb);
}

static void undo_macro_with_count() {
  VimBuffer vb(Lines{"cat", "dog", "bear"});
  set_register(vb, "~<Left><Down>");
  vb.process("2@c");
  vb.process("u");
  assert(vb.caret() == 0);
  assert(vb.line(0) == "cat");
  assert(vb.line(1) == "dog");
  check_closed(vb);
}

static void undo_macro_stopped_by_error() {
  VimBuffer vb(Lines{"cat", "dog", "bear"});
  set_register(vb, "~<Left><Down>");
  assert(vb.process("5@c").is_error());
  assert(vb.line(0) == "Cat");
  assert(vb.line(1) == "Dog");
  assert(vb.line(2) == "Bear");
  vb.process("u");
  assert(vb.caret() == 0);
  assert(vb.line(0) == "cat");
  assert(vb.line(1) == "dog");
  assert(vb.line(2) == "bear");
  check_closed(vb);
}

static void unknown_register_is_an_error() {
  VimBuffer vb(Lines{"abc"});
  ProcessResult r = vb.process("@z");
  assert(r.is_error());
  assert(vb.message() == "register is empty");
  r = vb.process("@@");
  assert(r.is_error());
  check_closed(vb);
}

static void self_calling_macro_hits_the_depth_cap() {
  VimBuffer vb(Lines{"abc"});
  set_register(vb, "@c");
  ProcessResult r = vb.process("@c");
  assert(r.is_error());
  assert(vb.mode() == Mode::Normal);
  assert(vb.line(0) == "abc");
  check_closed(vb);
}

int main() {
  run_insert_text();
  run_insert_text_with_escape();
  run_repeat_last_command();
  run_with_count();
  run_numbered_list();
  run_word_completion_without_match();
  error_right_move();
  error_recursive_right_move();
  error_up_move();
  record_insert_text_and_escape();
  record_append_values();
  repeat_command_after_run_macro();
  run_last_macro_reads_the_register();
  undo_macro_with_count();
  undo_macro_stopped_by_error();
  unknown_register_is_an_error();
  self_calling_macro_hits_the_depth_cap();
  return 0;
}
