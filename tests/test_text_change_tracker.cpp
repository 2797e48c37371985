#undef NDEBUG
#include "text_change_tracker.hpp"
#include <cassert>
#include <optional>
#include <vector>
#include "text_util.hpp"

static BufferEdit ins(int pos, const std::string& text) { return {pos, "", text, pos}; }
static BufferEdit del(int pos, const std::string& gone, int caret) { return {pos, gone, "", caret}; }

struct Fixture {
  TextChangeTracker tracker{[](const std::string& s){ return normalize_blanks(s, 4); }};
  std::vector<TextChange> completed;
  int changed = 0;
  Fixture() {
    tracker.set_enabled(true);
    tracker.on_change_completed([this](const TextChange& c){ completed.push_back(c); });
    tracker.on_changed([this](const TextChange&){ changed++; });
  }
  const TextChange& current() const { return *tracker.current_change(); }
};

static void test_disabled() {
  Fixture f;
  f.tracker.set_enabled(false);
  f.tracker.on_buffer_edit(ins(0, "a"));
  assert(!f.tracker.current_change());
  assert(f.changed == 0);

  Fixture g;
  g.tracker.on_buffer_edit(ins(0, "a"));
  g.tracker.set_enabled(false);
  assert(!g.tracker.current_change());
  assert(g.completed.empty());
}

static void test_typing_forward() {
  Fixture f;
  f.tracker.on_buffer_edit(ins(0, "a"));
  assert(f.current() == TextChange::insert("a"));
  f.tracker.on_buffer_edit(ins(1, "b"));
  f.tracker.on_buffer_edit(ins(2, "cde"));
  assert(f.current() == TextChange::insert("abcde"));
  assert(f.completed.empty());
  assert(f.changed == 3);
}

static void test_backspace() {
  Fixture f;
  f.tracker.on_buffer_edit(ins(0, "abc"));
  f.tracker.on_buffer_edit(del(2, "c", 3));
  assert(f.current() == TextChange::insert("ab"));
  f.tracker.on_buffer_edit(del(1, "b", 2));
  assert(f.current() == TextChange::insert("a"));

  Fixture g;
  g.tracker.on_buffer_edit(del(2, "e", 3));
  assert(g.current() == TextChange::delete_left(1));
  g.tracker.on_buffer_edit(del(1, "h", 2));
  assert(g.current() == TextChange::delete_left(2));
  assert(g.completed.empty());
}

static void test_delete_direction() {
  Fixture f;
  f.tracker.on_buffer_edit(del(0, "cat", 0));
  assert(f.current() == TextChange::delete_right(3));
  f.tracker.on_buffer_edit(del(0, " ", 0));
  assert(f.current() == TextChange::delete_right(4));

  Fixture g;
  g.tracker.on_buffer_edit(del(0, "cat", 1));
  assert(g.current() == TextChange::delete_left(3));

  // caret strictly before the span
  Fixture before;
  before.tracker.on_buffer_edit(del(2, "e", 0));
  assert(before.current() == TextChange::delete_right(1));

  // caret at the span end, and past it
  Fixture at_end;
  at_end.tracker.on_buffer_edit(del(2, "e", 3));
  assert(at_end.current() == TextChange::delete_left(1));
  Fixture past;
  past.tracker.on_buffer_edit(del(2, "e", 6));
  assert(past.current() == TextChange::delete_left(1));
}

static void test_replace() {
  Fixture f;
  f.tracker.on_buffer_edit({0, "house", "dog", 1});
  const TextChange& c = f.current();
  assert(c.is_combination());
  assert(c.first() == TextChange::delete_left(5));
  assert(c.second() == TextChange::insert("dog"));

  Fixture g;
  g.tracker.on_buffer_edit(ins(0, "i"));
  g.tracker.on_buffer_edit({1, "dog", "cat", 1});
  assert(g.current().is_combination());
  assert(g.current().first() == TextChange::insert("i"));
  assert(g.current().second().is_combination());
}

static void test_blank_normalization() {
  Fixture f;
  f.tracker.on_buffer_edit({0, "    ", "\t\t", 4});
  assert(f.current() == TextChange::insert("\t"));

  Fixture g;
  g.tracker.on_buffer_edit({0, "\t", "    ", 1});
  assert(g.current() == TextChange::insert(""));

  // without a normalizer a blank replace is an ordinary replace
  TextChangeTracker raw;
  raw.set_enabled(true);
  raw.on_buffer_edit({0, "    ", "\t\t", 4});
  assert(raw.current_change()->is_combination());
}

static void test_completion() {
  Fixture f;
  f.tracker.on_buffer_edit(ins(0, "a"));
  f.tracker.on_buffer_edit(ins(10, "b"));
  assert(f.completed.size() == 1);
  assert(f.completed[0] == TextChange::insert("a"));
  assert(f.current() == TextChange::insert("b"));

  f.tracker.complete_change();
  assert(f.completed.size() == 2);
  assert(f.completed[1] == TextChange::insert("b"));
  assert(!f.tracker.current_change());

  // nothing pending, nothing fired
  f.tracker.complete_change();
  assert(f.completed.size() == 2);

  // after completion the next edit starts fresh wherever it lands
  f.tracker.on_buffer_edit(ins(11, "c"));
  assert(f.current() == TextChange::insert("c"));
  assert(f.completed.size() == 2);
}

int main() {
  test_disabled();
  test_typing_forward();
  test_backspace();
  test_delete_direction();
  test_replace();
  test_blank_normalization();
  test_completion();
  return 0;
}
