#undef NDEBUG
#include "key_processor.hpp"
#include <cassert>
#include <string>
#include <vector>
#include "vim_buffer.hpp"

class RecordingDispatcher : public ICommandDispatcher {
public:
  bool can_process(const KeyEvent& k) const override { return !k.is_char('!'); }
  ProcessResult process(const KeyEvent& k) override {
    seen.push_back(k);
    if (k.is_char('e')) return ProcessResult::error("boom");
    if (k.is_char('n')) return ProcessResult::not_handled();
    return ProcessResult::handled();
  }
  std::vector<KeyEvent> seen;
};

static CommandData cmd(CommandGroup g, unsigned id, unsigned mods = KeyMod::None) {
  CommandData c;
  c.group = g;
  c.id = id;
  c.modifiers = mods;
  return c;
}

static void test_routing() {
  RecordingDispatcher d;
  KeyProcessor p(d);

  assert(p.process(type_char_command('a')));
  assert(d.seen.size() == 1 && d.seen[0].is_char('a'));

  // an error is still a consumed key
  assert(p.process(type_char_command('e')));
  assert(p.last_result().is_error());

  assert(!p.process(type_char_command('n')));
  assert(!p.process(type_char_command('!')));
  assert(d.seen.size() == 3);

  assert(!p.process(cmd(CommandGroup::Standard2K, Std2K_LeftExt, KeyMod::Shift)));
  assert(!p.process(cmd(CommandGroup::Standard2K, Std2K_Home)));
  assert(!p.process(cmd(CommandGroup::Standard2K, Std2K_TypeChar)));
  assert(d.seen.size() == 3);

  // AltGr characters arrive as Control+Alt and are typed text, not commands
  assert(!p.process(type_char_command('q', KeyMod::Control | KeyMod::Alt)));
  assert(p.process(type_char_command('q', KeyMod::Alt)));

  assert(p.process(cmd(CommandGroup::Standard97, Std97_Escape)));
  assert(d.seen.back().key == VimKey::Escape);
}

static void test_vim_buffer_leaves_colon_to_host() {
  VimBuffer vb(std::vector<std::string>{"abc"});
  KeyProcessor p(vb);
  assert(!p.process(type_char_command(':')));
  assert(p.process(type_char_command('i')));
  assert(vb.mode() == Mode::Insert);
  assert(p.process(type_char_command(':')));
  assert(vb.line(0) == ":abc");
  assert(p.process(cmd(CommandGroup::Standard2K, Std2K_Cancel)));
  assert(vb.mode() == Mode::Normal);
  assert(p.process(cmd(CommandGroup::Standard2K, Std2K_Eol)));
  assert(vb.cursor().col == 3);
}

int main() {
  test_routing();
  test_vim_buffer_leaves_colon_to_host();
  return 0;
}
