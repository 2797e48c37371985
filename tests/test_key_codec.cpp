#undef NDEBUG
#include "key_codec.hpp"
#include <cassert>

static CommandData cmd(CommandGroup g, unsigned id, unsigned mods = KeyMod::None) {
  CommandData c;
  c.group = g;
  c.id = id;
  c.modifiers = mods;
  return c;
}

static void test_decode() {
  auto ec = decode_command(type_char_command('a'));
  assert(ec && ec->is_user_input() && ec->key.is_char('a'));

  ec = decode_command(type_char_command('a', KeyMod::Shift));
  assert(ec && ec->key.is_char('A'));

  ec = decode_command(type_char_command('n', KeyMod::Control));
  assert(ec && ec->key.is_control('n'));

  // TypeChar needs exactly one payload byte
  CommandData bad = cmd(CommandGroup::Standard2K, Std2K_TypeChar);
  assert(!decode_command(bad));
  bad.extra_data = std::vector<uint8_t>{'a', 'b'};
  assert(!decode_command(bad));

  // both escape ids
  ec = decode_command(cmd(CommandGroup::Standard97, Std97_Escape));
  assert(ec && ec->key.key == VimKey::Escape && ec->is_user_input());
  ec = decode_command(cmd(CommandGroup::Standard2K, Std2K_Cancel));
  assert(ec && ec->key.key == VimKey::Escape);

  ec = decode_command(cmd(CommandGroup::Standard2K, Std2K_Bol));
  assert(ec && ec->key.key == VimKey::Home);
  ec = decode_command(cmd(CommandGroup::Standard2K, Std2K_Eol));
  assert(ec && ec->key.key == VimKey::End);
  assert(!decode_command(cmd(CommandGroup::Standard2K, Std2K_Home)));
  assert(!decode_command(cmd(CommandGroup::Standard2K, Std2K_End)));
  assert(!decode_command(cmd(CommandGroup::Standard2K, 9999)));

  ec = decode_command(cmd(CommandGroup::Standard2K, Std2K_BackTab));
  assert(ec && ec->key.key == VimKey::Tab && ec->key.has(KeyMod::Shift));

  ec = decode_command(cmd(CommandGroup::Standard2K, Std2K_ToggleOvertypeMode));
  assert(ec && ec->key.key == VimKey::Insert);

  // selection-extending commands belong to the host
  for (unsigned id : {Std2K_LeftExt, Std2K_LeftExtCol, Std2K_RightExt, Std2K_UpExtCol, Std2K_EolExt, Std2K_PageDownExt}) {
    ec = decode_command(cmd(CommandGroup::Standard2K, id));
    assert(ec && !ec->is_user_input() && ec->key.has(KeyMod::Shift));
  }

  ec = decode_command(cmd(CommandGroup::Standard2K, Std2K_Left, KeyMod::Control));
  assert(ec && ec->key.key == VimKey::Left && ec->key.has(KeyMod::Control));
}

static void test_encode() {
  auto c = encode_key(char_to_key_event('a'), true);
  assert(c && *c == type_char_command('a'));

  c = encode_key(vim_key_to_key_event(VimKey::Enter), true);
  assert(c && c->id == Std2K_TypeChar && (*c->extra_data)[0] == '\r');
  c = encode_key(vim_key_to_key_event(VimKey::Enter), false);
  assert(c && c->id == Std2K_Return);

  c = encode_key(vim_key_to_key_event(VimKey::Escape), false);
  assert(c && c->group == CommandGroup::Standard97 && c->id == Std97_Escape);

  c = encode_key(vim_key_to_key_event(VimKey::Home), false);
  assert(c && c->id == Std2K_Bol);

  KeyEvent shift_left = apply_modifiers(vim_key_to_key_event(VimKey::Left), KeyMod::Shift);
  c = encode_key(shift_left, false);
  assert(c && c->id == Std2K_LeftExt && c->modifiers == KeyMod::None);

  c = encode_key(apply_modifiers(vim_key_to_key_event(VimKey::Tab), KeyMod::Shift), false);
  assert(c && c->id == Std2K_BackTab);

  c = encode_key(char_with_control('a'), false);
  assert(c && c->id == Std2K_TypeChar && c->modifiers == KeyMod::Control);

  assert(!encode_key(vim_key_to_key_event(VimKey::F5), false));
  assert(!encode_key(KeyEvent{}, false));
}

static void test_every_key_survives_the_host() {
  for (const KeyEvent& k : all_key_events()) {
    for (bool text : {true, false}) {
      auto c = encode_key(k, text);
      if (!c) continue;
      auto ec = decode_command(*c);
      assert(ec);
      if (k.key == VimKey::KeypadEnter) {
        assert(ec->key.key == VimKey::Enter);
      } else if (is_keypad_key(k.key)) {
        assert(ec->key.key == VimKey::RawCharacter && ec->key.ch == k.ch);
      } else {
        assert(ec->key == k);
      }
    }
  }
}

int main() {
  test_decode();
  test_encode();
  test_every_key_survives_the_host();
  return 0;
}
