#include "key_event.hpp"
#include <cctype>

static constexpr char ESC = 27;
static constexpr char DEL = 127;

KeyEvent char_to_key_event(char c) {
  switch (c) {
    case '\b': return {VimKey::Back, KeyMod::None, c};
    case '\t': return {VimKey::Tab, KeyMod::None, c};
    case '\r': case '\n': return {VimKey::Enter, KeyMod::None, '\r'};
    case ESC: return {VimKey::Escape, KeyMod::None, c};
    case DEL: return {VimKey::Delete, KeyMod::None, c};
    default: break;
  }
  if (c >= 1 && c <= 26) return {VimKey::RawCharacter, KeyMod::Control, static_cast<char>('a' + c - 1)};
  return {VimKey::RawCharacter, KeyMod::None, c};
}

KeyEvent vim_key_to_key_event(VimKey key) {
  switch (key) {
    case VimKey::Back: return char_to_key_event('\b');
    case VimKey::Tab: return char_to_key_event('\t');
    case VimKey::Enter: return char_to_key_event('\r');
    case VimKey::Escape: return char_to_key_event(ESC);
    case VimKey::Delete: return char_to_key_event(DEL);
    case VimKey::KeypadDecimal: return {key, KeyMod::None, '.'};
    case VimKey::KeypadPlus: return {key, KeyMod::None, '+'};
    case VimKey::KeypadMinus: return {key, KeyMod::None, '-'};
    case VimKey::KeypadMultiply: return {key, KeyMod::None, '*'};
    case VimKey::KeypadDivide: return {key, KeyMod::None, '/'};
    case VimKey::KeypadEnter: return {key, KeyMod::None, '\r'};
    default: break;
  }
  if (key >= VimKey::Keypad0 && key <= VimKey::Keypad9) {
    int d = static_cast<int>(key) - static_cast<int>(VimKey::Keypad0);
    return {key, KeyMod::None, static_cast<char>('0' + d)};
  }
  return {key, KeyMod::None, std::nullopt};
}

KeyEvent apply_modifiers(KeyEvent k, unsigned mods) {
  if (k.key == VimKey::RawCharacter && k.ch) {
    unsigned char c = static_cast<unsigned char>(*k.ch);
    if ((mods & KeyMod::Shift) && std::isalpha(c)) k.ch = static_cast<char>(std::toupper(c));
    mods &= ~KeyMod::Shift;
    if ((mods & KeyMod::Control) && std::isalpha(c)) k.ch = static_cast<char>(std::tolower(c));
  }
  k.modifiers |= mods;
  return k;
}

KeyEvent char_with_control(char c) { return apply_modifiers(char_to_key_event(c), KeyMod::Control); }

std::vector<KeyEvent> string_to_key_events(const std::string& s) {
  std::vector<KeyEvent> out;
  out.reserve(s.size());
  for (char c : s) out.push_back(char_to_key_event(c));
  return out;
}

bool is_keypad_key(VimKey key) {
  return key >= VimKey::Keypad0 && key <= VimKey::KeypadEnter;
}

bool is_direct_insert(const KeyEvent& k) {
  if (k.modifiers != KeyMod::None) return false;
  switch (k.key) {
    case VimKey::Enter: case VimKey::Tab: return true;
    case VimKey::RawCharacter: return k.ch && std::isprint(static_cast<unsigned char>(*k.ch));
    default: return is_keypad_key(k.key) && k.ch.has_value();
  }
}

std::vector<KeyEvent> all_key_events() {
  std::vector<KeyEvent> out;
  for (char c = 32; c < 127; ++c) out.push_back(char_to_key_event(c));
  for (char c = 'a'; c <= 'z'; ++c) {
    if (c == 'h' || c == 'i' || c == 'j' || c == 'm') continue;
    out.push_back(char_with_control(c));
  }
  for (int k = static_cast<int>(VimKey::Back); k <= static_cast<int>(VimKey::KeypadEnter); ++k) {
    out.push_back(vim_key_to_key_event(static_cast<VimKey>(k)));
  }
  out.push_back(apply_modifiers(vim_key_to_key_event(VimKey::Tab), KeyMod::Shift));
  return out;
}
