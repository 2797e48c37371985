#pragma once
/*
 * KeyEvent
 *
 * Purpose: editor-agnostic key value (key + modifiers + optional char).
 * Note: printable keys are RawCharacter carrying the char; Shift is folded
 *       into the char, Control letters are stored lowercase with Control.
 */
#include <optional>
#include <string>
#include <vector>

enum class VimKey {
  None,
  RawCharacter,
  Back, Tab, Enter, Escape, Delete,
  Left, Up, Right, Down,
  Home, End, PageUp, PageDown, Insert, Help,
  F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
  Keypad0, Keypad1, Keypad2, Keypad3, Keypad4,
  Keypad5, Keypad6, Keypad7, Keypad8, Keypad9,
  KeypadDecimal, KeypadPlus, KeypadMinus, KeypadMultiply, KeypadDivide,
  KeypadEnter
};

struct KeyMod {
  static constexpr unsigned None = 0;
  static constexpr unsigned Shift = 1;
  static constexpr unsigned Control = 2;
  static constexpr unsigned Alt = 4;
};

struct KeyEvent {
  VimKey key = VimKey::None;
  unsigned modifiers = KeyMod::None;
  std::optional<char> ch;

  bool operator==(const KeyEvent&) const = default;
  bool has(unsigned mod) const { return (modifiers & mod) != 0; }
  bool is_char(char c) const { return key == VimKey::RawCharacter && modifiers == KeyMod::None && ch && *ch == c; }
  bool is_control(char c) const { return key == VimKey::RawCharacter && modifiers == KeyMod::Control && ch && *ch == c; }
};

KeyEvent char_to_key_event(char c);
KeyEvent vim_key_to_key_event(VimKey key);
KeyEvent char_with_control(char c);
KeyEvent apply_modifiers(KeyEvent k, unsigned mods);
std::vector<KeyEvent> string_to_key_events(const std::string& s);

bool is_keypad_key(VimKey key);
bool is_direct_insert(const KeyEvent& k);

/*every key event the codec is expected to handle*/
std::vector<KeyEvent> all_key_events();
