#include "key_notation.hpp"
#include <cctype>
#include <utility>

struct NamedKey {
  const char* name;
  VimKey key;
};

static const NamedKey kNamedKeys[] = {
  {"Esc", VimKey::Escape}, {"CR", VimKey::Enter}, {"Enter", VimKey::Enter}, {"Return", VimKey::Enter},
  {"Tab", VimKey::Tab}, {"BS", VimKey::Back}, {"Del", VimKey::Delete},
  {"Left", VimKey::Left}, {"Right", VimKey::Right}, {"Up", VimKey::Up}, {"Down", VimKey::Down},
  {"Home", VimKey::Home}, {"End", VimKey::End}, {"PageUp", VimKey::PageUp}, {"PageDown", VimKey::PageDown},
  {"Insert", VimKey::Insert}, {"Help", VimKey::Help},
  {"F1", VimKey::F1}, {"F2", VimKey::F2}, {"F3", VimKey::F3}, {"F4", VimKey::F4},
  {"F5", VimKey::F5}, {"F6", VimKey::F6}, {"F7", VimKey::F7}, {"F8", VimKey::F8},
  {"F9", VimKey::F9}, {"F10", VimKey::F10}, {"F11", VimKey::F11}, {"F12", VimKey::F12},
  {"k0", VimKey::Keypad0}, {"k1", VimKey::Keypad1}, {"k2", VimKey::Keypad2}, {"k3", VimKey::Keypad3},
  {"k4", VimKey::Keypad4}, {"k5", VimKey::Keypad5}, {"k6", VimKey::Keypad6}, {"k7", VimKey::Keypad7},
  {"k8", VimKey::Keypad8}, {"k9", VimKey::Keypad9},
  {"kPoint", VimKey::KeypadDecimal}, {"kPlus", VimKey::KeypadPlus}, {"kMinus", VimKey::KeypadMinus},
  {"kMultiply", VimKey::KeypadMultiply}, {"kDivide", VimKey::KeypadDivide}, {"kEnter", VimKey::KeypadEnter},
};

static const std::pair<const char*, char> kNamedChars[] = {
  {"Space", ' '}, {"lt", '<'}, {"Bar", '|'}, {"Bslash", '\\'},
};

static bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
  }
  return true;
}

static const char* key_name(VimKey key) {
  for (const auto& nk : kNamedKeys) {
    if (nk.key == key && nk.key != VimKey::Enter) return nk.name;
  }
  if (key == VimKey::Enter) return "CR";
  return nullptr;
}

std::optional<KeyEvent> key_from_notation(std::string_view name) {
  unsigned mods = KeyMod::None;
  while (name.size() > 2 && name[1] == '-') {
    char m = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
    if (m == 'C') mods |= KeyMod::Control;
    else if (m == 'S') mods |= KeyMod::Shift;
    else if (m == 'A' || m == 'M') mods |= KeyMod::Alt;
    else return std::nullopt;
    name.remove_prefix(2);
  }
  if (name.empty()) return std::nullopt;
  if (name.size() == 1) return apply_modifiers(char_to_key_event(name[0]), mods);
  for (const auto& nc : kNamedChars) {
    if (iequals(name, nc.first)) return apply_modifiers(char_to_key_event(nc.second), mods);
  }
  for (const auto& nk : kNamedKeys) {
    if (iequals(name, nk.name)) return apply_modifiers(vim_key_to_key_event(nk.key), mods);
  }
  return std::nullopt;
}

std::vector<KeyEvent> parse_key_notation(std::string_view text) {
  std::vector<KeyEvent> out;
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] == '<') {
      size_t close = text.find('>', i + 1);
      if (close != std::string_view::npos) {
        if (auto k = key_from_notation(text.substr(i + 1, close - i - 1))) {
          out.push_back(*k);
          i = close + 1;
          continue;
        }
      }
    }
    out.push_back(char_to_key_event(text[i]));
    ++i;
  }
  return out;
}

std::string to_notation(const KeyEvent& k) {
  std::string prefix;
  if (k.has(KeyMod::Control)) prefix += "C-";
  if (k.has(KeyMod::Shift)) prefix += "S-";
  if (k.has(KeyMod::Alt)) prefix += "A-";
  if (k.key == VimKey::RawCharacter && k.ch) {
    char c = *k.ch;
    if (prefix.empty() && c != '<' && std::isprint(static_cast<unsigned char>(c))) return std::string(1, c);
    if (c == '<') return "<" + prefix + "lt>";
    if (c == ' ') return "<" + prefix + "Space>";
    return "<" + prefix + std::string(1, c) + ">";
  }
  if (const char* name = key_name(k.key)) return "<" + prefix + name + ">";
  return "<" + prefix + "Nop>";
}

std::string to_notation(const std::vector<KeyEvent>& keys) {
  std::string out;
  for (const auto& k : keys) out += to_notation(k);
  return out;
}
