#include "key_codec.hpp"
#include <map>
#include <utility>
#include <glog/logging.h>

struct KeyDescription {
  VimKey key;
  unsigned modifiers;
  EditCommandKind kind;
};

using CommandKey = std::pair<CommandGroup, unsigned>;

static const std::map<CommandKey, KeyDescription>& command_table() {
  constexpr auto S2K = CommandGroup::Standard2K;
  constexpr auto S97 = CommandGroup::Standard97;
  constexpr auto UI = EditCommandKind::UserInput;
  constexpr auto HC = EditCommandKind::HostCommand;
  static const std::map<CommandKey, KeyDescription> table = {
    {{S2K, Std2K_Backspace}, {VimKey::Back, KeyMod::None, UI}},
    {{S2K, Std2K_Return}, {VimKey::Enter, KeyMod::None, UI}},
    {{S2K, Std2K_Tab}, {VimKey::Tab, KeyMod::None, UI}},
    {{S2K, Std2K_BackTab}, {VimKey::Tab, KeyMod::Shift, UI}},
    {{S2K, Std2K_Delete}, {VimKey::Delete, KeyMod::None, UI}},
    {{S2K, Std2K_Cancel}, {VimKey::Escape, KeyMod::None, UI}},
    {{S2K, Std2K_ToggleOvertypeMode}, {VimKey::Insert, KeyMod::None, UI}},
    {{S2K, Std2K_Left}, {VimKey::Left, KeyMod::None, UI}},
    {{S2K, Std2K_Right}, {VimKey::Right, KeyMod::None, UI}},
    {{S2K, Std2K_Up}, {VimKey::Up, KeyMod::None, UI}},
    {{S2K, Std2K_Down}, {VimKey::Down, KeyMod::None, UI}},
    {{S2K, Std2K_PageUp}, {VimKey::PageUp, KeyMod::None, UI}},
    {{S2K, Std2K_PageDown}, {VimKey::PageDown, KeyMod::None, UI}},
    {{S2K, Std2K_Bol}, {VimKey::Home, KeyMod::None, UI}},
    {{S2K, Std2K_Eol}, {VimKey::End, KeyMod::None, UI}},
    {{S2K, Std2K_LeftExt}, {VimKey::Left, KeyMod::Shift, HC}},
    {{S2K, Std2K_LeftExtCol}, {VimKey::Left, KeyMod::Shift, HC}},
    {{S2K, Std2K_RightExt}, {VimKey::Right, KeyMod::Shift, HC}},
    {{S2K, Std2K_RightExtCol}, {VimKey::Right, KeyMod::Shift, HC}},
    {{S2K, Std2K_UpExt}, {VimKey::Up, KeyMod::Shift, HC}},
    {{S2K, Std2K_UpExtCol}, {VimKey::Up, KeyMod::Shift, HC}},
    {{S2K, Std2K_DownExt}, {VimKey::Down, KeyMod::Shift, HC}},
    {{S2K, Std2K_DownExtCol}, {VimKey::Down, KeyMod::Shift, HC}},
    {{S2K, Std2K_PageUpExt}, {VimKey::PageUp, KeyMod::Shift, HC}},
    {{S2K, Std2K_PageDownExt}, {VimKey::PageDown, KeyMod::Shift, HC}},
    {{S2K, Std2K_BolExt}, {VimKey::Home, KeyMod::Shift, HC}},
    {{S2K, Std2K_BolExtCol}, {VimKey::Home, KeyMod::Shift, HC}},
    {{S2K, Std2K_EolExt}, {VimKey::End, KeyMod::Shift, HC}},
    {{S2K, Std2K_EolExtCol}, {VimKey::End, KeyMod::Shift, HC}},
    {{S97, Std97_Escape}, {VimKey::Escape, KeyMod::None, UI}},
    {{S97, Std97_F1Help}, {VimKey::F1, KeyMod::None, UI}},
  };
  return table;
}

CommandData type_char_command(char c, unsigned modifiers) {
  CommandData cmd;
  cmd.group = CommandGroup::Standard2K;
  cmd.id = Std2K_TypeChar;
  cmd.extra_data = std::vector<uint8_t>{static_cast<uint8_t>(c)};
  cmd.modifiers = modifiers;
  return cmd;
}

std::optional<EditCommand> decode_command(const CommandData& cmd) {
  if (cmd.group == CommandGroup::Standard2K && cmd.id == Std2K_TypeChar) {
    if (!cmd.extra_data || cmd.extra_data->size() != 1) {
      VLOG(2) << "decode: TypeChar without a single byte payload";
      return std::nullopt;
    }
    KeyEvent k = char_to_key_event(static_cast<char>((*cmd.extra_data)[0]));
    return EditCommand{apply_modifiers(k, cmd.modifiers), EditCommandKind::UserInput};
  }
  const auto& table = command_table();
  auto it = table.find({cmd.group, cmd.id});
  if (it == table.end()) {
    VLOG(2) << "decode: unmapped command id " << cmd.id;
    return std::nullopt;
  }
  const KeyDescription& d = it->second;
  KeyEvent k = vim_key_to_key_event(d.key);
  k.modifiers = d.modifiers;
  return EditCommand{apply_modifiers(k, cmd.modifiers), d.kind};
}

static CommandData make_command(CommandGroup group, unsigned id, unsigned modifiers) {
  CommandData cmd;
  cmd.group = group;
  cmd.id = id;
  cmd.modifiers = modifiers;
  return cmd;
}

std::optional<CommandData> encode_key(const KeyEvent& k, bool for_text_input) {
  if (for_text_input && is_direct_insert(k)) return type_char_command(*k.ch);
  bool extend = !for_text_input && k.has(KeyMod::Shift);
  unsigned mods = extend ? (k.modifiers & ~KeyMod::Shift) : k.modifiers;
  constexpr auto S2K = CommandGroup::Standard2K;
  switch (k.key) {
    case VimKey::RawCharacter:
      if (!k.ch) break;
      return type_char_command(*k.ch, k.modifiers);
    case VimKey::Back: return make_command(S2K, Std2K_Backspace, k.modifiers);
    case VimKey::Enter:
    case VimKey::KeypadEnter: return make_command(S2K, Std2K_Return, k.modifiers);
    case VimKey::Tab:
      if (k.has(KeyMod::Shift)) return make_command(S2K, Std2K_BackTab, k.modifiers & ~KeyMod::Shift);
      return make_command(S2K, Std2K_Tab, k.modifiers);
    case VimKey::Delete: return make_command(S2K, Std2K_Delete, k.modifiers);
    case VimKey::Escape: return make_command(CommandGroup::Standard97, Std97_Escape, k.modifiers);
    case VimKey::F1: return make_command(CommandGroup::Standard97, Std97_F1Help, k.modifiers);
    case VimKey::Insert: return make_command(S2K, Std2K_ToggleOvertypeMode, k.modifiers);
    case VimKey::Left: return make_command(S2K, extend ? Std2K_LeftExt : Std2K_Left, mods);
    case VimKey::Right: return make_command(S2K, extend ? Std2K_RightExt : Std2K_Right, mods);
    case VimKey::Up: return make_command(S2K, extend ? Std2K_UpExt : Std2K_Up, mods);
    case VimKey::Down: return make_command(S2K, extend ? Std2K_DownExt : Std2K_Down, mods);
    case VimKey::Home: return make_command(S2K, extend ? Std2K_BolExt : Std2K_Bol, mods);
    case VimKey::End: return make_command(S2K, extend ? Std2K_EolExt : Std2K_Eol, mods);
    case VimKey::PageUp: return make_command(S2K, extend ? Std2K_PageUpExt : Std2K_PageUp, mods);
    case VimKey::PageDown: return make_command(S2K, extend ? Std2K_PageDownExt : Std2K_PageDown, mods);
    default:
      if (is_keypad_key(k.key) && k.ch) return type_char_command(*k.ch, k.modifiers);
      break;
  }
  VLOG(2) << "encode: no host command for key " << static_cast<int>(k.key);
  return std::nullopt;
}
