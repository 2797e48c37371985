#pragma once
/*
 * KeyCodec
 *
 * Purpose: translate host command tuples (group, id, extra data, modifiers)
 *          into EditCommands and key events back into host commands.
 * Note: incoming mapping is many-to-one (two Escape ids, Ext and ExtCol
 *       variants); outgoing picks exactly one representation per key.
 * Quirk: the host reports the physical Home/End keys as Bol/Eol, so the
 *        designated Home/End ids are left unmapped.
 */
#include <cstdint>
#include <optional>
#include <vector>
#include "key_event.hpp"

enum class CommandGroup { Standard97, Standard2K };

enum Std2KCommand : unsigned {
  Std2K_TypeChar = 1,
  Std2K_Backspace = 2,
  Std2K_Return = 3,
  Std2K_Tab = 4,
  Std2K_BackTab = 5,
  Std2K_Delete = 6,
  Std2K_Left = 7,
  Std2K_LeftExt = 8,
  Std2K_Right = 9,
  Std2K_RightExt = 10,
  Std2K_Up = 11,
  Std2K_UpExt = 12,
  Std2K_Down = 13,
  Std2K_DownExt = 14,
  Std2K_Home = 15,
  Std2K_HomeExt = 16,
  Std2K_End = 17,
  Std2K_EndExt = 18,
  Std2K_Bol = 19,
  Std2K_BolExt = 20,
  Std2K_Eol = 23,
  Std2K_EolExt = 24,
  Std2K_PageUp = 27,
  Std2K_PageUpExt = 28,
  Std2K_PageDown = 29,
  Std2K_PageDownExt = 30,
  Std2K_Cancel = 103,
  Std2K_ToggleOvertypeMode = 135,
  Std2K_LeftExtCol = 147,
  Std2K_RightExtCol = 148,
  Std2K_UpExtCol = 149,
  Std2K_DownExtCol = 150,
  Std2K_BolExtCol = 151,
  Std2K_EolExtCol = 152,
};

enum Std97Command : unsigned {
  Std97_F1Help = 311,
  Std97_Escape = 371,
};

struct CommandData {
  CommandGroup group = CommandGroup::Standard2K;
  unsigned id = 0;
  std::optional<std::vector<uint8_t>> extra_data;
  unsigned modifiers = KeyMod::None;

  bool operator==(const CommandData&) const = default;
};

enum class EditCommandKind { UserInput, HostCommand };

struct EditCommand {
  KeyEvent key;
  EditCommandKind kind = EditCommandKind::UserInput;

  bool operator==(const EditCommand&) const = default;
  bool is_user_input() const { return kind == EditCommandKind::UserInput; }
};

CommandData type_char_command(char c, unsigned modifiers = KeyMod::None);

/*empty result: unknown (group, id) or missing TypeChar payload*/
std::optional<EditCommand> decode_command(const CommandData& cmd);

/*empty result: the key has no host representation*/
std::optional<CommandData> encode_key(const KeyEvent& k, bool for_text_input);
