#include "curses_command_source.hpp"
#include <ncurses.h>
#include <glog/logging.h>

static constexpr int ESC = 27;

static CommandData host_command(unsigned id, unsigned modifiers = KeyMod::None) {
  CommandData cmd;
  cmd.group = CommandGroup::Standard2K;
  cmd.id = id;
  cmd.modifiers = modifiers;
  return cmd;
}

std::optional<CommandData> curses_key_to_command(int ch) {
  switch (ch) {
    case ESC: {
      CommandData cmd;
      cmd.group = CommandGroup::Standard97;
      cmd.id = Std97_Escape;
      return cmd;
    }
    case KEY_LEFT: return host_command(Std2K_Left);
    case KEY_RIGHT: return host_command(Std2K_Right);
    case KEY_UP: return host_command(Std2K_Up);
    case KEY_DOWN: return host_command(Std2K_Down);
    case KEY_SLEFT: return host_command(Std2K_LeftExt, KeyMod::Shift);
    case KEY_SRIGHT: return host_command(Std2K_RightExt, KeyMod::Shift);
    case KEY_SR: return host_command(Std2K_UpExt, KeyMod::Shift);
    case KEY_SF: return host_command(Std2K_DownExt, KeyMod::Shift);
    case KEY_HOME: return host_command(Std2K_Bol);
    case KEY_END: return host_command(Std2K_Eol);
    case KEY_SHOME: return host_command(Std2K_BolExt, KeyMod::Shift);
    case KEY_SEND: return host_command(Std2K_EolExt, KeyMod::Shift);
    case KEY_PPAGE: return host_command(Std2K_PageUp);
    case KEY_NPAGE: return host_command(Std2K_PageDown);
    case KEY_SPREVIOUS: return host_command(Std2K_PageUpExt, KeyMod::Shift);
    case KEY_SNEXT: return host_command(Std2K_PageDownExt, KeyMod::Shift);
    case KEY_IC: return host_command(Std2K_ToggleOvertypeMode);
    case KEY_DC: return host_command(Std2K_Delete);
    case KEY_BTAB: return host_command(Std2K_BackTab);
    case KEY_BACKSPACE: case 127: case '\b': return host_command(Std2K_Backspace);
    case KEY_ENTER: case '\n': case '\r': return host_command(Std2K_Return);
    case '\t': return host_command(Std2K_Tab);
    case KEY_F(1): {
      CommandData cmd;
      cmd.group = CommandGroup::Standard97;
      cmd.id = Std97_F1Help;
      return cmd;
    }
    default: break;
  }
  if (ch > 0 && ch < 127) return type_char_command(static_cast<char>(ch));
  VLOG(2) << "no host command for curses key " << ch;
  return std::nullopt;
}
