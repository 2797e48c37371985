#include "key_processor.hpp"
#include <glog/logging.h>

static bool is_alt_gr(const KeyEvent& k) {
  return k.key == VimKey::RawCharacter && k.has(KeyMod::Control) && k.has(KeyMod::Alt);
}

bool KeyProcessor::process(const CommandData& cmd) {
  last_ = ProcessResult::not_handled();
  std::optional<EditCommand> ec = decode_command(cmd);
  if (!ec) return false;
  if (!ec->is_user_input()) {
    VLOG(2) << "host command left to the host";
    return false;
  }
  return process_key(ec->key);
}

bool KeyProcessor::process_key(const KeyEvent& k) {
  last_ = ProcessResult::not_handled();
  if (is_alt_gr(k)) return false;
  if (!dispatcher_.can_process(k)) return false;
  last_ = dispatcher_.process(k);
  return last_.kind != ProcessResult::Kind::NotHandled;
}
