#include "macro_engine.hpp"
#include <glog/logging.h>
#include "config.hpp"
#include "key_notation.hpp"

const char* macro_result_message(MacroResult r) {
  switch (r) {
    case MacroResult::Ok: return "";
    case MacroResult::AlreadyRecording: return "already recording";
    case MacroResult::NotRecording: return "not recording";
    case MacroResult::InvalidRegister: return "invalid register name";
    case MacroResult::UnknownRegister: return "register is empty";
    case MacroResult::NoLastMacro: return "no previously used register";
    case MacroResult::DispatchError: return "macro stopped on error";
  }
  return "";
}

/*holds one level of replay depth for the lifetime of a run*/
struct DepthGuard {
  explicit DepthGuard(int& d) : depth(d) { ++depth; }
  DepthGuard(const DepthGuard&) = delete;
  DepthGuard& operator=(const DepthGuard&) = delete;
  ~DepthGuard() { --depth; }
  int& depth;
};

MacroEngine::MacroEngine(IUndoTransactionManager& undo, ICommandDispatcher& dispatcher)
  : undo_(undo), dispatcher_(dispatcher) {}

MacroResult MacroEngine::start_recording(char reg) {
  if (recording_) return MacroResult::AlreadyRecording;
  if (!RegisterMap::is_valid_name(reg)) return MacroResult::InvalidRegister;
  recording_ = reg;
  buffer_.clear();
  LOG(INFO) << "recording @" << reg;
  return MacroResult::Ok;
}

void MacroEngine::record_key(const KeyEvent& k) {
  if (!recording_ || is_replaying()) return;
  buffer_.push_back(k);
}

MacroResult MacroEngine::stop_recording() {
  if (!recording_) return MacroResult::NotRecording;
  char reg = *recording_;
  registers_.set(reg, buffer_);
  LOG(INFO) << "recorded @" << reg << ": " << to_notation(buffer_);
  recording_.reset();
  buffer_.clear();
  return MacroResult::Ok;
}

MacroResult MacroEngine::run(char reg, int count) {
  if (!RegisterMap::is_valid_name(reg)) return MacroResult::InvalidRegister;
  const std::vector<KeyEvent>* stored = registers_.get(reg);
  if (!stored || stored->empty()) return MacroResult::UnknownRegister;
  if (replay_depth_ >= VL_MAX_MACRO_DEPTH) {
    LOG(WARNING) << "macro @" << reg << " nested deeper than " << VL_MAX_MACRO_DEPTH;
    return MacroResult::DispatchError;
  }
  std::vector<KeyEvent> keys = *stored;
  char name = RegisterMap::canonical_name(reg);
  last_run_ = name;
  if (count < 1) count = 1;

  std::optional<UndoTransaction> txn;
  if (replay_depth_ == 0) {
    txn.emplace(undo_, std::string("macro @") + name);
    LOG(INFO) << "running @" << name << " x" << count;
  }
  DepthGuard depth(replay_depth_);
  MacroResult result = MacroResult::Ok;
  for (int i = 0; i < count && result == MacroResult::Ok; ++i) {
    for (const KeyEvent& k : keys) {
      VLOG(4) << "replay " << to_notation(k);
      ProcessResult r = dispatcher_.process(k);
      if (r.is_error()) {
        VLOG(1) << "macro @" << name << " stopped at " << to_notation(k) << ": " << r.reason;
        result = MacroResult::DispatchError;
        break;
      }
    }
  }
  if (replay_depth_ == 1 && result != MacroResult::Ok) LOG(INFO) << "macro @" << name << " aborted";
  return result;
}

MacroResult MacroEngine::run_last(int count) {
  if (!last_run_) return MacroResult::NoLastMacro;
  return run(*last_run_, count);
}
