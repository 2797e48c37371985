#pragma once
/*
 * ICommandDispatcher
 *
 * Purpose: the single entry point a key event is fed through, both for live
 *          typing and for macro replay.
 * Result: Handled, NotHandled (left to the host) or Error(reason); an error
 *         aborts a running macro.
 */
#include <string>
#include <utility>
#include "key_event.hpp"

struct ProcessResult {
  enum class Kind { Handled, NotHandled, Error };
  Kind kind = Kind::Handled;
  std::string reason;

  static ProcessResult handled() { return {}; }
  static ProcessResult not_handled() { return {Kind::NotHandled, {}}; }
  static ProcessResult error(std::string why) { return {Kind::Error, std::move(why)}; }
  bool is_handled() const { return kind == Kind::Handled; }
  bool is_error() const { return kind == Kind::Error; }
};

class ICommandDispatcher {
public:
  virtual ~ICommandDispatcher() = default;
  virtual bool can_process(const KeyEvent& k) const = 0;
  virtual ProcessResult process(const KeyEvent& k) = 0;
};
