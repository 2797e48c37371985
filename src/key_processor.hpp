#pragma once
/*
 * KeyProcessor
 *
 * Purpose: host-side glue. Decode a host command, decide whether it is
 *          editor input, and feed it to the dispatcher.
 * Not handled: undecodable commands, host selection commands, AltGr
 *              (Control+Alt) characters and keys the dispatcher declines.
 * Note: a dispatch error still counts as handled; the key was consumed.
 */
#include "dispatcher.hpp"
#include "key_codec.hpp"

class KeyProcessor {
public:
  explicit KeyProcessor(ICommandDispatcher& dispatcher) : dispatcher_(dispatcher) {}
  bool process(const CommandData& cmd);
  bool process_key(const KeyEvent& k);
  const ProcessResult& last_result() const { return last_; }
private:
  ICommandDispatcher& dispatcher_;
  ProcessResult last_ = ProcessResult::not_handled();
};
