#pragma once
/*
 * KeyNotation
 *
 * Purpose: convert between key sequences and the <Esc>/<C-a>/<Left> text form
 *          used by the rc file, :let and :registers.
 * Note: an unknown or unterminated <...> is taken literally, one char at a time.
 */
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "key_event.hpp"

std::optional<KeyEvent> key_from_notation(std::string_view name);
std::vector<KeyEvent> parse_key_notation(std::string_view text);
std::string to_notation(const KeyEvent& k);
std::string to_notation(const std::vector<KeyEvent>& keys);
