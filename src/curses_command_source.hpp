#pragma once
/*
 * CursesCommandSource
 *
 * Purpose: turn a getch() code into the command tuple the host would report,
 *          so terminal input travels the same decode path as any host.
 * Note: Home/End arrive as Bol/Eol, shifted cursor keys as the Ext family,
 *       Insert as the overtype toggle and Esc as the Standard97 escape.
 */
#include <optional>
#include "key_codec.hpp"

std::optional<CommandData> curses_key_to_command(int ch);
