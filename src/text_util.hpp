#pragma once
/*
 * TextUtil
 *
 * Purpose: character classes, word scanning and blank normalization shared
 *          by the dispatcher and the change tracker.
 */
#include <string>

bool is_word_char(unsigned char c);
bool is_blank_text(const std::string& s);
int next_word_start_same_line(const std::string& line, int col);
int first_non_blank(const std::string& line);

/*rewrite a run of blanks with as many tabs as tab_width allows*/
std::string normalize_blanks(const std::string& s, int tab_width);
