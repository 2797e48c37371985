#pragma once
/*
 * RegisterMap
 *
 * Purpose: named key-sequence storage for recorded and assigned macros.
 * Names: a-z, 0-9 and '"'; A-Z address the lowercase register in append mode.
 */
#include <map>
#include <vector>
#include "key_event.hpp"

class RegisterMap {
public:
  static bool is_valid_name(char name);
  static bool is_append_name(char name);
  static char canonical_name(char name);

  /*nullptr when the register was never set*/
  const std::vector<KeyEvent>* get(char name) const;
  bool set(char name, const std::vector<KeyEvent>& keys, bool append = false);
  void clear(char name);
  std::vector<char> names() const;

private:
  std::map<char, std::vector<KeyEvent>> regs_;
};
