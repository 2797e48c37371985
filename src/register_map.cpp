#include "register_map.hpp"
#include <cctype>

bool RegisterMap::is_valid_name(char name) {
  return std::isalnum(static_cast<unsigned char>(name)) != 0 || name == '"';
}

bool RegisterMap::is_append_name(char name) {
  return std::isupper(static_cast<unsigned char>(name)) != 0;
}

char RegisterMap::canonical_name(char name) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(name)));
}

const std::vector<KeyEvent>* RegisterMap::get(char name) const {
  auto it = regs_.find(canonical_name(name));
  if (it == regs_.end()) return nullptr;
  return &it->second;
}

bool RegisterMap::set(char name, const std::vector<KeyEvent>& keys, bool append) {
  if (!is_valid_name(name)) return false;
  auto& slot = regs_[canonical_name(name)];
  if (append || is_append_name(name)) slot.insert(slot.end(), keys.begin(), keys.end());
  else slot = keys;
  return true;
}

void RegisterMap::clear(char name) { regs_.erase(canonical_name(name)); }

std::vector<char> RegisterMap::names() const {
  std::vector<char> out;
  out.reserve(regs_.size());
  for (const auto& [name, keys] : regs_) out.push_back(name);
  return out;
}
