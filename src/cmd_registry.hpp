#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch Ex commands (":set tabwidth 2", ":let @a=...").
 * Design: map name -> handler(args, msg); the handler reports failure by
 *         returning false with msg set. Editor parses and routes.
 */
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

enum class CommandStatus { Ok, Failed, Unknown };

class CommandRegistry {
public:
  using Handler = std::function<bool(const std::vector<std::string>&, std::string&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool has(const std::string& name) const { return map_.count(name) != 0; }
  CommandStatus execute(const std::string& name, const std::vector<std::string>& args, std::string& msg) const {
    auto it = map_.find(name);
    if (it == map_.end()) { msg = "unknown command: " + name; return CommandStatus::Unknown; }
    return it->second(args, msg) ? CommandStatus::Ok : CommandStatus::Failed;
  }
private:
  std::unordered_map<std::string, Handler> map_;
};
