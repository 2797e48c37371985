#include "editor.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>
#include "key_notation.hpp"
#include "register_map.hpp"
#include "config.hpp"

static bool parse_switch(const std::vector<std::string>& args, bool current, bool& out) {
  if (args.empty()) { out = !current; return true; }
  const std::string& v = args[0];
  if (v == "on" || v == "1" || v == "true") { out = true; return true; }
  if (v == "off" || v == "0" || v == "false") { out = false; return true; }
  return false;
}

static std::string unquote(const std::string& s) {
  if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) return s.substr(1, s.size() - 2);
  return s;
}

void Editor::register_commands() {
  registry.register_command("w", [this](const std::vector<std::string>& args, std::string& msg){
    if (!args.empty()) return write_buffer(std::filesystem::path(args[0]), msg);
    return write_buffer(file_path, msg);
  });
  registry.register_command("q", [this](const std::vector<std::string>&, std::string& msg){
    return close_or_quit(false, msg);
  });
  registry.register_command("q!", [this](const std::vector<std::string>&, std::string& msg){
    return close_or_quit(true, msg);
  });
  registry.register_command("wq", [this](const std::vector<std::string>& args, std::string& msg){
    std::optional<std::filesystem::path> target = file_path;
    if (!args.empty()) target = std::filesystem::path(args[0]);
    if (!target && !vb.modified()) return close_or_quit(true, msg);
    if (!write_buffer(target, msg)) return false;
    return close_or_quit(true, msg);
  });
  registry.register_command("set tabwidth", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set tabwidth: use :set tabwidth <width>"; return false; }
    const std::string& s = args[0];
    int w = 0;
    auto parsed = std::from_chars(s.data(), s.data() + s.size(), w);
    if (s.empty() || parsed.ec != std::errc() || parsed.ptr != s.data() + s.size()) {
      msg = "set tabwidth: width must be a number";
      return false;
    }
    if (w < 1 || w > VL_MAX_TAB_WIDTH) {
      msg = "set tabwidth: width must be 1.." + std::to_string(VL_MAX_TAB_WIDTH);
      return false;
    }
    vb.settings().tab_width = w;
    msg = "tabwidth=" + std::to_string(w);
    return true;
  });
  registry.register_command("set expandtab", [this](const std::vector<std::string>& args, std::string& msg){
    bool v = false;
    if (!parse_switch(args, vb.settings().expand_tab, v)) { msg = "set expandtab: use :set expandtab on|off"; return false; }
    vb.settings().expand_tab = v;
    msg = v ? "expandtab on" : "expandtab off";
    return true;
  });
  registry.register_command("set onemore", [this](const std::vector<std::string>& args, std::string& msg){
    bool v = false;
    if (!parse_switch(args, vb.settings().virtual_edit_onemore, v)) { msg = "set onemore: use :set onemore on|off"; return false; }
    vb.settings().virtual_edit_onemore = v;
    msg = v ? "virtualedit=onemore" : "virtualedit=";
    return true;
  });
  registry.register_command("set number", [this](const std::vector<std::string>& args, std::string& msg){
    bool v = false;
    if (!parse_switch(args, show_line_numbers, v)) { msg = "set number: use :set number on|off"; return false; }
    show_line_numbers = v;
    msg = v ? "number on" : "number off";
    return true;
  });
  registry.register_command("registers", [this](const std::vector<std::string>&, std::string& msg){
    const RegisterMap& regs = vb.macros().registers();
    std::string out;
    for (char name : regs.names()) {
      if (!out.empty()) out += "  ";
      out += std::string("\"") + name + " " + to_notation(*regs.get(name));
    }
    msg = out.empty() ? "no registers" : out;
    return true;
  });
  registry.register_command("let", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "let: use :let @r=<keys>"; return false; }
    const std::string& a = args[0];
    size_t eq = a.find('=');
    if (a.size() < 3 || a[0] != '@' || eq == std::string::npos) { msg = "let: use :let @r=<keys>"; return false; }
    std::string lhs = a.substr(1, eq - 1);
    while (!lhs.empty() && std::isspace(static_cast<unsigned char>(lhs.back()))) lhs.pop_back();
    if (lhs.size() != 1 || !RegisterMap::is_valid_name(lhs[0])) { msg = "let: invalid register " + lhs; return false; }
    std::string rhs = a.substr(eq + 1);
    rhs.erase(rhs.begin(), std::find_if(rhs.begin(), rhs.end(), [](unsigned char c){ return !std::isspace(c); }));
    vb.macros().registers().set(lhs[0], parse_key_notation(unquote(rhs)));
    msg = std::string("@") + lhs[0] + " set";
    return true;
  });
  registry.register_command("normal", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "normal: use :normal <keys>"; return false; }
    if (vb.mode() != Mode::Normal) vb.process(vim_key_to_key_event(VimKey::Escape));
    ProcessResult r = vb.process(std::string_view(args[0]));
    if (vb.mode() == Mode::Insert) vb.process(vim_key_to_key_event(VimKey::Escape));
    if (r.is_error()) { msg = r.reason; return false; }
    return true;
  });
}
