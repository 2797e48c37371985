#include "editor.hpp"
#include <ncurses.h>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <utility>
#include <glog/logging.h>
#include "config.hpp"
#include "curses_command_source.hpp"

static constexpr int ESC = 27;

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return s.substr(i, j - i);
}

Editor::Editor(ITerminal& t, const std::optional<std::filesystem::path>& file)
  : term(t), processor(vb), file_path(file) {
  if (file) {
    std::error_code ec;
    if (std::filesystem::exists(*file, ec)) {
      bool ok = true; std::string m;
      TextBuffer b = TextBuffer::from_file(*file, m, ok);
      if (ok) vb.set_text(b.lines());
      else LOG(WARNING) << m;
      vb.set_message(m);
    } else {
      vb.set_message("new file: " + file->string());
    }
  }
  register_commands();
  if (const char* home = std::getenv("HOME")) {
    std::error_code ec;
    auto rc = std::filesystem::path(home) / VL_RC_FILE;
    if (std::filesystem::exists(rc, ec)) load_rc(rc);
  }
}

void Editor::run() {
  while (!should_quit) {
    render();
    int ch = getch();
    if (ch == ERR) continue;
    handle_input(ch);
  }
}

void Editor::render() {
  RenderState st;
  st.buf = &vb.buffer();
  st.cur = vb.cursor();
  st.mode = mode();
  st.file_path = file_path;
  st.modified = vb.modified();
  st.recording = vb.macros().recording_register();
  st.message = vb.message();
  st.cmdline = cmdline;
  st.show_line_numbers = show_line_numbers;
  st.tab_width = vb.settings().tab_width;
  renderer.render(term, st, vp);
}

void Editor::handle_input(int ch) {
  if (in_cmdline) { handle_command_input(ch); return; }
  std::optional<CommandData> cmd = curses_key_to_command(ch);
  if (!cmd) return;
  vb.set_message("");
  if (processor.process(*cmd)) return;
  std::optional<EditCommand> ec = decode_command(*cmd);
  if (ec && ec->key.is_char(':') && vb.mode() == Mode::Normal) {
    in_cmdline = true;
    cmdline.clear();
  }
}

void Editor::handle_command_input(int ch) {
  if (ch == ESC) { in_cmdline = false; return; }
  if (ch == KEY_BACKSPACE || ch == 127 || ch == '\b') {
    if (cmdline.empty()) in_cmdline = false;
    else cmdline.pop_back();
    return;
  }
  if (ch == '\n' || ch == KEY_ENTER || ch == '\r') {
    in_cmdline = false;
    execute_command_line(cmdline);
    return;
  }
  if (ch >= 32 && ch <= 126) cmdline.push_back((char)ch);
}

CommandStatus Editor::execute_command_line(const std::string& line) {
  std::string s = trim(line);
  if (!s.empty() && s[0] == ':') s.erase(s.begin());
  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  std::string rest; std::getline(iss, rest);
  rest = trim(rest);
  std::vector<std::string> args;
  if (cmd == "let" || cmd == "normal" || cmd == "norm") {
    if (!rest.empty()) args.push_back(rest);
    if (cmd == "norm") cmd = "normal";
  } else {
    std::istringstream as(rest);
    std::string a; while (as >> a) args.push_back(a);
  }
  std::string name = cmd;
  if (cmd == "set" && !args.empty()) {
    std::string opt = args[0];
    std::string value;
    size_t eq = opt.find('=');
    if (eq != std::string::npos) {
      value = opt.substr(eq + 1);
      opt = opt.substr(0, eq);
    }
    name = std::string("set ") + opt;
    std::vector<std::string> subargs;
    if (!value.empty()) subargs.push_back(value);
    for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
    args = std::move(subargs);
  }
  std::string msg;
  CommandStatus st = registry.execute(name, args, msg);
  vb.set_message(msg);
  if (st != CommandStatus::Ok) VLOG(1) << "ex command '" << s << "': " << msg;
  return st;
}

bool Editor::load_rc(const std::filesystem::path& path) {
  std::string msg; bool ok = false;
  TextBuffer rc = TextBuffer::from_file(path, msg, ok);
  if (!ok) {
    LOG(WARNING) << msg;
    vb.set_message(msg);
    return false;
  }
  bool all_ok = true;
  int lineno = 0;
  for (const std::string& raw : rc.lines()) {
    lineno++;
    std::string s = trim(raw);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    if (execute_command_line(s) != CommandStatus::Ok) {
      LOG(WARNING) << path.string() << ":" << lineno << ": " << vb.message();
      all_ok = false;
    }
  }
  LOG(INFO) << "loaded " << path.string();
  return all_ok;
}

bool Editor::write_buffer(const std::optional<std::filesystem::path>& path, std::string& msg) {
  if (!path) { msg = "no file name, use :w <path>"; return false; }
  if (!vb.buffer().write_file(*path, msg)) {
    LOG(WARNING) << msg;
    return false;
  }
  if (!file_path) file_path = path;
  vb.set_modified(false);
  return true;
}

bool Editor::close_or_quit(bool force, std::string& msg) {
  if (!force && vb.modified()) {
    msg = "no write since last change (add ! to override)";
    return false;
  }
  should_quit = true;
  return true;
}
