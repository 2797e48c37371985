#pragma once
/*
 * Editor
 *
 * Purpose: terminal host shell. Reads keys, reports them as host commands
 *          through the KeyProcessor into the VimBuffer, and owns what the
 *          processor leaves to the host (the ':' command line, file I/O).
 * Note: draws through ITerminal; run() is the only place that calls getch().
 */
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "cmd_registry.hpp"
#include "iterminal.hpp"
#include "key_processor.hpp"
#include "renderer.hpp"
#include "types.hpp"
#include "vim_buffer.hpp"

class Editor {
public:
  Editor(ITerminal& term, const std::optional<std::filesystem::path>& file);
  void run();
  void render();
  void handle_input(int ch);
  CommandStatus execute_command_line(const std::string& line);
  bool load_rc(const std::filesystem::path& path);

  VimBuffer& buffer() { return vb; }
  const VimBuffer& buffer() const { return vb; }
  Mode mode() const { return in_cmdline ? Mode::Command : vb.mode(); }
  const std::string& command_line() const { return cmdline; }
  bool quit_requested() const { return should_quit; }
  bool line_numbers() const { return show_line_numbers; }

private:
  void handle_command_input(int ch);
  void register_commands();
  bool write_buffer(const std::optional<std::filesystem::path>& path, std::string& msg);
  bool close_or_quit(bool force, std::string& msg);

  ITerminal& term;
  VimBuffer vb;
  KeyProcessor processor;
  Renderer renderer;
  CommandRegistry registry;
  Viewport vp;
  std::optional<std::filesystem::path> file_path;
  std::string cmdline;
  bool in_cmdline = false;
  bool show_line_numbers = false;
  bool should_quit = false;
};
