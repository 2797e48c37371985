#include <filesystem>
#include <optional>
#include <glog/logging.h>
#include "editor.hpp"
#include "ncurses_terminal.hpp"

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  std::optional<std::filesystem::path> path;
  if (argc >= 2) path = std::filesystem::path(argv[1]);
  NcursesTerminal term;
  Editor ed(term, path);
  ed.run();
  return 0;
}
