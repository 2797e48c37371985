#undef NDEBUG
#include "text_buffer.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

using Lines = std::vector<std::string>;

static void test_lines() {
  TextBuffer b(Lines{"a", "b", "c"});
  assert(b.line_count() == 3);
  b.insert_line(1, "x");
  assert(b.line_count() == 4);
  assert(b.line(1) == std::string("x"));
  b.erase_line(2);
  assert(b.line_count() == 3);
  assert(b.line(0) == std::string("a"));
  assert(b.line(1) == std::string("x"));
  assert(b.line(2) == std::string("c"));
  b.replace_line(2, "z");
  assert(b.line(2) == std::string("z"));
  b.erase_lines(1, 3);
  assert(b.line_count() == 1);
  assert(b.line(0) == std::string("a"));
  b.erase_line(0);
  assert(b.line_count() == 1 && b.line(0).empty());
}

static void test_offsets() {
  TextBuffer b(Lines{"cat", "", "dog"});
  assert(b.size() == 8);
  assert(b.offset_of({0, 2}) == 2);
  assert(b.offset_of({1, 0}) == 4);
  assert(b.offset_of({2, 1}) == 6);
  assert(b.offset_of({0, 99}) == 3);
  assert(b.cursor_at(3) == (Cursor{0, 3}));
  assert(b.cursor_at(5) == (Cursor{2, 0}));
  assert(b.cursor_at(100) == (Cursor{2, 3}));
  assert(b.slice({0, 1}, 4) == "at\n\n");
  assert(b.slice({0, 2}, 100) == "t\n\ndog");
}

static void test_replace_text() {
  TextBuffer b(Lines{"hello world"});
  Cursor end = b.replace_text({0, 5}, 1, "\n");
  assert(b.line_count() == 2);
  assert(b.line(0) == "hello" && b.line(1) == "world");
  assert(end == (Cursor{1, 0}));
  end = b.replace_text({0, 5}, 1, ", ");
  assert(b.text() == "hello, world");
  assert(end == (Cursor{0, 7}));
  b.replace_text({0, 0}, 0, "a\nb\n");
  assert(b.line_count() == 3 && b.line(2) == "hello, world");
  assert(split_lines("x\n").size() == 2);
}

static void test_file_round_trip() {
  std::filesystem::path dir = std::filesystem::temp_directory_path() / ("vimlayer_tb_" + std::to_string(::getpid()));
  std::filesystem::create_directories(dir);
  std::filesystem::path p = dir / "f.txt";

  TextBuffer b(Lines{"one", "\ttwo", ""});
  std::string msg;
  assert(b.write_file(p, msg));
  assert(!std::filesystem::exists(dir / "f.txt.tmp"));
  std::ifstream in(p, std::ios::binary);
  std::stringstream ss; ss << in.rdbuf();
  assert(ss.str() == "one\n\ttwo\n");

  {
    std::ofstream out(dir / "crlf.txt", std::ios::binary);
    out << "a\r\nb\r\n";
  }
  bool ok = false;
  TextBuffer r = TextBuffer::from_file(dir / "crlf.txt", msg, ok);
  assert(ok && r.line_count() == 2);
  assert(r.text() == "a\nb");
  assert(msg == "opened file: " + (dir / "crlf.txt").string());

  {
    std::ofstream out(dir / "empty.txt", std::ios::binary);
  }
  TextBuffer e = TextBuffer::from_file(dir / "empty.txt", msg, ok);
  assert(ok && e.line_count() == 1 && e.line(0).empty());

  {
    std::ofstream out(dir / "tail.txt", std::ios::binary);
    out << "x\n\ny";
  }
  TextBuffer t = TextBuffer::from_file(dir / "tail.txt", msg, ok);
  assert(ok && t.line_count() == 3 && t.line(1).empty());
  TextBuffer missing = TextBuffer::from_file(dir / "nope.txt", msg, ok);
  assert(!ok && missing.line_count() == 1);

  std::filesystem::remove_all(dir);
}

int main() {
  test_lines();
  test_offsets();
  test_replace_text();
  test_file_round_trip();
  return 0;
}
