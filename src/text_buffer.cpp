#include "text_buffer.hpp"
#include <algorithm>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include "config.hpp"
#include "posix_fd.hpp"

std::vector<std::string> split_lines(const std::string& block) {
  std::vector<std::string> lines;
  size_t st = 0;
  while (st <= block.size()) {
    size_t pos = block.find('\n', st);
    if (pos == std::string::npos) { lines.emplace_back(block.substr(st)); break; }
    lines.emplace_back(block.substr(st, pos - st));
    st = pos + 1;
  }
  return lines;
}

TextBuffer::TextBuffer() { ensure_not_empty(); }

TextBuffer::TextBuffer(std::vector<std::string> lines) : lines_(std::move(lines)) { ensure_not_empty(); }

void TextBuffer::ensure_not_empty() {
  if (lines_.empty()) lines_.emplace_back();
}

void TextBuffer::init_from_lines(std::vector<std::string> lines) {
  lines_ = std::move(lines);
  ensure_not_empty();
}

void TextBuffer::insert_line(int row, const std::string& s) {
  row = std::clamp(row, 0, line_count());
  lines_.insert(lines_.begin() + row, s);
}

void TextBuffer::erase_line(int row) {
  if (row < 0 || row >= line_count()) return;
  lines_.erase(lines_.begin() + row);
  ensure_not_empty();
}

void TextBuffer::erase_lines(int start_row, int end_row) {
  start_row = std::clamp(start_row, 0, line_count());
  end_row = std::clamp(end_row, start_row, line_count());
  lines_.erase(lines_.begin() + start_row, lines_.begin() + end_row);
  ensure_not_empty();
}

void TextBuffer::replace_line(int row, const std::string& s) {
  if (row < 0 || row >= line_count()) return;
  lines_[static_cast<size_t>(row)] = s;
}

int TextBuffer::offset_of(Cursor c) const {
  int row = std::clamp(c.row, 0, line_count() - 1);
  int off = 0;
  for (int r = 0; r < row; ++r) off += static_cast<int>(lines_[r].size()) + 1;
  return off + std::clamp(c.col, 0, static_cast<int>(lines_[row].size()));
}

Cursor TextBuffer::cursor_at(int offset) const {
  offset = std::max(0, offset);
  for (int r = 0; r < line_count(); ++r) {
    int len = static_cast<int>(lines_[r].size());
    if (offset <= len) return {r, offset};
    offset -= len + 1;
  }
  int last = line_count() - 1;
  return {last, static_cast<int>(lines_[last].size())};
}

int TextBuffer::size() const {
  int n = 0;
  for (const auto& s : lines_) n += static_cast<int>(s.size()) + 1;
  return n - 1;
}

std::string TextBuffer::text() const {
  std::string out;
  for (int r = 0; r < line_count(); ++r) {
    if (r) out.push_back('\n');
    out += lines_[r];
  }
  return out;
}

std::string TextBuffer::slice(Cursor at, int len) const {
  std::string out;
  int row = std::clamp(at.row, 0, line_count() - 1);
  int col = std::clamp(at.col, 0, static_cast<int>(lines_[row].size()));
  while (len > 0) {
    const std::string& s = lines_[row];
    int take = std::min(len, static_cast<int>(s.size()) - col);
    out.append(s, static_cast<size_t>(col), static_cast<size_t>(take));
    len -= take;
    if (len == 0 || row + 1 >= line_count()) break;
    out.push_back('\n');
    len--;
    row++;
    col = 0;
  }
  return out;
}

Cursor TextBuffer::replace_text(Cursor at, int erase_len, const std::string& text) {
  int start = offset_of(at);
  Cursor from = cursor_at(start);
  Cursor to = cursor_at(start + std::max(0, erase_len));
  std::string merged = lines_[from.row].substr(0, from.col) + text + lines_[to.row].substr(to.col);
  std::vector<std::string> pieces = split_lines(merged);
  lines_.erase(lines_.begin() + from.row, lines_.begin() + to.row + 1);
  lines_.insert(lines_.begin() + from.row, pieces.begin(), pieces.end());
  return cursor_at(start + static_cast<int>(text.size()));
}

/*mmap the whole file and cut it at '\n'; a '\r' before the break is dropped*/
static bool read_lines(const std::filesystem::path& path, std::vector<std::string>& out, std::string& msg) {
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  msg = std::string("opened file: ") + path.string();
  if (n == 0) return true;
  MappedRegion region(fd.get(), n);
  if (!region.valid()) { msg = std::string("can not mmap file: ") + path.string(); return false; }
  const char* data = region.data();
  size_t start = 0;
  auto cut = [&](size_t end) {
    if (end > start && data[end - 1] == '\r') end--;
    out.emplace_back(data + start, end - start);
  };
  for (size_t i = 0; i < n; ++i) {
    if (data[i] != '\n') continue;
    cut(i);
    start = i + 1;
  }
  if (start < n) cut(n);
  return true;
}

TextBuffer TextBuffer::from_file(const std::filesystem::path& path, std::string& msg, bool& ok) {
  std::vector<std::string> ls;
  ok = read_lines(path, ls, msg);
  return TextBuffer(std::move(ls));
}

bool TextBuffer::write_file(const std::filesystem::path& path, std::string& msg) const {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) {
    msg = std::string("write file failed: ") + tmp.string();
    return false;
  }
  std::vector<char> buf;
  buf.reserve(static_cast<size_t>(VL_WRITE_CHUNK_SIZE));
  auto flush_buf = [&]() -> bool {
    if (!write_all(ufd.get(), buf.data(), buf.size())) { msg = std::string("write file failed: ") + tmp.string(); return false; }
    buf.clear();
    return true;
  };
  for (int i = 0; i < line_count(); ++i) {
    const std::string& s = lines_[i];
    if (buf.size() + s.size() + 1 > buf.capacity() && !flush_buf()) return false;
    if (s.size() >= buf.capacity()) {
      if (!write_all(ufd.get(), s.data(), s.size())) { msg = std::string("write file failed: ") + tmp.string(); return false; }
    } else {
      buf.insert(buf.end(), s.begin(), s.end());
    }
    if (i + 1 < line_count()) buf.push_back('\n');
  }
  if (!buf.empty() && !flush_buf()) return false;
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
#else
  if (::fdatasync(ufd.get()) != 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
#endif
  ufd.reset();
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) { msg = std::string("write file failed: ") + path.string(); return false; }
  msg = std::string("saved file: ") + path.string();
  return true;
}
