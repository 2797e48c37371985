#include "input.hpp"
#include <algorithm>
#include "config.hpp"

static int append_digit(int count, int d) {
  long long next = static_cast<long long>(count) * 10 + d;
  return static_cast<int>(std::min<long long>(next, VL_MAX_COUNT));
}

bool Input::consume_digit(char ch) {
  if (ch >= '1' && ch <= '9') {
    count_ = append_digit(count_, ch - '0');
    return true;
  }
  if (ch == '0' && count_ > 0) {
    count_ = append_digit(count_, 0);
    return true;
  }
  return false;
}

int Input::take_count() {
  int c = count_;
  count_ = 0;
  return c;
}

void Input::set_pending(char op, int count) {
  pending_ = op;
  pending_count_ = count;
}

void Input::reset() {
  pending_ = 0;
  pending_count_ = 0;
  count_ = 0;
}
