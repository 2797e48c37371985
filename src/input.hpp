#pragma once
/*
 * Input
 *
 * Purpose: Normal mode pending state: count prefix and a one-key operator
 *          (d, y, r, q, @) waiting for its argument.
 * Note: the count typed before an operator travels with it. It stops
 *       growing at VL_MAX_COUNT.
 */

class Input {
public:
  bool consume_digit(char ch);
  bool has_count() const { return count_ > 0; }
  int take_count();
  void set_pending(char op, int count);
  bool has_pending() const { return pending_ != 0; }
  char pending() const { return pending_; }
  int pending_count() const { return pending_count_; }
  void reset();
private:
  char pending_ = 0;
  int pending_count_ = 0;
  int count_ = 0;
};
