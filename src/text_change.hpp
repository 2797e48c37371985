#pragma once
/*
 * TextChange
 *
 * Purpose: semantic description of an insertion run, replayable at any caret.
 * Shape: Insert(text) | DeleteLeft(n) | DeleteRight(n) | Combination(a, b).
 * Invariant: a Combination never holds an empty side; the factory collapses it.
 */
#include <memory>
#include <optional>
#include <string>

class TextChange {
public:
  enum class Kind { Insert, DeleteLeft, DeleteRight, Combination };

  static TextChange insert(std::string text);
  static TextChange delete_left(int count);
  static TextChange delete_right(int count);
  static TextChange combination(const TextChange& first, const TextChange& second);

  /*adjacent changes that compose into a single simpler one*/
  static std::optional<TextChange> reduce(const TextChange& left, const TextChange& right);
  static TextChange merge(const TextChange& left, const TextChange& right);

  Kind kind() const { return kind_; }
  bool is_insert() const { return kind_ == Kind::Insert; }
  bool is_delete_left() const { return kind_ == Kind::DeleteLeft; }
  bool is_delete_right() const { return kind_ == Kind::DeleteRight; }
  bool is_combination() const { return kind_ == Kind::Combination; }
  bool is_empty() const;

  const std::string& text() const { return text_; }
  int count() const { return count_; }
  const TextChange& first() const { return *first_; }
  const TextChange& second() const { return *second_; }

  bool operator==(const TextChange& o) const;
  std::string to_string() const;

private:
  TextChange() = default;
  Kind kind_ = Kind::Insert;
  std::string text_;
  int count_ = 0;
  std::shared_ptr<const TextChange> first_;
  std::shared_ptr<const TextChange> second_;
};
