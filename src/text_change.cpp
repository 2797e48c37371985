#include "text_change.hpp"
#include <utility>

TextChange TextChange::insert(std::string text) {
  TextChange c;
  c.kind_ = Kind::Insert;
  c.text_ = std::move(text);
  return c;
}

TextChange TextChange::delete_left(int count) {
  TextChange c;
  c.kind_ = Kind::DeleteLeft;
  c.count_ = count;
  return c;
}

TextChange TextChange::delete_right(int count) {
  TextChange c;
  c.kind_ = Kind::DeleteRight;
  c.count_ = count;
  return c;
}

TextChange TextChange::combination(const TextChange& first, const TextChange& second) {
  if (first.is_empty()) return second;
  if (second.is_empty()) return first;
  TextChange c;
  c.kind_ = Kind::Combination;
  c.first_ = std::make_shared<const TextChange>(first);
  c.second_ = std::make_shared<const TextChange>(second);
  return c;
}

bool TextChange::is_empty() const {
  switch (kind_) {
    case Kind::Insert: return text_.empty();
    case Kind::DeleteLeft:
    case Kind::DeleteRight: return count_ == 0;
    case Kind::Combination: return false;
  }
  return false;
}

std::optional<TextChange> TextChange::reduce(const TextChange& left, const TextChange& right) {
  switch (left.kind_) {
    case Kind::Insert:
      if (right.is_insert()) return insert(left.text_ + right.text_);
      if (right.is_delete_left()) {
        int len = static_cast<int>(left.text_.size());
        if (right.count_ <= len) return insert(left.text_.substr(0, len - right.count_));
        return delete_left(right.count_ - len);
      }
      return std::nullopt;
    case Kind::DeleteLeft:
      if (right.is_delete_left()) return delete_left(left.count_ + right.count_);
      return std::nullopt;
    case Kind::DeleteRight:
      if (right.is_delete_right()) return delete_right(left.count_ + right.count_);
      return std::nullopt;
    case Kind::Combination:
      if (auto r = reduce(*left.second_, right)) return combination(*left.first_, *r);
      return std::nullopt;
  }
  return std::nullopt;
}

TextChange TextChange::merge(const TextChange& left, const TextChange& right) {
  if (auto r = reduce(left, right)) return *r;
  return combination(left, right);
}

bool TextChange::operator==(const TextChange& o) const {
  if (kind_ != o.kind_) return false;
  switch (kind_) {
    case Kind::Insert: return text_ == o.text_;
    case Kind::DeleteLeft:
    case Kind::DeleteRight: return count_ == o.count_;
    case Kind::Combination: return *first_ == *o.first_ && *second_ == *o.second_;
  }
  return false;
}

std::string TextChange::to_string() const {
  switch (kind_) {
    case Kind::Insert: return "Insert(\"" + text_ + "\")";
    case Kind::DeleteLeft: return "DeleteLeft(" + std::to_string(count_) + ")";
    case Kind::DeleteRight: return "DeleteRight(" + std::to_string(count_) + ")";
    case Kind::Combination: return "Combination(" + first_->to_string() + ", " + second_->to_string() + ")";
  }
  return "?";
}
