#include "text_change_tracker.hpp"
#include <glog/logging.h>
#include "text_util.hpp"

TextChangeTracker::TextChangeTracker(Normalizer normalize_blanks) : normalize_(std::move(normalize_blanks)) {}

void TextChangeTracker::set_enabled(bool on) {
  if (enabled_ == on) return;
  enabled_ = on;
  if (!on) clear();
}

void TextChangeTracker::clear() {
  current_.reset();
  last_caret_after_edit_.reset();
}

void TextChangeTracker::fire(const std::vector<ChangeHandler>& handlers, const TextChange& c) {
  for (const auto& h : handlers) h(c);
}

TextChange TextChangeTracker::classify(const BufferEdit& e) const {
  int deleted = static_cast<int>(e.deleted_text.size());
  if (deleted == 0) return TextChange::insert(e.inserted_text);
  if (e.inserted_text.empty()) {
    if (e.caret_before <= e.position) return TextChange::delete_right(deleted);
    return TextChange::delete_left(deleted);
  }
  if (normalize_ && is_blank_text(e.deleted_text) && is_blank_text(e.inserted_text)) {
    std::string old_text = normalize_(e.deleted_text);
    std::string new_text = normalize_(e.inserted_text);
    if (new_text.compare(0, old_text.size(), old_text) == 0) {
      return TextChange::insert(new_text.substr(old_text.size()));
    }
  }
  return TextChange::combination(TextChange::delete_left(deleted), TextChange::insert(e.inserted_text));
}

void TextChangeTracker::on_buffer_edit(const BufferEdit& e) {
  if (!enabled_) return;
  TextChange change = classify(e);
  int deleted = static_cast<int>(e.deleted_text.size());
  if (current_ && last_caret_after_edit_) {
    int end = *last_caret_after_edit_;
    if (e.position == end || e.position + deleted == end) {
      current_ = TextChange::merge(*current_, change);
    } else {
      VLOG(3) << "tracker: edit at " << e.position << " not contiguous with " << end;
      TextChange done = *current_;
      fire(completed_handlers_, done);
      current_ = change;
    }
  } else {
    current_ = change;
  }
  last_caret_after_edit_ = e.position + static_cast<int>(e.inserted_text.size());
  fire(changed_handlers_, *current_);
}

void TextChangeTracker::complete_change() {
  if (!current_) return;
  TextChange done = *current_;
  clear();
  fire(completed_handlers_, done);
}
