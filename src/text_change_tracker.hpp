#pragma once
/*
 * TextChangeTracker
 *
 * Purpose: fold raw buffer edits of an insertion run into one TextChange.
 * States: disabled, idle (no current change), accumulating.
 * Events: on_changed after every update, on_change_completed when a run ends
 *         (explicitly or because an edit was not contiguous with the last one).
 * Note: disabling drops the pending change without firing anything.
 */
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "text_change.hpp"

struct BufferEdit {
  int position = 0;
  std::string deleted_text;
  std::string inserted_text;
  int caret_before = 0;
};

class TextChangeTracker {
public:
  using Normalizer = std::function<std::string(const std::string&)>;
  using ChangeHandler = std::function<void(const TextChange&)>;

  explicit TextChangeTracker(Normalizer normalize_blanks = {});

  void set_enabled(bool on);
  bool enabled() const { return enabled_; }
  const std::optional<TextChange>& current_change() const { return current_; }

  void on_buffer_edit(const BufferEdit& e);
  void complete_change();

  void on_changed(ChangeHandler h) { changed_handlers_.push_back(std::move(h)); }
  void on_change_completed(ChangeHandler h) { completed_handlers_.push_back(std::move(h)); }

  TextChange classify(const BufferEdit& e) const;

private:
  void fire(const std::vector<ChangeHandler>& handlers, const TextChange& c);
  void clear();

  Normalizer normalize_;
  bool enabled_ = false;
  std::optional<TextChange> current_;
  std::optional<int> last_caret_after_edit_;
  std::vector<ChangeHandler> changed_handlers_;
  std::vector<ChangeHandler> completed_handlers_;
};
