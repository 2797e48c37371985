#pragma once
/*
 * UndoTransaction
 *
 * Purpose: interface for opening atomic undo scopes, plus a move-only RAII
 *          guard that completes the scope when it goes out of scope.
 * Usage: UndoTransaction t(mgr, "macro"); ... ; t.cancel() to roll back.
 */
#include <string>

struct UndoTransactionHandle {
  int id = -1;
  bool valid() const { return id >= 0; }
};

class IUndoTransactionManager {
public:
  virtual ~IUndoTransactionManager() = default;
  virtual UndoTransactionHandle open_transaction(const std::string& name) = 0;
  virtual void complete_transaction(UndoTransactionHandle h) = 0;
  virtual void cancel_transaction(UndoTransactionHandle h) = 0;
};

class UndoTransaction {
public:
  UndoTransaction(IUndoTransactionManager& mgr, const std::string& name) : mgr_(&mgr), handle_(mgr.open_transaction(name)) {}
  UndoTransaction(const UndoTransaction&) = delete;
  UndoTransaction& operator=(const UndoTransaction&) = delete;
  UndoTransaction(UndoTransaction&& other) noexcept : mgr_(other.mgr_), handle_(other.handle_) { other.handle_ = {}; }
  UndoTransaction& operator=(UndoTransaction&& other) noexcept {
    if (this != &other) { complete(); mgr_ = other.mgr_; handle_ = other.handle_; other.handle_ = {}; }
    return *this;
  }
  ~UndoTransaction() { complete(); }
  bool open() const { return handle_.valid(); }
  void complete() { if (handle_.valid()) { mgr_->complete_transaction(handle_); handle_ = {}; } }
  void cancel() { if (handle_.valid()) { mgr_->cancel_transaction(handle_); handle_ = {}; } }
private:
  IUndoTransactionManager* mgr_;
  UndoTransactionHandle handle_;
};
