#pragma once

namespace dockops::dal {

/// Exclusive lock over the state store for one pass.
/// Meets BasicLockable so callers can scope it with std::lock_guard.
/// lock() throws common::PassLockedError instead of blocking when another holder exists.
class IPassLock {
 public:
  virtual ~IPassLock() = default;

  virtual void lock() = 0;
  virtual void unlock() = 0;
};

}  // namespace dockops::dal
