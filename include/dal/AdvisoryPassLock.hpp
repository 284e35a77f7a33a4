#pragma once

#include <cstdint>
#include <optional>

#include "dal/ConnectionPool.hpp"
#include "dal/IPassLock.hpp"

namespace dockops::dal {

/// PostgreSQL session-level advisory lock held on a pinned pooled connection.
/// Any process sharing the database contends for the same key.
/// Class abbreviation: apl
class AdvisoryPassLock : public IPassLock {
 public:
  /// ASCII "dockops" packed into a bigint.
  static constexpr int64_t kDefaultKey = 0x646F636B6F7073;

  explicit AdvisoryPassLock(ConnectionPool& cpPool, int64_t iKey = kDefaultKey);
  ~AdvisoryPassLock() override;

  AdvisoryPassLock(const AdvisoryPassLock&) = delete;
  AdvisoryPassLock& operator=(const AdvisoryPassLock&) = delete;

  /// Throws common::PassLockedError if another session holds the key.
  void lock() override;
  void unlock() override;

  bool isHeld() const { return _ocgHeld.has_value(); }

 private:
  ConnectionPool& _cpPool;
  int64_t _iKey;
  std::optional<ConnectionGuard> _ocgHeld;
};

}  // namespace dockops::dal
