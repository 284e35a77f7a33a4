#include "dal/AdvisoryPassLock.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <pqxx/pqxx>

#include <stdexcept>

namespace dockops::dal {

AdvisoryPassLock::AdvisoryPassLock(ConnectionPool& cpPool, int64_t iKey)
    : _cpPool(cpPool), _iKey(iKey) {}

AdvisoryPassLock::~AdvisoryPassLock() {
  if (!_ocgHeld) return;
  try {
    unlock();
  } catch (const std::exception& ex) {
    // The server drops session locks when the connection closes
    common::Logger::get()->error("Failed to release state store lock: {}", ex.what());
  }
}

void AdvisoryPassLock::lock() {
  if (_ocgHeld) {
    throw std::logic_error("AdvisoryPassLock is already held by this instance");
  }

  auto cg = _cpPool.checkout();
  bool bAcquired = false;
  {
    pqxx::nontransaction ntx(*cg);
    bAcquired = ntx.exec("SELECT pg_try_advisory_lock($1)", pqxx::params{_iKey})
                    .one_row()[0]
                    .as<bool>();
  }

  if (!bAcquired) {
    throw common::PassLockedError(
        "pass_in_progress", "Another dockops pass currently holds the state store lock");
  }

  _ocgHeld.emplace(std::move(cg));
  common::Logger::get()->debug("State store lock {} acquired", _iKey);
}

void AdvisoryPassLock::unlock() {
  if (!_ocgHeld) return;

  // Release the connection even if the unlock query fails
  auto cg = std::move(*_ocgHeld);
  _ocgHeld.reset();

  pqxx::nontransaction ntx(*cg);
  ntx.exec("SELECT pg_advisory_unlock($1)", pqxx::params{_iKey});
  common::Logger::get()->debug("State store lock {} released", _iKey);
}

}  // namespace dockops::dal
