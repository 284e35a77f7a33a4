#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace dockops::common {

/// Base error for all application-level exceptions.
/// Carries the process exit code and machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iExitCode;
  std::string _sErrorCode;

  explicit AppError(int iExitCode, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iExitCode(iExitCode),
        _sErrorCode(std::move(sCode)) {}
};

/// Exit 3: malformed or missing declaration files. Aborts the pass before any mutation.
struct SnapshotError : AppError {
  explicit SnapshotError(std::string sCode, std::string sMsg)
      : AppError(3, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 4: a stack declares a secret whose backing file is absent.
/// Fatal for that stack only; the orchestrator catches it and moves on.
struct SecretNotFoundError : AppError {
  explicit SecretNotFoundError(std::string sCode, std::string sMsg)
      : AppError(4, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 5: a sync pass was requested for a URL that already has a cache entry.
struct AlreadySyncedError : AppError {
  explicit AlreadySyncedError(std::string sCode, std::string sMsg)
      : AppError(5, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 6: another process holds the state store lock.
struct PassLockedError : AppError {
  explicit PassLockedError(std::string sCode, std::string sMsg)
      : AppError(6, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 7: the source tree could not be fetched.
struct FetchError : AppError {
  explicit FetchError(std::string sCode, std::string sMsg)
      : AppError(7, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace dockops::common
