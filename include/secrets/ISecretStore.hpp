#pragma once

#include <optional>
#include <string>

namespace dockops::secrets {

/// Pure abstract interface for a read-only secret store keyed by id.
class ISecretStore {
 public:
  virtual ~ISecretStore() = default;

  /// Returns nullopt when no secret exists under sId.
  virtual std::optional<std::string> read(const std::string& sId) = 0;
};

}  // namespace dockops::secrets
