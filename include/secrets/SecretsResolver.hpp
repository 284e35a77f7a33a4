#pragma once

#include "common/Types.hpp"
#include "secrets/ISecretStore.hpp"

namespace dockops::secrets {

/// Validates a stack's declared secrets against the store and builds its deploy environment.
/// Class abbreviation: sr
class SecretsResolver {
 public:
  explicit SecretsResolver(ISecretStore& ssStore);
  ~SecretsResolver();

  /// Map each SecretSpec's env name to the secret value.
  /// Throws common::SecretNotFoundError naming every missing id; nothing is returned
  /// partially.
  common::EnvMap resolve(const common::StackDeclaration& sdStack);

 private:
  ISecretStore& _ssStore;
};

}  // namespace dockops::secrets
