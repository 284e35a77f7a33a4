#pragma once

#include <filesystem>
#include <string>

#include "common/Types.hpp"
#include "dal/IStackRepository.hpp"
#include "runtime/IContainerRuntime.hpp"

namespace dockops::core {

/// Per-stack change detection and deploy decision.
/// Class abbreviation: sr
class StackReconciler {
 public:
  StackReconciler(dal::IStackRepository& srRepo, runtime::IContainerRuntime& crRuntime);
  ~StackReconciler();

  /// Deploy sDefinition unless the stored row already has the same hash with
  /// status deployed. The outcome is persisted; deploy failures are returned, not thrown.
  /// pathStackDir is where relative file references in the definition resolve.
  common::StackOutcome reconcile(const std::string& sStackName, const std::string& sRepositoryUrl,
                                 const std::string& sDefinition,
                                 const std::filesystem::path& pathStackDir,
                                 const common::EnvMap& envSecrets);

  /// Lowercase hex SHA-256 of the definition bytes.
  static std::string computeHash(const std::string& sDefinition);

 private:
  dal::IStackRepository& _srRepo;
  runtime::IContainerRuntime& _crRuntime;
};

}  // namespace dockops::core
