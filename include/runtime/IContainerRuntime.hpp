#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "common/Types.hpp"

namespace dockops::runtime {

/// Pure abstract interface over the container orchestrator and image store.
/// Primitives report failure through RuntimeResult; none of them throw.
class IContainerRuntime {
 public:
  virtual ~IContainerRuntime() = default;

  virtual std::string name() const = 0;

  /// Deploy (or update) a stack from definition bytes. Relative file references in the
  /// definition (env_file, configs.*.file, secrets.*.file) resolve against pathContext.
  /// envSecrets is visible to the orchestrator's variable interpolation only; it is
  /// never written to disk.
  virtual common::RuntimeResult deploy(const std::string& sStackName,
                                       const std::string& sDefinition,
                                       const std::filesystem::path& pathContext,
                                       const common::EnvMap& envSecrets) = 0;

  virtual common::RuntimeResult removeStack(const std::string& sStackName) = 0;
  virtual common::RuntimeResult pullImage(const std::string& sImageRef) = 0;

  /// Removing an image that is not present locally counts as success.
  virtual common::RuntimeResult removeImage(const std::string& sImageRef) = 0;

  /// Create the orchestrator-managed volume if it does not already exist.
  virtual common::RuntimeResult ensureVolume(const std::string& sVolumeName) = 0;

  /// Current manifest digest from the image's registry; nullopt when unreachable.
  virtual std::optional<std::string> queryManifestDigest(const std::string& sImageRef) = 0;
};

}  // namespace dockops::runtime
