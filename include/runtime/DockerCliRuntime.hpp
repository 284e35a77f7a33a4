#pragma once

#include <string>
#include <vector>

#include "runtime/IContainerRuntime.hpp"
#include "runtime/IProcessRunner.hpp"

namespace dockops::runtime {

/// Docker Swarm implementation driven through the docker CLI.
/// Class abbreviation: dcr
class DockerCliRuntime : public IContainerRuntime {
 public:
  DockerCliRuntime(IProcessRunner& prRunner, std::string sDockerBin = "docker");
  ~DockerCliRuntime() override;

  std::string name() const override;
  /// Writes the definition to a hidden 0600 file inside pathContext (the system temp
  /// directory when empty) so the CLI resolves relative paths from there.
  common::RuntimeResult deploy(const std::string& sStackName, const std::string& sDefinition,
                               const std::filesystem::path& pathContext,
                               const common::EnvMap& envSecrets) override;
  common::RuntimeResult removeStack(const std::string& sStackName) override;
  common::RuntimeResult pullImage(const std::string& sImageRef) override;
  common::RuntimeResult removeImage(const std::string& sImageRef) override;
  common::RuntimeResult ensureVolume(const std::string& sVolumeName) override;
  std::optional<std::string> queryManifestDigest(const std::string& sImageRef) override;

  /// Extract the top-level "digest" from `imagetools inspect --format '{{json .Manifest}}'`.
  /// Returns nullopt on malformed output.
  static std::optional<std::string> parseManifestDigest(const std::string& sJson);

 private:
  common::RuntimeResult exec(const std::vector<std::string>& vArgs,
                             const ProcessOptions& popt = {});

  IProcessRunner& _prRunner;
  std::string _sDockerBin;
};

}  // namespace dockops::runtime
