#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "common/Types.hpp"

namespace dockops::core {

/// Parses the declarative files of a fetched source tree into a Snapshot.
/// Everything is read and validated up front so a structural problem aborts the pass
/// before any state is touched.
///
/// Tree layout:
///   stacks.yaml              - [{name}]                     required
///   volumes.yaml             - [{id, type, path}]           optional
///   nfs.yaml                 - {path}                       optional (required by bindings)
///   <name>/docker-compose.yml (or .yaml, compose.yml, compose.yaml)
///   <name>/secrets.yaml      - [{id, env}]                  optional
/// Class abbreviation: sl
class SnapshotLoader {
 public:
  SnapshotLoader();
  ~SnapshotLoader();

  /// Throws common::SnapshotError on any structural problem.
  common::Snapshot load(const std::filesystem::path& pathRoot) const;

  /// Definition file names in precedence order.
  static const std::vector<std::string>& definitionFileNames();

  /// Every non-empty scalar under a key named "image", at any depth, in document order.
  static std::vector<std::string> collectImages(const YAML::Node& nDefinition);

 private:
  std::vector<std::string> loadStackNames(const std::filesystem::path& pathRoot) const;
  common::StackDeclaration loadStack(const std::filesystem::path& pathRoot,
                                     const std::string& sName) const;
  std::vector<common::VolumeSpec> loadVolumes(const std::filesystem::path& pathRoot) const;
  std::optional<std::string> loadNetworkStore(const std::filesystem::path& pathRoot) const;
  std::vector<common::SecretSpec> loadSecrets(const std::filesystem::path& pathStackDir,
                                              const std::string& sStack) const;
};

}  // namespace dockops::core
