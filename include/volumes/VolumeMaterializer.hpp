#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "common/Types.hpp"
#include "runtime/IContainerRuntime.hpp"
#include "volumes/IDirectoryMirror.hpp"

namespace dockops::volumes {

/// A stack definition after mount rewriting, ready to hash and deploy.
/// Class abbreviation: ms
struct MaterializedStack {
  std::string sDefinition;
  std::set<std::string> setReferencedIds;   // volume-set ids this stack mounts
  std::vector<std::string> vUnavailableIds;  // referenced ids whose materialization failed
};

/// Creates orchestrator volumes, mirrors bindings to the network store, and rewrites
/// stack definitions so mounts point at what was materialized. One instance per pass.
///
/// Rewriting rules for each entry of services.*.volumes:
///   short "src:dst[:mode]": src equal to a binding id becomes {base}/{id}
///   long {type, source, ...}: same for source; type becomes "bind"
/// Any other source token is left untouched (plain orchestrator-native volume).
///
/// Top-level volumes: binding ids are dropped; volume ids are declared
/// {external: true, name: <path>} so the stack binds to the pre-created volume.
/// Class abbreviation: vm
class VolumeMaterializer {
 public:
  VolumeMaterializer(runtime::IContainerRuntime& crRuntime, IDirectoryMirror& dmMirror,
                     const common::Snapshot& snap);
  ~VolumeMaterializer();

  /// Materialize every volume-set entry once. Failures are returned and remembered;
  /// they never throw.
  std::vector<common::VolumeFailure> prepare();

  /// Rewrite a copy of the stack's definition and serialize it.
  /// The declaration's own definition node is not modified.
  MaterializedStack materialize(const common::StackDeclaration& sdStack) const;

  /// Network-store path a binding id is mirrored to.
  std::string bindingTarget(const std::string& sId) const;

  /// Deterministic serialization used for both hashing and deploying.
  static std::string render(const YAML::Node& nDefinition);

 private:
  void rewriteServiceMounts(YAML::Node& nDefinition, MaterializedStack& msOut) const;
  void rewriteTopLevelVolumes(YAML::Node& nDefinition, const MaterializedStack& msOut) const;
  std::optional<std::string> rewriteShortMount(const std::string& sEntry,
                                               MaterializedStack& msOut) const;

  runtime::IContainerRuntime& _crRuntime;
  IDirectoryMirror& _dmMirror;
  std::filesystem::path _pathRoot;
  std::optional<std::string> _oBase;
  std::vector<common::VolumeSpec> _vSpecs;  // declaration order
  std::map<std::string, common::VolumeSpec> _mSpecs;
  std::set<std::string> _setFailed;
};

}  // namespace dockops::volumes
