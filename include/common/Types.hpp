#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace dockops::common {

/// Kind of a declared volume entry.
enum class VolumeKind { Volume, Binding };

/// One entry of volumes.yaml.
/// Class abbreviation: vs
struct VolumeSpec {
  std::string sId;
  VolumeKind kind = VolumeKind::Volume;
  std::string sPath;  // orchestrator volume name, or tree-relative directory for bindings
};

/// One entry of <stack>/secrets.yaml.
/// Class abbreviation: ss
struct SecretSpec {
  std::string sId;
  std::string sEnv;
};

/// A declared stack with its parsed orchestrator definition.
/// Class abbreviation: sd
struct StackDeclaration {
  std::string sName;
  std::filesystem::path pathDir;
  std::string sComposePath;  // tree-relative, forward slashes
  YAML::Node nDefinition;
  std::vector<std::string> vImages;  // canonical references in document order, duplicates kept
  std::vector<SecretSpec> vSecrets;
};

/// Everything parsed out of one fetched source tree.
/// Class abbreviation: snap
struct Snapshot {
  std::filesystem::path pathRoot;
  std::vector<StackDeclaration> vStacks;
  std::vector<VolumeSpec> vVolumes;
  std::optional<std::string> oNetworkStorePath;
};

/// Persisted stack status.
enum class StackStatus { Deployed, Stopped, Error };

std::string toString(StackStatus status);

/// Parse a persisted status string; unknown values map to Error.
StackStatus stackStatusFromString(const std::string& sValue);

/// Outcome of a collaborator primitive (deploy, remove, pull, ensure-volume, copy).
/// Class abbreviation: rr
struct RuntimeResult {
  bool bSuccess = false;
  std::string sErrorMessage;
};

/// Secret environment handed to the runtime on deploy.
using EnvMap = std::map<std::string, std::string>;

/// Per-stack result of a pass.
enum class StackAction { Deployed, Unchanged, DeployFailed, SecretMissing, MaterializeFailed };

std::string toString(StackAction action);

/// Class abbreviation: so
struct StackOutcome {
  std::string sName;
  StackAction action = StackAction::Unchanged;
  std::string sHash;
  std::string sMessage;
};

/// Per-image result of the sweep phase.
enum class ImageAction { Pulled, Removed, Kept, DigestCheckFailed, PullFailed, RemoveFailed };

std::string toString(ImageAction action);

/// Class abbreviation: io
struct ImageOutcome {
  std::string sName;
  ImageAction action = ImageAction::Kept;
  int iReferenceCount = 0;
  std::string sMessage;
};

/// Failure to materialize one volume-set entry.
/// Class abbreviation: vf
struct VolumeFailure {
  std::string sId;
  std::string sMessage;
};

/// Result of a sync pass.
/// Class abbreviation: ps
struct PassSummary {
  std::string sUrl;
  std::vector<StackOutcome> vStacks;
  std::vector<ImageOutcome> vImages;
  std::vector<VolumeFailure> vVolumeFailures;
  std::chrono::system_clock::time_point tpCompletedAt;
};

/// Result of a teardown.
/// Class abbreviation: tr
struct TeardownReport {
  int iStacksRemoved = 0;
  int iImagesRemoved = 0;
  std::vector<std::string> vFailures;
};

}  // namespace dockops::common
