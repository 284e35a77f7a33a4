#include "common/Types.hpp"

namespace dockops::common {

std::string toString(StackStatus status) {
  switch (status) {
    case StackStatus::Deployed: return "deployed";
    case StackStatus::Stopped: return "stopped";
    case StackStatus::Error: return "error";
  }
  return "error";
}

StackStatus stackStatusFromString(const std::string& sValue) {
  if (sValue == "deployed") return StackStatus::Deployed;
  if (sValue == "stopped") return StackStatus::Stopped;
  return StackStatus::Error;
}

std::string toString(StackAction action) {
  switch (action) {
    case StackAction::Deployed: return "deployed";
    case StackAction::Unchanged: return "unchanged";
    case StackAction::DeployFailed: return "deploy-failed";
    case StackAction::SecretMissing: return "secret-missing";
    case StackAction::MaterializeFailed: return "materialize-failed";
  }
  return "unknown";
}

std::string toString(ImageAction action) {
  switch (action) {
    case ImageAction::Pulled: return "pulled";
    case ImageAction::Removed: return "removed";
    case ImageAction::Kept: return "kept";
    case ImageAction::DigestCheckFailed: return "digest-check-failed";
    case ImageAction::PullFailed: return "pull-failed";
    case ImageAction::RemoveFailed: return "remove-failed";
  }
  return "unknown";
}

}  // namespace dockops::common
