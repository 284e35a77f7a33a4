#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"
#include "core/SnapshotLoader.hpp"
#include "dal/IImageRepository.hpp"
#include "dal/IPassLock.hpp"
#include "dal/ISourceCacheRepository.hpp"
#include "dal/IStackRepository.hpp"
#include "gitops/ISourceFetcher.hpp"
#include "runtime/IContainerRuntime.hpp"
#include "secrets/ISecretStore.hpp"
#include "volumes/IDirectoryMirror.hpp"

namespace dockops::core {

/// Read-only dump of the state store.
/// Class abbreviation: rpt
struct StatusReport {
  std::vector<dal::SourceCacheRow> vSources;
  std::vector<dal::StackRow> vStacks;
  std::vector<dal::ImageRow> vImages;

  /// True when no source has ever been synced.
  bool empty() const { return vSources.empty(); }
};

nlohmann::json toJson(const StatusReport& rpt);
nlohmann::json toJson(const common::PassSummary& ps);

/// Collaborators wired into the orchestrator. All references must outlive it.
/// Class abbreviation: deps
struct PassDependencies {
  dal::IImageRepository& irImages;
  dal::IStackRepository& srStacks;
  dal::ISourceCacheRepository& scrSources;
  dal::IPassLock& plLock;
  gitops::ISourceFetcher& sfFetcher;
  runtime::IContainerRuntime& crRuntime;
  volumes::IDirectoryMirror& dmMirror;
  secrets::ISecretStore& ssSecrets;
  int iDigestWorkers = 4;
};

/// Composes the loader, ledger, materializer, resolver and reconciler into the three
/// user-facing operations. sync() and teardown() hold the pass lock for their duration.
/// Class abbreviation: po
class PassOrchestrator {
 public:
  explicit PassOrchestrator(PassDependencies deps);
  ~PassOrchestrator();

  /// One reconciliation pass over the tree at sUrl. A URL that already has a cache entry
  /// is refused unless bRefresh is set.
  /// Throws AlreadySyncedError, PassLockedError, FetchError or SnapshotError; none of them
  /// leaves a partial mutation behind.
  common::PassSummary sync(const std::string& sUrl, bool bRefresh = false);

  StatusReport status() const;

  /// Remove every known stack and image, then clear all tables.
  /// Individual removal failures are reported, not thrown.
  common::TeardownReport teardown();

 private:
  PassDependencies _deps;
  SnapshotLoader _slLoader;
};

}  // namespace dockops::core
