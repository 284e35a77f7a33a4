#include "core/PassOrchestrator.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/ImageLedger.hpp"
#include "core/StackReconciler.hpp"
#include "secrets/SecretsResolver.hpp"
#include "volumes/VolumeMaterializer.hpp"

#include <openssl/crypto.h>

#include <chrono>
#include <ctime>
#include <exception>
#include <mutex>

namespace dockops::core {

namespace {

/// Returns a fetched tree to the fetcher on scope exit.
class FetchedTree {
 public:
  FetchedTree(gitops::ISourceFetcher& sfFetcher, std::filesystem::path pathTree)
      : _sfFetcher(sfFetcher), _pathTree(std::move(pathTree)) {}
  ~FetchedTree() { _sfFetcher.cleanup(_pathTree); }

  FetchedTree(const FetchedTree&) = delete;
  FetchedTree& operator=(const FetchedTree&) = delete;

  const std::filesystem::path& path() const { return _pathTree; }

 private:
  gitops::ISourceFetcher& _sfFetcher;
  std::filesystem::path _pathTree;
};

void cleanseEnv(common::EnvMap& envSecrets) {
  for (auto& [sKey, sValue] : envSecrets) {
    OPENSSL_cleanse(sValue.data(), sValue.size());
  }
  envSecrets.clear();
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
  std::time_t tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tmUtc{};
  gmtime_r(&tt, &tmUtc);
  char vBuf[32];
  std::strftime(vBuf, sizeof(vBuf), "%Y-%m-%dT%H:%M:%SZ", &tmUtc);
  return vBuf;
}

}  // namespace

PassOrchestrator::PassOrchestrator(PassDependencies deps) : _deps(deps) {}

PassOrchestrator::~PassOrchestrator() = default;

common::PassSummary PassOrchestrator::sync(const std::string& sUrl, bool bRefresh) {
  auto spLog = common::Logger::get();
  std::lock_guard<dal::IPassLock> lgPass(_deps.plLock);

  auto oCached = _deps.scrSources.findByUrl(sUrl);
  if (oCached && !bRefresh) {
    throw common::AlreadySyncedError(
        "already_synced",
        "Source '" + sUrl + "' was already synced at " + formatTimestamp(oCached->tpLastSyncedAt) +
            "; use --refresh to run another pass");
  }

  spLog->info("Sync pass started for {}{}", sUrl, oCached ? " (refresh)" : "");
  FetchedTree ftTree(_deps.sfFetcher, _deps.sfFetcher.fetch(sUrl));

  // Structural errors surface here, before any state is touched.
  const common::Snapshot snap = _slLoader.load(ftTree.path());

  common::PassSummary ps;
  ps.sUrl = sUrl;

  ImageLedger ilLedger(_deps.irImages, _deps.crRuntime, _deps.iDigestWorkers);
  ilLedger.reset();

  volumes::VolumeMaterializer vmMaterializer(_deps.crRuntime, _deps.dmMirror, snap);
  ps.vVolumeFailures = vmMaterializer.prepare();

  secrets::SecretsResolver srResolver(_deps.ssSecrets);
  StackReconciler srReconciler(_deps.srStacks, _deps.crRuntime);

  for (const auto& sd : snap.vStacks) {
    // Marked before the secret gate: a stack that is still declared keeps its images
    // even while it cannot be deployed.
    ilLedger.mark(sd.vImages);

    common::EnvMap envSecrets;
    try {
      envSecrets = srResolver.resolve(sd);
    } catch (const common::SecretNotFoundError& ex) {
      spLog->error("Skipping stack '{}': {}", sd.sName, ex.what());
      ps.vStacks.push_back({sd.sName, common::StackAction::SecretMissing, "", ex.what()});
      continue;
    }

    _deps.srStacks.upsertDeclared(sd.sName, sUrl, sd.sComposePath);

    volumes::MaterializedStack ms;
    try {
      ms = vmMaterializer.materialize(sd);
    } catch (const std::exception& ex) {
      spLog->error("Stack '{}' not deployed: cannot materialize definition: {}", sd.sName,
                   ex.what());
      ps.vStacks.push_back({sd.sName, common::StackAction::MaterializeFailed, "", ex.what()});
      cleanseEnv(envSecrets);
      continue;
    }
    if (!ms.vUnavailableIds.empty()) {
      std::string sIds;
      for (const auto& sId : ms.vUnavailableIds) {
        if (!sIds.empty()) sIds += ", ";
        sIds += sId;
      }
      const std::string sHash = StackReconciler::computeHash(ms.sDefinition);
      _deps.srStacks.recordDeployment(sd.sName, sUrl, sHash, common::StackStatus::Error);
      spLog->error("Stack '{}' not deployed: volume(s) unavailable: {}", sd.sName, sIds);
      ps.vStacks.push_back({sd.sName, common::StackAction::MaterializeFailed, sHash,
                            "unavailable volume(s): " + sIds});
      cleanseEnv(envSecrets);
      continue;
    }

    try {
      ps.vStacks.push_back(
          srReconciler.reconcile(sd.sName, sUrl, ms.sDefinition, sd.pathDir, envSecrets));
    } catch (const std::exception& ex) {
      // One stack's failure never aborts the pass; the sweep still has to run.
      spLog->error("Stack '{}' failed during reconcile: {}", sd.sName, ex.what());
      ps.vStacks.push_back({sd.sName, common::StackAction::DeployFailed,
                            StackReconciler::computeHash(ms.sDefinition), ex.what()});
    }
    cleanseEnv(envSecrets);
  }

  ps.vImages = ilLedger.sweep();

  ps.tpCompletedAt = std::chrono::system_clock::now();
  _deps.scrSources.upsert(sUrl, ps.tpCompletedAt);

  int iDeployed = 0, iUnchanged = 0, iFailed = 0;
  for (const auto& so : ps.vStacks) {
    if (so.action == common::StackAction::Deployed) ++iDeployed;
    else if (so.action == common::StackAction::Unchanged) ++iUnchanged;
    else ++iFailed;
  }
  int iPulled = 0, iRemoved = 0, iImageFailures = 0;
  for (const auto& io : ps.vImages) {
    if (io.action == common::ImageAction::Pulled) ++iPulled;
    else if (io.action == common::ImageAction::Removed) ++iRemoved;
    else if (io.action != common::ImageAction::Kept) ++iImageFailures;
  }
  spLog->info(
      "Sync pass finished for {}: stacks deployed={} unchanged={} failed={}; "
      "images pulled={} removed={} failed={}; volume failures={}",
      sUrl, iDeployed, iUnchanged, iFailed, iPulled, iRemoved, iImageFailures,
      ps.vVolumeFailures.size());
  return ps;
}

StatusReport PassOrchestrator::status() const {
  StatusReport rpt;
  rpt.vSources = _deps.scrSources.listAll();
  if (rpt.empty()) {
    return rpt;
  }
  rpt.vStacks = _deps.srStacks.listAll();
  rpt.vImages = _deps.irImages.listAll();
  return rpt;
}

common::TeardownReport PassOrchestrator::teardown() {
  auto spLog = common::Logger::get();
  std::lock_guard<dal::IPassLock> lgPass(_deps.plLock);

  common::TeardownReport tr;

  for (const auto& srow : _deps.srStacks.listAll()) {
    auto rr = _deps.crRuntime.removeStack(srow.sName);
    if (rr.bSuccess) {
      ++tr.iStacksRemoved;
      spLog->info("Removed stack '{}'", srow.sName);
    } else {
      tr.vFailures.push_back("stack " + srow.sName + ": " + rr.sErrorMessage);
      spLog->error("Failed to remove stack '{}': {}", srow.sName, rr.sErrorMessage);
    }
  }

  for (const auto& irow : _deps.irImages.listAll()) {
    auto rr = _deps.crRuntime.removeImage(irow.sName);
    if (rr.bSuccess) {
      ++tr.iImagesRemoved;
      spLog->info("Removed image '{}'", irow.sName);
    } else {
      tr.vFailures.push_back("image " + irow.sName + ": " + rr.sErrorMessage);
      spLog->error("Failed to remove image '{}': {}", irow.sName, rr.sErrorMessage);
    }
  }

  _deps.srStacks.deleteAll();
  _deps.irImages.deleteAll();
  _deps.scrSources.deleteAll();

  spLog->info("Teardown finished: {} stack(s), {} image(s) removed, {} failure(s)",
              tr.iStacksRemoved, tr.iImagesRemoved, tr.vFailures.size());
  return tr;
}

nlohmann::json toJson(const StatusReport& rpt) {
  nlohmann::json j;
  j["synced"] = !rpt.empty();

  j["sources"] = nlohmann::json::array();
  for (const auto& row : rpt.vSources) {
    j["sources"].push_back({{"url", row.sUrl},
                            {"last_synced_at", formatTimestamp(row.tpLastSyncedAt)}});
  }

  j["stacks"] = nlohmann::json::array();
  for (const auto& row : rpt.vStacks) {
    j["stacks"].push_back({{"name", row.sName},
                           {"repository_url", row.sRepositoryUrl},
                           {"compose_path", row.sComposePath},
                           {"status", common::toString(row.status)},
                           {"hash", row.sHash}});
  }

  j["images"] = nlohmann::json::array();
  for (const auto& row : rpt.vImages) {
    nlohmann::json jImage = {{"name", row.sName}, {"reference_count", row.iReferenceCount}};
    jImage["digest"] = row.oDigest ? nlohmann::json(*row.oDigest) : nlohmann::json(nullptr);
    j["images"].push_back(std::move(jImage));
  }
  return j;
}

nlohmann::json toJson(const common::PassSummary& ps) {
  nlohmann::json j;
  j["url"] = ps.sUrl;
  j["completed_at"] = formatTimestamp(ps.tpCompletedAt);

  j["stacks"] = nlohmann::json::array();
  for (const auto& so : ps.vStacks) {
    j["stacks"].push_back({{"name", so.sName},
                           {"action", common::toString(so.action)},
                           {"hash", so.sHash},
                           {"message", so.sMessage}});
  }

  j["images"] = nlohmann::json::array();
  for (const auto& io : ps.vImages) {
    j["images"].push_back({{"name", io.sName},
                           {"action", common::toString(io.action)},
                           {"reference_count", io.iReferenceCount},
                           {"message", io.sMessage}});
  }

  j["volume_failures"] = nlohmann::json::array();
  for (const auto& vf : ps.vVolumeFailures) {
    j["volume_failures"].push_back({{"id", vf.sId}, {"message", vf.sMessage}});
  }
  return j;
}

}  // namespace dockops::core
