#include "core/PassOrchestrator.hpp"

#include "common/Errors.hpp"
#include "support/Fakes.hpp"
#include "volumes/LocalDirectoryMirror.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <map>

using dockops::common::AlreadySyncedError;
using dockops::common::FetchError;
using dockops::common::ImageAction;
using dockops::common::PassLockedError;
using dockops::common::PassSummary;
using dockops::common::SnapshotError;
using dockops::common::StackAction;
using dockops::common::StackStatus;
using dockops::core::PassOrchestrator;
using namespace dockops::test;

namespace {

const std::string kUrl = "https://github.com/acme/fleet";

std::map<std::string, StackAction> stackActions(const PassSummary& ps) {
  std::map<std::string, StackAction> m;
  for (const auto& so : ps.vStacks) m[so.sName] = so.action;
  return m;
}

}  // namespace

/// Source tree: stacks [web, app]; web mounts binding cfg, app mounts volume data,
/// both run nginx:alpine.
class PassOrchestratorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _tdTree.write("stacks.yaml", "- name: web\n- name: app\n");
    _tdTree.write("web/docker-compose.yml",
                  "services:\n"
                  "  web:\n"
                  "    image: nginx:alpine\n"
                  "    volumes:\n"
                  "      - cfg:/etc/nginx/conf.d:ro\n");
    _tdTree.write("app/docker-compose.yml",
                  "services:\n"
                  "  app:\n"
                  "    image: nginx:alpine\n"
                  "    volumes:\n"
                  "      - data:/usr/share/nginx/html\n"
                  "volumes:\n"
                  "  data: {}\n");
    _tdTree.write("volumes.yaml",
                  "- id: cfg\n  type: binding\n  path: config/web\n"
                  "- id: data\n  type: volume\n  path: app_data\n");
    _tdTree.write("nfs.yaml", "path: " + _tdNfs.path().string() + "\n");
    _tdTree.write("config/web/default.conf", "server { listen 80; }\n");

    _fcr.mDigests["nginx:alpine"] = "sha256:1111";
  }

  PassOrchestrator makeOrchestrator() {
    return PassOrchestrator({_fir, _fsr, _fscr, _fpl, _fsf, _fcr, _ldm, _fss, 2});
  }

  TempDir _tdTree;
  TempDir _tdNfs;
  FakeImageRepository _fir;
  FakeStackRepository _fsr;
  FakeSourceCacheRepository _fscr;
  FakePassLock _fpl;
  FakeSourceFetcher _fsf{_tdTree.path()};
  FakeContainerRuntime _fcr;
  dockops::volumes::LocalDirectoryMirror _ldm;
  FakeSecretStore _fss;
};

TEST_F(PassOrchestratorTest, FirstPassDeploysEverything) {
  auto po = makeOrchestrator();
  auto ps = po.sync(kUrl);

  auto mActions = stackActions(ps);
  EXPECT_EQ(mActions["web"], StackAction::Deployed);
  EXPECT_EQ(mActions["app"], StackAction::Deployed);
  ASSERT_EQ(_fcr.vDeploys.size(), 2u);
  EXPECT_EQ(_fcr.vDeploys[0].sStackName, "web");
  EXPECT_EQ(_fcr.vDeploys[1].sStackName, "app");

  EXPECT_EQ(_fir.find("nginx:alpine")->iReferenceCount, 2);
  EXPECT_EQ(_fir.find("nginx:alpine")->oDigest.value_or(""), "sha256:1111");

  EXPECT_EQ(_fsr.findByName("web", kUrl)->status, StackStatus::Deployed);
  EXPECT_EQ(_fsr.findByName("app", kUrl)->status, StackStatus::Deployed);
  EXPECT_EQ(_fsr.findByName("app", kUrl)->sComposePath, "app/docker-compose.yml");

  EXPECT_EQ(_tdNfs.read("cfg/default.conf"), "server { listen 80; }\n");
  ASSERT_EQ(_fcr.vEnsuredVolumes.size(), 1u);
  EXPECT_EQ(_fcr.vEnsuredVolumes[0], "app_data");

  auto nWeb = YAML::Load(_fcr.vDeploys[0].sDefinition);
  EXPECT_EQ(nWeb["services"]["web"]["volumes"][0].as<std::string>(),
            (_tdNfs.path() / "cfg").string() + ":/etc/nginx/conf.d:ro");

  EXPECT_TRUE(_fscr.findByUrl(kUrl).has_value());
  ASSERT_EQ(_fsf.vCleaned.size(), 1u);
  EXPECT_EQ(_fsf.vCleaned[0], _tdTree.path());
  EXPECT_FALSE(_fpl.bLocked);
}

TEST_F(PassOrchestratorTest, UnchangedRerunDeploysNothing) {
  auto po = makeOrchestrator();
  po.sync(kUrl);
  const auto sWebHash = _fsr.findByName("web", kUrl)->sHash;
  const auto sAppHash = _fsr.findByName("app", kUrl)->sHash;

  auto ps = po.sync(kUrl, /*bRefresh=*/true);
  EXPECT_EQ(_fcr.vDeploys.size(), 2u);
  auto mActions = stackActions(ps);
  EXPECT_EQ(mActions["web"], StackAction::Unchanged);
  EXPECT_EQ(mActions["app"], StackAction::Unchanged);
  EXPECT_EQ(_fsr.findByName("web", kUrl)->sHash, sWebHash);
  EXPECT_EQ(_fsr.findByName("app", kUrl)->sHash, sAppHash);
  EXPECT_EQ(_fir.find("nginx:alpine")->iReferenceCount, 2);
  ASSERT_EQ(ps.vImages.size(), 1u);
  EXPECT_EQ(ps.vImages[0].action, ImageAction::Kept);
}

TEST_F(PassOrchestratorTest, DroppedStackKeepsRowAndSharedImage) {
  auto po = makeOrchestrator();
  po.sync(kUrl);

  _tdTree.write("stacks.yaml", "- name: web\n");
  auto ps = po.sync(kUrl, true);

  EXPECT_EQ(ps.vStacks.size(), 1u);
  EXPECT_TRUE(_fsr.findByName("app", kUrl).has_value());
  EXPECT_EQ(_fir.find("nginx:alpine")->iReferenceCount, 1);
  EXPECT_TRUE(_fcr.vRemovedImages.empty());
}

TEST_F(PassOrchestratorTest, SharedImageRetainedWhenOneStackStopsUsingIt) {
  auto po = makeOrchestrator();
  po.sync(kUrl);

  _tdTree.write("app/docker-compose.yml",
                "services:\n  app:\n    image: httpd:2.4\n");
  _fcr.mDigests["httpd:2.4"] = "sha256:2222";
  auto ps = po.sync(kUrl, true);

  ASSERT_TRUE(_fir.find("nginx:alpine").has_value());
  EXPECT_EQ(_fir.find("nginx:alpine")->iReferenceCount, 1);
  EXPECT_EQ(_fir.find("httpd:2.4")->iReferenceCount, 1);
  EXPECT_TRUE(_fcr.vRemovedImages.empty());
  EXPECT_EQ(stackActions(ps)["app"], StackAction::Deployed);
  EXPECT_EQ(stackActions(ps)["web"], StackAction::Unchanged);
}

TEST_F(PassOrchestratorTest, ImageUnreferencedByEveryStackIsSwept) {
  auto po = makeOrchestrator();
  po.sync(kUrl);

  _tdTree.write("web/docker-compose.yml", "services:\n  web:\n    image: caddy:2\n");
  _tdTree.write("app/docker-compose.yml", "services:\n  app:\n    image: caddy:2\n");
  auto ps = po.sync(kUrl, true);

  EXPECT_FALSE(_fir.find("nginx:alpine").has_value());
  ASSERT_EQ(_fcr.vRemovedImages.size(), 1u);
  EXPECT_EQ(_fcr.vRemovedImages[0], "nginx:alpine");
  EXPECT_EQ(_fir.find("caddy:2")->iReferenceCount, 2);
}

TEST_F(PassOrchestratorTest, MissingSecretBlocksOnlyThatStack) {
  _tdTree.write("web/secrets.yaml", "- id: tls_key\n  env: TLS_KEY\n");
  auto po = makeOrchestrator();
  auto ps = po.sync(kUrl);

  auto mActions = stackActions(ps);
  EXPECT_EQ(mActions["web"], StackAction::SecretMissing);
  EXPECT_EQ(mActions["app"], StackAction::Deployed);
  ASSERT_EQ(_fcr.vDeploys.size(), 1u);
  EXPECT_EQ(_fcr.vDeploys[0].sStackName, "app");
  EXPECT_FALSE(_fsr.findByName("web", kUrl).has_value());

  // Still declared, so its image reference counts
  EXPECT_EQ(_fir.find("nginx:alpine")->iReferenceCount, 2);
}

TEST_F(PassOrchestratorTest, ResolvedSecretsReachDeployButNotDefinition) {
  _tdTree.write("web/secrets.yaml", "- id: tls_key\n  env: TLS_KEY\n");
  _fss.mSecrets["tls_key"] = "super-secret-value";
  auto po = makeOrchestrator();
  po.sync(kUrl);

  ASSERT_EQ(_fcr.vDeploys.size(), 2u);
  EXPECT_EQ(_fcr.vDeploys[0].envSecrets.at("TLS_KEY"), "super-secret-value");
  EXPECT_EQ(_fcr.vDeploys[0].sDefinition.find("super-secret-value"), std::string::npos);
}

TEST_F(PassOrchestratorTest, DeployFailureDoesNotAbortPass) {
  _fcr.setFailingStacks.insert("web");
  auto po = makeOrchestrator();
  auto ps = po.sync(kUrl);

  auto mActions = stackActions(ps);
  EXPECT_EQ(mActions["web"], StackAction::DeployFailed);
  EXPECT_EQ(mActions["app"], StackAction::Deployed);
  EXPECT_EQ(_fsr.findByName("web", kUrl)->status, StackStatus::Error);

  // Unchanged but in error: retried on the next pass
  _fcr.setFailingStacks.clear();
  auto ps2 = po.sync(kUrl, true);
  EXPECT_EQ(stackActions(ps2)["web"], StackAction::Deployed);
  EXPECT_EQ(stackActions(ps2)["app"], StackAction::Unchanged);
}

TEST_F(PassOrchestratorTest, StateStoreErrorDuringReconcileDoesNotAbortPass) {
  _fsr.setFailingRecords.insert("web");
  auto po = makeOrchestrator();
  auto ps = po.sync(kUrl);

  auto mActions = stackActions(ps);
  EXPECT_EQ(mActions["web"], StackAction::DeployFailed);
  EXPECT_EQ(mActions["app"], StackAction::Deployed);
  for (const auto& so : ps.vStacks) {
    if (so.sName == "web") EXPECT_EQ(so.sMessage, "connection lost");
  }
  EXPECT_EQ(_fsr.findByName("app", kUrl)->status, StackStatus::Deployed);

  // The rest of the pass still ran
  ASSERT_EQ(ps.vImages.size(), 1u);
  EXPECT_TRUE(_fscr.findByUrl(kUrl).has_value());
  EXPECT_EQ(_fsf.vCleaned.size(), 1u);
  EXPECT_FALSE(_fpl.bLocked);
}

TEST_F(PassOrchestratorTest, MalformedVolumesSectionIsRejectedBeforeMutation) {
  _tdTree.write("app/docker-compose.yml",
                "services:\n"
                "  app:\n"
                "    image: nginx:alpine\n"
                "volumes: oops\n");
  auto po = makeOrchestrator();
  try {
    po.sync(kUrl);
    FAIL() << "expected SnapshotError";
  } catch (const SnapshotError& ex) {
    EXPECT_EQ(ex._sErrorCode, "definition_malformed");
  }

  EXPECT_TRUE(_fcr.vDeploys.empty());
  EXPECT_TRUE(_fcr.vEnsuredVolumes.empty());
  EXPECT_FALSE(_fir.find("nginx:alpine").has_value());
  EXPECT_FALSE(_fsr.findByName("web", kUrl).has_value());
  EXPECT_FALSE(_fscr.findByUrl(kUrl).has_value());
  EXPECT_EQ(_fsf.vCleaned.size(), 1u);
  EXPECT_FALSE(_fpl.bLocked);
}

TEST_F(PassOrchestratorTest, DeployRunsInStackDirectory) {
  auto po = makeOrchestrator();
  po.sync(kUrl);
  ASSERT_EQ(_fcr.vDeploys.size(), 2u);
  EXPECT_EQ(_fcr.vDeploys[0].pathContext, _tdTree.path() / "web");
  EXPECT_EQ(_fcr.vDeploys[1].pathContext, _tdTree.path() / "app");
}

TEST_F(PassOrchestratorTest, UnavailableBindingMarksStackError) {
  // A regular file where the binding's destination directory must be created
  _tdNfs.write("blocker", "x");
  _tdTree.write("nfs.yaml", "path: " + (_tdNfs.path() / "blocker").string() + "\n");
  auto po = makeOrchestrator();
  auto ps = po.sync(kUrl);

  ASSERT_EQ(ps.vVolumeFailures.size(), 1u);
  EXPECT_EQ(ps.vVolumeFailures[0].sId, "cfg");
  auto mActions = stackActions(ps);
  EXPECT_EQ(mActions["web"], StackAction::MaterializeFailed);
  EXPECT_EQ(mActions["app"], StackAction::Deployed);
  EXPECT_EQ(_fsr.findByName("web", kUrl)->status, StackStatus::Error);
}

TEST_F(PassOrchestratorTest, CachedUrlIsRefusedWithoutMutation) {
  auto po = makeOrchestrator();
  po.sync(kUrl);
  const auto iDeploys = _fcr.vDeploys.size();

  EXPECT_THROW(po.sync(kUrl), AlreadySyncedError);
  EXPECT_EQ(_fcr.vDeploys.size(), iDeploys);
  EXPECT_EQ(_fsf.vFetched.size(), 1u);
  EXPECT_EQ(_fir.find("nginx:alpine")->iReferenceCount, 2);
  EXPECT_FALSE(_fpl.bLocked);
}

TEST_F(PassOrchestratorTest, StructuralErrorLeavesStateUntouched) {
  auto po = makeOrchestrator();
  po.sync(kUrl);

  _tdTree.write("stacks.yaml", "- name: web\n- name: missing\n");
  EXPECT_THROW(po.sync(kUrl, true), SnapshotError);

  EXPECT_EQ(_fir.find("nginx:alpine")->iReferenceCount, 2);
  EXPECT_EQ(_fcr.vDeploys.size(), 2u);
  EXPECT_EQ(_fsf.vCleaned.size(), 2u);
  EXPECT_FALSE(_fpl.bLocked);
}

TEST_F(PassOrchestratorTest, FetchFailurePropagates) {
  _fsf.bFail = true;
  auto po = makeOrchestrator();
  EXPECT_THROW(po.sync(kUrl), FetchError);
  EXPECT_FALSE(_fscr.findByUrl(kUrl).has_value());
  EXPECT_FALSE(_fpl.bLocked);
}

TEST_F(PassOrchestratorTest, HeldLockRefusesPass) {
  _fpl.bHeldElsewhere = true;
  auto po = makeOrchestrator();
  EXPECT_THROW(po.sync(kUrl), PassLockedError);
  EXPECT_TRUE(_fsf.vFetched.empty());
}

TEST_F(PassOrchestratorTest, StatusBeforeAnyPassIsEmpty) {
  auto po = makeOrchestrator();
  auto rpt = po.status();
  EXPECT_TRUE(rpt.empty());
  EXPECT_FALSE(dockops::core::toJson(rpt)["synced"].get<bool>());
}

TEST_F(PassOrchestratorTest, StatusReportsStacksAndImages) {
  auto po = makeOrchestrator();
  po.sync(kUrl);

  auto rpt = po.status();
  ASSERT_FALSE(rpt.empty());
  EXPECT_EQ(rpt.vSources.size(), 1u);
  EXPECT_EQ(rpt.vStacks.size(), 2u);
  ASSERT_EQ(rpt.vImages.size(), 1u);
  EXPECT_EQ(rpt.vImages[0].iReferenceCount, 2);

  auto j = dockops::core::toJson(rpt);
  EXPECT_TRUE(j["synced"].get<bool>());
  EXPECT_EQ(j["sources"][0]["url"].get<std::string>(), kUrl);
  EXPECT_EQ(j["stacks"][0]["name"].get<std::string>(), "app");
  EXPECT_EQ(j["stacks"][0]["status"].get<std::string>(), "deployed");
  EXPECT_EQ(j["images"][0]["name"].get<std::string>(), "nginx:alpine");
  EXPECT_EQ(j["images"][0]["reference_count"].get<int>(), 2);
}

TEST_F(PassOrchestratorTest, TeardownRemovesEverythingAndAllowsResync) {
  auto po = makeOrchestrator();
  po.sync(kUrl);

  auto tr = po.teardown();
  EXPECT_EQ(tr.iStacksRemoved, 2);
  EXPECT_EQ(tr.iImagesRemoved, 1);
  EXPECT_TRUE(tr.vFailures.empty());
  EXPECT_TRUE(_fsr.mRows.empty());
  EXPECT_TRUE(_fir.mRows.empty());
  EXPECT_TRUE(_fscr.mRows.empty());
  EXPECT_TRUE(po.status().empty());

  auto ps = po.sync(kUrl);
  EXPECT_EQ(stackActions(ps)["web"], StackAction::Deployed);
}

TEST_F(PassOrchestratorTest, TeardownContinuesPastFailures) {
  auto po = makeOrchestrator();
  po.sync(kUrl);
  _fcr.setFailingStacks.insert("app");
  _fcr.setFailingRemovals.insert("nginx:alpine");

  auto tr = po.teardown();
  EXPECT_EQ(tr.iStacksRemoved, 1);
  EXPECT_EQ(tr.iImagesRemoved, 0);
  EXPECT_EQ(tr.vFailures.size(), 2u);
  EXPECT_EQ(_fcr.vRemovedStacks.size(), 2u);
  EXPECT_TRUE(_fsr.mRows.empty());
  EXPECT_TRUE(_fscr.mRows.empty());
}
