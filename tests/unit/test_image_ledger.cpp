#include "core/ImageLedger.hpp"

#include "support/Fakes.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <stdexcept>

using dockops::common::ImageAction;
using dockops::common::ImageOutcome;
using dockops::core::ImageLedger;
using dockops::test::FakeContainerRuntime;
using dockops::test::FakeImageRepository;

namespace {

std::map<std::string, ImageOutcome> byName(const std::vector<ImageOutcome>& vOutcomes) {
  std::map<std::string, ImageOutcome> m;
  for (const auto& io : vOutcomes) m[io.sName] = io;
  return m;
}

}  // namespace

class ImageLedgerTest : public ::testing::Test {
 protected:
  FakeImageRepository _fir;
  FakeContainerRuntime _fcr;
};

TEST_F(ImageLedgerTest, MarkCountsEveryOccurrenceAcrossStacks) {
  ImageLedger il(_fir, _fcr, 2);
  il.reset();
  il.mark({"nginx:alpine", "redis:7"});
  il.mark({"nginx:alpine"});
  il.mark({"nginx:alpine", "nginx:alpine"});

  EXPECT_EQ(_fir.find("nginx:alpine")->iReferenceCount, 4);
  EXPECT_EQ(_fir.find("redis:7")->iReferenceCount, 1);
}

TEST_F(ImageLedgerTest, ResetZeroesPreviousCounts) {
  _fir.seed("nginx:alpine", 7, "sha256:old");
  ImageLedger il(_fir, _fcr, 1);
  il.reset();
  EXPECT_EQ(_fir.find("nginx:alpine")->iReferenceCount, 0);

  il.mark({"nginx:alpine"});
  EXPECT_EQ(_fir.find("nginx:alpine")->iReferenceCount, 1);
  EXPECT_EQ(_fir.find("nginx:alpine")->oDigest.value_or(""), "sha256:old");
}

TEST_F(ImageLedgerTest, SweepRemovesUnreferencedImages) {
  _fir.seed("old:1", 3, "sha256:aaa");
  ImageLedger il(_fir, _fcr, 2);
  il.reset();

  auto m = byName(il.sweep());
  EXPECT_EQ(m["old:1"].action, ImageAction::Removed);
  EXPECT_FALSE(_fir.find("old:1").has_value());
  ASSERT_EQ(_fcr.vRemovedImages.size(), 1u);
  EXPECT_EQ(_fcr.vRemovedImages[0], "old:1");
  EXPECT_TRUE(_fcr.vDigestQueries.empty());
}

TEST_F(ImageLedgerTest, RemovalIgnoresRegistryReachability) {
  _fir.seed("gone:1", 1);  // no digest known, registry unknown to the fake
  ImageLedger il(_fir, _fcr, 1);
  il.reset();

  auto m = byName(il.sweep());
  EXPECT_EQ(m["gone:1"].action, ImageAction::Removed);
  EXPECT_TRUE(_fcr.vDigestQueries.empty());
}

TEST_F(ImageLedgerTest, FailedRemovalKeepsRowForNextPass) {
  _fir.seed("stuck:1", 1);
  _fcr.setFailingRemovals.insert("stuck:1");
  ImageLedger il(_fir, _fcr, 1);
  il.reset();

  auto m = byName(il.sweep());
  EXPECT_EQ(m["stuck:1"].action, ImageAction::RemoveFailed);
  ASSERT_TRUE(_fir.find("stuck:1").has_value());
  EXPECT_EQ(_fir.find("stuck:1")->iReferenceCount, 0);
}

TEST_F(ImageLedgerTest, PullsWhenDigestIsUnknown) {
  _fcr.mDigests["nginx:alpine"] = "sha256:new";
  ImageLedger il(_fir, _fcr, 2);
  il.reset();
  il.mark({"nginx:alpine"});

  auto m = byName(il.sweep());
  EXPECT_EQ(m["nginx:alpine"].action, ImageAction::Pulled);
  EXPECT_EQ(m["nginx:alpine"].iReferenceCount, 1);
  EXPECT_EQ(_fir.find("nginx:alpine")->oDigest.value_or(""), "sha256:new");
  ASSERT_EQ(_fcr.vPulled.size(), 1u);
}

TEST_F(ImageLedgerTest, PullsWhenRemoteDigestChanged) {
  _fir.seed("nginx:alpine", 0, "sha256:old");
  _fcr.mDigests["nginx:alpine"] = "sha256:new";
  ImageLedger il(_fir, _fcr, 2);
  il.reset();
  il.mark({"nginx:alpine"});

  auto m = byName(il.sweep());
  EXPECT_EQ(m["nginx:alpine"].action, ImageAction::Pulled);
  EXPECT_EQ(_fir.find("nginx:alpine")->oDigest.value_or(""), "sha256:new");
}

TEST_F(ImageLedgerTest, KeepsImageWhenDigestMatches) {
  _fir.seed("nginx:alpine", 0, "sha256:same");
  _fcr.mDigests["nginx:alpine"] = "sha256:same";
  ImageLedger il(_fir, _fcr, 2);
  il.reset();
  il.mark({"nginx:alpine"});

  auto m = byName(il.sweep());
  EXPECT_EQ(m["nginx:alpine"].action, ImageAction::Kept);
  EXPECT_TRUE(_fcr.vPulled.empty());
}

TEST_F(ImageLedgerTest, UnreachableRegistryRetainsDigestAndSkipsPull) {
  _fir.seed("private/app:1", 0, "sha256:prev");
  ImageLedger il(_fir, _fcr, 2);
  il.reset();
  il.mark({"private/app:1"});

  auto m = byName(il.sweep());
  EXPECT_EQ(m["private/app:1"].action, ImageAction::DigestCheckFailed);
  EXPECT_EQ(_fir.find("private/app:1")->oDigest.value_or(""), "sha256:prev");
  EXPECT_EQ(_fir.find("private/app:1")->iReferenceCount, 1);
  EXPECT_TRUE(_fcr.vPulled.empty());
}

TEST_F(ImageLedgerTest, FailedPullLeavesStoredDigestUntouched) {
  _fir.seed("nginx:alpine", 0, "sha256:old");
  _fcr.mDigests["nginx:alpine"] = "sha256:new";
  _fcr.setFailingPulls.insert("nginx:alpine");
  ImageLedger il(_fir, _fcr, 2);
  il.reset();
  il.mark({"nginx:alpine"});

  auto m = byName(il.sweep());
  EXPECT_EQ(m["nginx:alpine"].action, ImageAction::PullFailed);
  EXPECT_EQ(_fir.find("nginx:alpine")->oDigest.value_or(""), "sha256:old");
}

TEST_F(ImageLedgerTest, ChecksManyImagesInParallel) {
  std::vector<std::string> vRefs;
  for (int i = 0; i < 25; ++i) {
    const std::string sRef = "svc" + std::to_string(i) + ":latest";
    vRefs.push_back(sRef);
    _fcr.mDigests[sRef] = "sha256:" + std::to_string(i);
  }
  ImageLedger il(_fir, _fcr, 4);
  il.reset();
  il.mark(vRefs);

  auto vOutcomes = il.sweep();
  ASSERT_EQ(vOutcomes.size(), 25u);
  for (const auto& io : vOutcomes) {
    EXPECT_EQ(io.action, ImageAction::Pulled) << io.sName;
  }
  EXPECT_EQ(_fir.find("svc7:latest")->oDigest.value_or(""), "sha256:7");
}

TEST_F(ImageLedgerTest, PhasesAreEnforced) {
  ImageLedger il(_fir, _fcr, 1);
  EXPECT_THROW(il.mark({"nginx:alpine"}), std::logic_error);
  EXPECT_THROW(il.sweep(), std::logic_error);

  il.reset();
  il.sweep();
  EXPECT_THROW(il.mark({"nginx:alpine"}), std::logic_error);
  EXPECT_THROW(il.sweep(), std::logic_error);
  EXPECT_THROW(il.reset(), std::logic_error);
}
