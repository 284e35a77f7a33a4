#include "core/ImageLedger.hpp"

#include "common/Logger.hpp"
#include "core/ThreadPool.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>

namespace dockops::core {

ImageLedger::ImageLedger(dal::IImageRepository& irRepo, runtime::IContainerRuntime& crRuntime,
                         int iDigestWorkers)
    : _irRepo(irRepo), _crRuntime(crRuntime), _iDigestWorkers(iDigestWorkers) {}

ImageLedger::~ImageLedger() = default;

void ImageLedger::reset() {
  if (_phase == Phase::Swept) {
    throw std::logic_error("ImageLedger: reset() after sweep(); use a new ledger per pass");
  }
  _irRepo.resetReferenceCounts();
  _phase = Phase::Marking;
  common::Logger::get()->debug("Image reference counts reset");
}

void ImageLedger::mark(const std::vector<std::string>& vCanonicalRefs) {
  if (_phase != Phase::Marking) {
    throw std::logic_error("ImageLedger: mark() outside the marking phase");
  }
  auto spLog = common::Logger::get();
  for (const auto& sRef : vCanonicalRefs) {
    int iCount = _irRepo.incrementReference(sRef);
    spLog->debug("Marked image '{}' (count {})", sRef, iCount);
  }
}

common::ImageOutcome ImageLedger::refresh(const dal::ImageRow& irow) {
  common::ImageOutcome io;
  io.sName = irow.sName;
  io.iReferenceCount = irow.iReferenceCount;

  auto oRemote = _crRuntime.queryManifestDigest(irow.sName);
  if (!oRemote) {
    io.action = common::ImageAction::DigestCheckFailed;
    io.sMessage = "registry unreachable";
    return io;
  }
  if (irow.oDigest && *irow.oDigest == *oRemote) {
    io.action = common::ImageAction::Kept;
    return io;
  }

  auto rr = _crRuntime.pullImage(irow.sName);
  if (!rr.bSuccess) {
    io.action = common::ImageAction::PullFailed;
    io.sMessage = rr.sErrorMessage;
    return io;
  }
  io.action = common::ImageAction::Pulled;
  io.sMessage = *oRemote;  // digest to persist
  return io;
}

std::vector<common::ImageOutcome> ImageLedger::sweep() {
  if (_phase != Phase::Marking) {
    throw std::logic_error("ImageLedger: sweep() requires a completed marking phase");
  }
  _phase = Phase::Swept;

  auto spLog = common::Logger::get();
  std::vector<common::ImageOutcome> vOutcomes;

  std::vector<dal::ImageRow> vInUse;
  for (const auto& irow : _irRepo.listAll()) {
    if (irow.iReferenceCount > 0) {
      vInUse.push_back(irow);
      continue;
    }

    common::ImageOutcome io;
    io.sName = irow.sName;
    auto rr = _crRuntime.removeImage(irow.sName);
    if (!rr.bSuccess) {
      // Row stays so the next pass retries the removal
      io.action = common::ImageAction::RemoveFailed;
      io.sMessage = rr.sErrorMessage;
      spLog->warn("Failed to remove unreferenced image '{}': {}", irow.sName, rr.sErrorMessage);
    } else {
      _irRepo.deleteUnreferenced(irow.sName);
      io.action = common::ImageAction::Removed;
      spLog->info("Removed unreferenced image '{}'", irow.sName);
    }
    vOutcomes.push_back(std::move(io));
  }

  if (!vInUse.empty()) {
    const int iInUse = static_cast<int>(vInUse.size());
    ThreadPool tpChecks(_iDigestWorkers > 0 ? std::min(_iDigestWorkers, iInUse) : 0);
    std::vector<std::future<common::ImageOutcome>> vFutures;
    vFutures.reserve(vInUse.size());
    for (const auto& irow : vInUse) {
      vFutures.push_back(tpChecks.submit([this, &irow] { return refresh(irow); }));
    }

    // Repository writes stay on this thread.
    for (std::size_t i = 0; i < vFutures.size(); ++i) {
      common::ImageOutcome io;
      try {
        io = vFutures[i].get();
      } catch (const std::exception& ex) {
        io.sName = vInUse[i].sName;
        io.iReferenceCount = vInUse[i].iReferenceCount;
        io.action = common::ImageAction::DigestCheckFailed;
        io.sMessage = ex.what();
      }

      switch (io.action) {
        case common::ImageAction::Pulled:
          _irRepo.updateDigest(io.sName, io.sMessage);
          spLog->info("Pulled image '{}' at {}", io.sName, io.sMessage);
          break;
        case common::ImageAction::Kept:
          spLog->info("Image '{}' is up to date", io.sName);
          break;
        case common::ImageAction::DigestCheckFailed:
          spLog->warn("Digest check failed for '{}': {}; keeping previous digest", io.sName,
                      io.sMessage);
          break;
        case common::ImageAction::PullFailed:
          spLog->warn("Failed to pull image '{}': {}", io.sName, io.sMessage);
          break;
        default:
          break;
      }
      vOutcomes.push_back(std::move(io));
    }
  }

  return vOutcomes;
}

}  // namespace dockops::core
