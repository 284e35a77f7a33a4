#pragma once

#include <string>
#include <vector>

#include "common/Types.hpp"
#include "dal/IImageRepository.hpp"
#include "runtime/IContainerRuntime.hpp"

namespace dockops::core {

/// Persistent reference-counted image catalog driven by a mark-and-sweep protocol.
///
///   reset()  zero every count
///   mark()   +1 per occurrence, across all stacks of the pass
///   sweep()  remove zero-count images; refresh digests of the rest
///
/// The phases are strictly ordered. Calling mark() before reset() or after sweep()
/// throws std::logic_error, as does sweep() twice.
/// Class abbreviation: il
class ImageLedger {
 public:
  /// iDigestWorkers bounds the parallel registry checks in sweep(); <= 0 means
  /// hardware concurrency.
  ImageLedger(dal::IImageRepository& irRepo, runtime::IContainerRuntime& crRuntime,
              int iDigestWorkers);
  ~ImageLedger();

  void reset();

  /// Record one occurrence of each canonical reference. Duplicates count separately.
  void mark(const std::vector<std::string>& vCanonicalRefs);

  /// Run once after every stack of the pass has been marked.
  std::vector<common::ImageOutcome> sweep();

 private:
  enum class Phase { Idle, Marking, Swept };

  /// Registry check and pull for one image still in use. Runs on a pool worker;
  /// touches only the runtime, never the repository.
  common::ImageOutcome refresh(const dal::ImageRow& irow);

  dal::IImageRepository& _irRepo;
  runtime::IContainerRuntime& _crRuntime;
  int _iDigestWorkers;
  Phase _phase = Phase::Idle;
};

}  // namespace dockops::core
