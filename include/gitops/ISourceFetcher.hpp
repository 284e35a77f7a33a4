#pragma once

#include <filesystem>
#include <string>

namespace dockops::gitops {

/// Pure abstract interface for materializing a remote source tree locally.
class ISourceFetcher {
 public:
  virtual ~ISourceFetcher() = default;

  /// Fetch the tree at sUrl into a fresh local directory and return its path.
  /// Throws common::FetchError on failure.
  virtual std::filesystem::path fetch(const std::string& sUrl) = 0;

  /// Remove a directory previously returned by fetch(). Never throws.
  virtual void cleanup(const std::filesystem::path& pathTree) = 0;
};

}  // namespace dockops::gitops
