#pragma once

#include <filesystem>

#include "common/Types.hpp"

namespace dockops::volumes {

/// Pure abstract interface for mirroring a directory tree to a destination.
class IDirectoryMirror {
 public:
  virtual ~IDirectoryMirror() = default;

  /// Delete whatever exists at pathDest, then copy pathSrc recursively into it.
  virtual common::RuntimeResult replace(const std::filesystem::path& pathSrc,
                                        const std::filesystem::path& pathDest) = 0;
};

}  // namespace dockops::volumes
