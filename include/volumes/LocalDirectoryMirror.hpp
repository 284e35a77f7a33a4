#pragma once

#include "volumes/IDirectoryMirror.hpp"

namespace dockops::volumes {

/// std::filesystem mirror for a network store mounted on the local host.
/// Class abbreviation: ldm
class LocalDirectoryMirror : public IDirectoryMirror {
 public:
  LocalDirectoryMirror();
  ~LocalDirectoryMirror() override;

  common::RuntimeResult replace(const std::filesystem::path& pathSrc,
                                const std::filesystem::path& pathDest) override;
};

}  // namespace dockops::volumes
