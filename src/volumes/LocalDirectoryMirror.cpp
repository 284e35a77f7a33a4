#include "volumes/LocalDirectoryMirror.hpp"

#include <system_error>

namespace dockops::volumes {

namespace fs = std::filesystem;

LocalDirectoryMirror::LocalDirectoryMirror() = default;
LocalDirectoryMirror::~LocalDirectoryMirror() = default;

common::RuntimeResult LocalDirectoryMirror::replace(const fs::path& pathSrc,
                                                    const fs::path& pathDest) {
  std::error_code ec;
  if (!fs::is_directory(pathSrc, ec)) {
    return {false, "source directory " + pathSrc.string() + " does not exist"};
  }

  fs::remove_all(pathDest, ec);
  if (ec) {
    return {false, "cannot clear " + pathDest.string() + ": " + ec.message()};
  }

  if (pathDest.has_parent_path()) {
    fs::create_directories(pathDest.parent_path(), ec);
    if (ec) {
      return {false, "cannot create " + pathDest.parent_path().string() + ": " + ec.message()};
    }
  }

  fs::copy(pathSrc, pathDest, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
  if (ec) {
    return {false, "cannot copy " + pathSrc.string() + " to " + pathDest.string() + ": " +
                       ec.message()};
  }
  return {true, ""};
}

}  // namespace dockops::volumes
