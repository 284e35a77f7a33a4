#pragma once

#include <filesystem>

#include "secrets/ISecretStore.hpp"

namespace dockops::secrets {

/// One file per secret under a fixed root: {root}/{id}.
/// Trailing CR/LF is stripped from the file contents.
/// Class abbreviation: fss
class FileSecretStore : public ISecretStore {
 public:
  explicit FileSecretStore(std::filesystem::path pathRoot);
  ~FileSecretStore() override;

  std::optional<std::string> read(const std::string& sId) override;

  const std::filesystem::path& root() const { return _pathRoot; }

 private:
  std::filesystem::path _pathRoot;
};

}  // namespace dockops::secrets
