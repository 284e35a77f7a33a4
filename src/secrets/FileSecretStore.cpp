#include "secrets/FileSecretStore.hpp"

#include "common/Logger.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace dockops::secrets {

FileSecretStore::FileSecretStore(std::filesystem::path pathRoot)
    : _pathRoot(std::move(pathRoot)) {}

FileSecretStore::~FileSecretStore() = default;

std::optional<std::string> FileSecretStore::read(const std::string& sId) {
  const auto pathSecret = _pathRoot / sId;

  std::error_code ec;
  if (!std::filesystem::is_regular_file(pathSecret, ec)) {
    return std::nullopt;
  }

  std::ifstream ifs(pathSecret, std::ios::binary);
  if (!ifs.is_open()) {
    common::Logger::get()->warn("Secret '{}' exists but cannot be opened", sId);
    return std::nullopt;
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  std::string sValue = oss.str();

  while (!sValue.empty() && (sValue.back() == '\n' || sValue.back() == '\r')) {
    sValue.pop_back();
  }
  return sValue;
}

}  // namespace dockops::secrets
