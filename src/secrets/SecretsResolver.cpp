#include "secrets/SecretsResolver.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <openssl/crypto.h>

#include <string>
#include <vector>

namespace dockops::secrets {

SecretsResolver::SecretsResolver(ISecretStore& ssStore) : _ssStore(ssStore) {}
SecretsResolver::~SecretsResolver() = default;

common::EnvMap SecretsResolver::resolve(const common::StackDeclaration& sdStack) {
  common::EnvMap envResolved;
  std::vector<std::string> vMissing;

  for (const auto& ssSpec : sdStack.vSecrets) {
    auto oValue = _ssStore.read(ssSpec.sId);
    if (!oValue) {
      vMissing.push_back(ssSpec.sId);
      continue;
    }
    envResolved[ssSpec.sEnv] = std::move(*oValue);
  }

  if (!vMissing.empty()) {
    for (auto& [sEnv, sValue] : envResolved) {
      OPENSSL_cleanse(sValue.data(), sValue.size());
    }

    std::string sList;
    for (const auto& sId : vMissing) {
      if (!sList.empty()) sList += ", ";
      sList += sId;
    }
    throw common::SecretNotFoundError(
        "secret_missing", "Stack '" + sdStack.sName + "' is missing secret(s): " + sList);
  }

  if (!envResolved.empty()) {
    common::Logger::get()->debug("Resolved {} secret(s) for stack '{}'", envResolved.size(),
                                 sdStack.sName);
  }
  return envResolved;
}

}  // namespace dockops::secrets
