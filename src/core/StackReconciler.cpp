#include "core/StackReconciler.hpp"

#include "common/Logger.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace dockops::core {

StackReconciler::StackReconciler(dal::IStackRepository& srRepo,
                                 runtime::IContainerRuntime& crRuntime)
    : _srRepo(srRepo), _crRuntime(crRuntime) {}

StackReconciler::~StackReconciler() = default;

std::string StackReconciler::computeHash(const std::string& sDefinition) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> upCtx(EVP_MD_CTX_new(),
                                                                 EVP_MD_CTX_free);
  if (!upCtx) {
    throw std::runtime_error("Failed to allocate digest context");
  }

  unsigned char vDigest[EVP_MAX_MD_SIZE];
  unsigned int uLen = 0;
  if (EVP_DigestInit_ex(upCtx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(upCtx.get(), sDefinition.data(), sDefinition.size()) != 1 ||
      EVP_DigestFinal_ex(upCtx.get(), vDigest, &uLen) != 1) {
    throw std::runtime_error("SHA-256 digest failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string sHex;
  sHex.reserve(uLen * 2);
  for (unsigned int i = 0; i < uLen; ++i) {
    sHex += kHex[vDigest[i] >> 4];
    sHex += kHex[vDigest[i] & 0x0F];
  }
  return sHex;
}

common::StackOutcome StackReconciler::reconcile(const std::string& sStackName,
                                                const std::string& sRepositoryUrl,
                                                const std::string& sDefinition,
                                                const std::filesystem::path& pathStackDir,
                                                const common::EnvMap& envSecrets) {
  auto spLog = common::Logger::get();

  common::StackOutcome so;
  so.sName = sStackName;
  so.sHash = computeHash(sDefinition);

  auto oRow = _srRepo.findByName(sStackName, sRepositoryUrl);
  if (oRow && oRow->sHash == so.sHash && oRow->status == common::StackStatus::Deployed) {
    so.action = common::StackAction::Unchanged;
    spLog->info("Stack '{}' unchanged ({}), skipping deploy", sStackName,
                so.sHash.substr(0, 12));
    return so;
  }

  spLog->info("Deploying stack '{}' ({}) via {}", sStackName, so.sHash.substr(0, 12),
              _crRuntime.name());
  auto rr = _crRuntime.deploy(sStackName, sDefinition, pathStackDir, envSecrets);
  if (!rr.bSuccess) {
    // Hash is stored anyway; the error status forces a retry next pass.
    _srRepo.recordDeployment(sStackName, sRepositoryUrl, so.sHash, common::StackStatus::Error);
    so.action = common::StackAction::DeployFailed;
    so.sMessage = rr.sErrorMessage;
    spLog->error("Deploy of stack '{}' failed: {}", sStackName, rr.sErrorMessage);
    return so;
  }

  _srRepo.recordDeployment(sStackName, sRepositoryUrl, so.sHash, common::StackStatus::Deployed);
  so.action = common::StackAction::Deployed;
  spLog->info("Stack '{}' deployed", sStackName);
  return so;
}

}  // namespace dockops::core
