#include "common/Config.hpp"

#include "common/Logger.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace dockops::common {

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

std::string Config::getEnvOr(const char* pVarName, const std::string& sDefault) {
  std::string sValue = getEnv(pVarName);
  return sValue.empty() ? sDefault : sValue;
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  size_t uConsumed = 0;
  int iValue = 0;
  try {
    iValue = std::stoi(sValue, &uConsumed);
  } catch (const std::exception&) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  if (uConsumed != sValue.size()) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  return iValue;
}

Config Config::load() {
  Config cfg;

  // ── Required vars ──────────────────────────────────────────────────────
  cfg.sDbUrl = getEnv("DOCKOPS_DB_URL");
  if (cfg.sDbUrl.empty()) {
    throw std::runtime_error("Required environment variable DOCKOPS_DB_URL is not set");
  }

  // ── Optional vars with defaults ────────────────────────────────────────
  cfg.iDbPoolSize = getEnvInt("DOCKOPS_DB_POOL_SIZE", cfg.iDbPoolSize);
  cfg.sSecretsPath = getEnvOr("DOCKOPS_SECRETS_PATH", cfg.sSecretsPath);
  cfg.sWorkDir = getEnvOr("DOCKOPS_WORK_DIR", cfg.sWorkDir);
  cfg.sGitBin = getEnvOr("DOCKOPS_GIT_BIN", cfg.sGitBin);
  cfg.iGitDepth = getEnvInt("DOCKOPS_GIT_DEPTH", cfg.iGitDepth);
  cfg.sDockerBin = getEnvOr("DOCKOPS_DOCKER_BIN", cfg.sDockerBin);
  cfg.iDigestWorkers = getEnvInt("DOCKOPS_DIGEST_WORKERS", cfg.iDigestWorkers);
  cfg.sLogLevel = getEnvOr("DOCKOPS_LOG_LEVEL", cfg.sLogLevel);

  // ── Validation ─────────────────────────────────────────────────────────

  // The pass lock pins one connection for the whole pass
  if (cfg.iDbPoolSize < 2) {
    throw std::runtime_error(
        "DOCKOPS_DB_POOL_SIZE must be >= 2 (got " + std::to_string(cfg.iDbPoolSize) + ")");
  }

  if (cfg.iDigestWorkers < 0) {
    throw std::runtime_error(
        "DOCKOPS_DIGEST_WORKERS must be >= 0 (got " + std::to_string(cfg.iDigestWorkers) + ")");
  }

  if (cfg.iGitDepth < 0) {
    throw std::runtime_error(
        "DOCKOPS_GIT_DEPTH must be >= 0 (got " + std::to_string(cfg.iGitDepth) + ")");
  }

  try {
    Logger::parseLevel(cfg.sLogLevel);
  } catch (const std::invalid_argument& ex) {
    throw std::runtime_error("DOCKOPS_LOG_LEVEL: " + std::string(ex.what()));
  }

  return cfg;
}

}  // namespace dockops::common
