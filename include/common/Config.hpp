#pragma once

#include <string>

namespace dockops::common {

/// Environment variable loader.
/// Loads all DOCKOPS_* env vars into a typed struct with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Required ──────────────────────────────────────────────────────────
  std::string sDbUrl;

  // ── Database ──────────────────────────────────────────────────────────
  int iDbPoolSize = 4;  // one connection is pinned by the pass lock

  // ── Secrets ───────────────────────────────────────────────────────────
  std::string sSecretsPath = "/etc/dockops/secrets";

  // ── Source fetching ───────────────────────────────────────────────────
  std::string sWorkDir = "/var/lib/dockops/checkouts";
  std::string sGitBin = "git";
  int iGitDepth = 1;  // 0 = full history

  // ── Container runtime ─────────────────────────────────────────────────
  std::string sDockerBin = "docker";
  int iDigestWorkers = 4;  // 0 = std::thread::hardware_concurrency()

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  /// Load and validate all config from environment variables.
  /// Throws on missing required vars or invalid constraints.
  static Config load();

 private:
  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var, return sDefault if unset or empty.
  static std::string getEnvOr(const char* pVarName, const std::string& sDefault);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);
};

}  // namespace dockops::common
