#include "runtime/DockerCliRuntime.hpp"

#include "common/Logger.hpp"

#include <nlohmann/json.hpp>
#include <openssl/crypto.h>

#include <stdlib.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace dockops::runtime {

namespace {

std::string trimmed(std::string sValue) {
  while (!sValue.empty() && (sValue.back() == '\n' || sValue.back() == '\r' ||
                             sValue.back() == ' ')) {
    sValue.pop_back();
  }
  return sValue;
}

/// Hidden 0600 definition file created beside the stack's own files, removed on scope
/// exit. The CLI resolves relative paths against the file's directory.
class DefinitionFile {
 public:
  explicit DefinitionFile(const std::filesystem::path& pathDir) {
    std::filesystem::path pathBase =
        pathDir.empty() ? std::filesystem::temp_directory_path() : pathDir;
    std::string sTemplate = (pathBase / ".dockops-deploy-XXXXXX.yml").string();
    int iFd = ::mkstemps(sTemplate.data(), 4);
    if (iFd < 0) {
      throw std::runtime_error("Cannot create definition file under " + pathBase.string() +
                               ": " + std::strerror(errno));
    }
    ::close(iFd);
    _path = sTemplate;
  }
  ~DefinitionFile() {
    std::error_code ec;
    std::filesystem::remove(_path, ec);
  }
  DefinitionFile(const DefinitionFile&) = delete;
  DefinitionFile& operator=(const DefinitionFile&) = delete;

  const std::filesystem::path& path() const { return _path; }

 private:
  std::filesystem::path _path;
};

}  // namespace

DockerCliRuntime::DockerCliRuntime(IProcessRunner& prRunner, std::string sDockerBin)
    : _prRunner(prRunner), _sDockerBin(std::move(sDockerBin)) {}

DockerCliRuntime::~DockerCliRuntime() = default;

std::string DockerCliRuntime::name() const { return "docker-swarm"; }

common::RuntimeResult DockerCliRuntime::exec(const std::vector<std::string>& vArgs,
                                             const ProcessOptions& popt) {
  std::vector<std::string> vFull;
  vFull.reserve(vArgs.size() + 1);
  vFull.push_back(_sDockerBin);
  vFull.insert(vFull.end(), vArgs.begin(), vArgs.end());

  try {
    auto pres = _prRunner.run(vFull, popt);
    if (pres.ok()) {
      return {true, ""};
    }
    std::string sErr = trimmed(pres.sStderr);
    if (sErr.empty()) sErr = "exit code " + std::to_string(pres.iExitCode);
    return {false, sErr};
  } catch (const std::exception& ex) {
    return {false, ex.what()};
  }
}

common::RuntimeResult DockerCliRuntime::deploy(const std::string& sStackName,
                                               const std::string& sDefinition,
                                               const std::filesystem::path& pathContext,
                                               const common::EnvMap& envSecrets) {
  try {
    DefinitionFile dfCompose(pathContext);
    const std::filesystem::path& pathCompose = dfCompose.path();
    {
      std::ofstream ofs(pathCompose, std::ios::binary | std::ios::trunc);
      if (!ofs) {
        return {false, "cannot write definition to " + pathCompose.string()};
      }
      ofs << sDefinition;
    }

    ProcessOptions popt;
    popt.mExtraEnv.insert(envSecrets.begin(), envSecrets.end());
    auto rr = exec({"stack", "deploy", "--with-registry-auth", "-c", pathCompose.string(),
                    sStackName},
                   popt);

    // popt's copy of the secret values goes away with this scope
    for (auto& [sKey, sValue] : popt.mExtraEnv) {
      OPENSSL_cleanse(sValue.data(), sValue.size());
    }
    return rr;
  } catch (const std::exception& ex) {
    return {false, ex.what()};
  }
}

common::RuntimeResult DockerCliRuntime::removeStack(const std::string& sStackName) {
  return exec({"stack", "rm", sStackName});
}

common::RuntimeResult DockerCliRuntime::pullImage(const std::string& sImageRef) {
  return exec({"image", "pull", "--quiet", sImageRef});
}

common::RuntimeResult DockerCliRuntime::removeImage(const std::string& sImageRef) {
  auto rr = exec({"image", "rm", sImageRef});
  if (!rr.bSuccess && rr.sErrorMessage.find("No such image") != std::string::npos) {
    common::Logger::get()->debug("Image '{}' already absent locally", sImageRef);
    return {true, ""};
  }
  return rr;
}

common::RuntimeResult DockerCliRuntime::ensureVolume(const std::string& sVolumeName) {
  if (exec({"volume", "inspect", sVolumeName}).bSuccess) {
    return {true, ""};
  }
  return exec({"volume", "create", sVolumeName});
}

std::optional<std::string> DockerCliRuntime::queryManifestDigest(const std::string& sImageRef) {
  std::vector<std::string> vArgs = {_sDockerBin, "buildx",   "imagetools",
                                    "inspect",   "--format", "{{json .Manifest}}",
                                    sImageRef};
  try {
    auto pres = _prRunner.run(vArgs);
    if (!pres.ok()) {
      common::Logger::get()->debug("Registry query for '{}' failed: {}", sImageRef,
                                   trimmed(pres.sStderr));
      return std::nullopt;
    }
    return parseManifestDigest(pres.sStdout);
  } catch (const std::exception& ex) {
    common::Logger::get()->debug("Registry query for '{}' failed: {}", sImageRef, ex.what());
    return std::nullopt;
  }
}

std::optional<std::string> DockerCliRuntime::parseManifestDigest(const std::string& sJson) {
  auto j = nlohmann::json::parse(sJson, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) {
    return std::nullopt;
  }
  auto it = j.find("digest");
  if (it == j.end() || !it->is_string()) {
    return std::nullopt;
  }
  auto sDigest = it->get<std::string>();
  if (sDigest.empty()) {
    return std::nullopt;
  }
  return sDigest;
}

}  // namespace dockops::runtime
