#include "core/SnapshotLoader.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/ImageReference.hpp"

#include <set>
#include <stdexcept>
#include <system_error>

namespace dockops::core {

namespace fs = std::filesystem;

namespace {

/// First existing regular file among the candidates, if any.
std::optional<fs::path> firstExisting(const fs::path& pathDir,
                                      const std::vector<std::string>& vNames) {
  std::error_code ec;
  for (const auto& sName : vNames) {
    auto pathCandidate = pathDir / sName;
    if (fs::is_regular_file(pathCandidate, ec)) {
      return pathCandidate;
    }
  }
  return std::nullopt;
}

YAML::Node loadYaml(const fs::path& pathFile, const std::string& sCode) {
  try {
    return YAML::LoadFile(pathFile.string());
  } catch (const YAML::Exception& ex) {
    throw common::SnapshotError(sCode, "Cannot parse " + pathFile.string() + ": " + ex.what());
  }
}

[[noreturn]] void failDefinition(const std::string& sComposePath, const std::string& sWhat) {
  throw common::SnapshotError("definition_malformed", sComposePath + ": " + sWhat);
}

/// Shape of the sections the volume materializer rewrites. Anything compose accepts
/// there is a mapping keyed by name or a sequence of mount entries.
void checkDefinitionShape(const YAML::Node& nDefinition, const std::string& sComposePath) {
  const YAML::Node nTop = nDefinition["volumes"];
  if (nTop && !nTop.IsNull()) {
    if (!nTop.IsMap()) {
      failDefinition(sComposePath, "top-level volumes must be a mapping of names");
    }
    for (auto it = nTop.begin(); it != nTop.end(); ++it) {
      if (!it->first.IsScalar()) {
        failDefinition(sComposePath, "top-level volume keys must be plain names");
      }
      if (!it->second.IsNull() && !it->second.IsMap()) {
        failDefinition(sComposePath, "volume '" + it->first.Scalar() + "' must be a mapping");
      }
    }
  }

  const YAML::Node nServices = nDefinition["services"];
  if (!nServices || nServices.IsNull()) {
    return;
  }
  if (!nServices.IsMap()) {
    failDefinition(sComposePath, "services must be a mapping");
  }
  for (auto it = nServices.begin(); it != nServices.end(); ++it) {
    if (!it->first.IsScalar()) {
      failDefinition(sComposePath, "service keys must be plain names");
    }
    const std::string sService = it->first.Scalar();
    const YAML::Node nService = it->second;
    if (!nService.IsMap()) {
      failDefinition(sComposePath, "service '" + sService + "' must be a mapping");
    }
    const YAML::Node nMounts = nService["volumes"];
    if (!nMounts || nMounts.IsNull()) continue;
    if (!nMounts.IsSequence()) {
      failDefinition(sComposePath, "volumes of service '" + sService + "' must be a sequence");
    }
    for (std::size_t i = 0; i < nMounts.size(); ++i) {
      const YAML::Node nEntry = nMounts[i];
      if (!nEntry.IsScalar() && !nEntry.IsMap()) {
        failDefinition(sComposePath, "mount " + std::to_string(i) + " of service '" + sService +
                                         "' must be a string or a mapping");
      }
    }
  }
}

std::string requireString(const YAML::Node& nItem, const char* pKey, const std::string& sCode,
                          const std::string& sWhere) {
  const YAML::Node nValue = nItem[pKey];
  if (!nValue || !nValue.IsScalar() || nValue.Scalar().empty()) {
    throw common::SnapshotError(sCode, sWhere + ": missing or empty '" + pKey + "'");
  }
  return nValue.Scalar();
}

/// A single path component: no separators, not "." or "..".
bool isPlainName(const std::string& sName) {
  return !sName.empty() && sName.find('/') == std::string::npos &&
         sName.find('\\') == std::string::npos && sName != "." && sName != "..";
}

/// Relative and does not climb out of the tree.
bool staysInsideTree(const std::string& sPath) {
  fs::path path(sPath);
  if (path.empty() || path.is_absolute()) return false;
  int iDepth = 0;
  for (const auto& part : path.lexically_normal()) {
    if (part == "..") {
      if (--iDepth < 0) return false;
    } else if (part != "." && !part.empty()) {
      ++iDepth;
    }
  }
  return true;
}

}  // namespace

SnapshotLoader::SnapshotLoader() = default;
SnapshotLoader::~SnapshotLoader() = default;

const std::vector<std::string>& SnapshotLoader::definitionFileNames() {
  static const std::vector<std::string> vNames = {
      "docker-compose.yml", "docker-compose.yaml", "compose.yml", "compose.yaml"};
  return vNames;
}

std::vector<std::string> SnapshotLoader::collectImages(const YAML::Node& nDefinition) {
  std::vector<std::string> vImages;
  std::vector<YAML::Node> vStack{nDefinition};

  // Depth-first, children pushed in reverse so document order is preserved.
  while (!vStack.empty()) {
    const YAML::Node nCurrent = vStack.back();
    vStack.pop_back();

    std::vector<YAML::Node> vChildren;
    if (nCurrent.IsMap()) {
      for (auto it = nCurrent.begin(); it != nCurrent.end(); ++it) {
        if (it->first.IsScalar() && it->first.Scalar() == "image" && it->second.IsScalar()) {
          if (!it->second.Scalar().empty()) vImages.push_back(it->second.Scalar());
          continue;
        }
        vChildren.push_back(it->second);
      }
    } else if (nCurrent.IsSequence()) {
      for (auto it = nCurrent.begin(); it != nCurrent.end(); ++it) {
        vChildren.push_back(*it);
      }
    }
    for (auto it = vChildren.rbegin(); it != vChildren.rend(); ++it) {
      vStack.push_back(*it);
    }
  }
  return vImages;
}

common::Snapshot SnapshotLoader::load(const fs::path& pathRoot) const {
  auto spLog = common::Logger::get();

  common::Snapshot snap;
  snap.pathRoot = pathRoot;

  for (const auto& sName : loadStackNames(pathRoot)) {
    snap.vStacks.push_back(loadStack(pathRoot, sName));
  }
  snap.vVolumes = loadVolumes(pathRoot);
  snap.oNetworkStorePath = loadNetworkStore(pathRoot);

  for (const auto& vs : snap.vVolumes) {
    if (vs.kind == common::VolumeKind::Binding && !snap.oNetworkStorePath) {
      throw common::SnapshotError(
          "network_store_missing",
          "Binding '" + vs.sId + "' is declared but nfs.yaml does not provide a path");
    }
  }

  spLog->info("Snapshot loaded: {} stack(s), {} volume spec(s)", snap.vStacks.size(),
              snap.vVolumes.size());
  return snap;
}

std::vector<std::string> SnapshotLoader::loadStackNames(const fs::path& pathRoot) const {
  auto oFile = firstExisting(pathRoot, {"stacks.yaml", "stacks.yml"});
  if (!oFile) {
    throw common::SnapshotError("stacks_missing", "stacks.yaml not found in source tree");
  }

  YAML::Node nList = loadYaml(*oFile, "stacks_malformed");
  if (!nList.IsSequence()) {
    throw common::SnapshotError("stacks_malformed", "stacks.yaml must be a sequence of {name}");
  }

  std::vector<std::string> vNames;
  std::set<std::string> setSeen;
  for (std::size_t i = 0; i < nList.size(); ++i) {
    const YAML::Node nItem = nList[i];
    const std::string sWhere = "stacks.yaml entry " + std::to_string(i);
    if (!nItem.IsMap()) {
      throw common::SnapshotError("stacks_malformed", sWhere + " is not a mapping");
    }
    std::string sName = requireString(nItem, "name", "stacks_malformed", sWhere);
    if (!isPlainName(sName)) {
      throw common::SnapshotError("stacks_malformed",
                                  sWhere + ": invalid stack name '" + sName + "'");
    }
    if (!setSeen.insert(sName).second) {
      throw common::SnapshotError("stacks_malformed", "Stack '" + sName + "' declared twice");
    }
    vNames.push_back(std::move(sName));
  }
  return vNames;
}

common::StackDeclaration SnapshotLoader::loadStack(const fs::path& pathRoot,
                                                   const std::string& sName) const {
  common::StackDeclaration sd;
  sd.sName = sName;
  sd.pathDir = pathRoot / sName;

  std::error_code ec;
  if (!fs::is_directory(sd.pathDir, ec)) {
    throw common::SnapshotError("stack_dir_missing",
                                "Stack '" + sName + "' has no directory in the source tree");
  }

  auto oDefinition = firstExisting(sd.pathDir, definitionFileNames());
  if (!oDefinition) {
    throw common::SnapshotError("definition_missing",
                                "Stack '" + sName + "' has no docker-compose file");
  }
  sd.sComposePath = oDefinition->lexically_relative(pathRoot).generic_string();

  sd.nDefinition = loadYaml(*oDefinition, "definition_malformed");
  if (!sd.nDefinition.IsMap()) {
    throw common::SnapshotError("definition_malformed",
                                sd.sComposePath + " is not a YAML mapping");
  }
  checkDefinitionShape(sd.nDefinition, sd.sComposePath);

  for (const auto& sRef : collectImages(sd.nDefinition)) {
    try {
      sd.vImages.push_back(ImageReference::canonicalize(sRef));
    } catch (const std::invalid_argument& ex) {
      throw common::SnapshotError("image_malformed", sd.sComposePath + ": " + ex.what());
    }
  }

  sd.vSecrets = loadSecrets(sd.pathDir, sName);
  return sd;
}

std::vector<common::VolumeSpec> SnapshotLoader::loadVolumes(const fs::path& pathRoot) const {
  std::vector<common::VolumeSpec> vSpecs;
  auto oFile = firstExisting(pathRoot, {"volumes.yaml", "volumes.yml"});
  if (!oFile) {
    return vSpecs;
  }

  YAML::Node nList = loadYaml(*oFile, "volumes_malformed");
  if (nList.IsNull()) {
    return vSpecs;
  }
  if (!nList.IsSequence()) {
    throw common::SnapshotError("volumes_malformed",
                                "volumes.yaml must be a sequence of {id, type, path}");
  }

  std::set<std::string> setSeen;
  for (std::size_t i = 0; i < nList.size(); ++i) {
    const YAML::Node nItem = nList[i];
    const std::string sWhere = "volumes.yaml entry " + std::to_string(i);
    if (!nItem.IsMap()) {
      throw common::SnapshotError("volumes_malformed", sWhere + " is not a mapping");
    }

    common::VolumeSpec vs;
    vs.sId = requireString(nItem, "id", "volumes_malformed", sWhere);
    const std::string sType = requireString(nItem, "type", "volumes_malformed", sWhere);
    vs.sPath = requireString(nItem, "path", "volumes_malformed", sWhere);

    if (sType == "volume") {
      vs.kind = common::VolumeKind::Volume;
    } else if (sType == "binding") {
      vs.kind = common::VolumeKind::Binding;
      if (!staysInsideTree(vs.sPath)) {
        throw common::SnapshotError(
            "volumes_malformed",
            sWhere + ": binding path '" + vs.sPath + "' must be relative to the tree");
      }
    } else {
      throw common::SnapshotError("volumes_malformed",
                                  sWhere + ": unknown type '" + sType + "'");
    }

    if (!isPlainName(vs.sId)) {
      throw common::SnapshotError("volumes_malformed", sWhere + ": invalid id '" + vs.sId + "'");
    }
    if (!setSeen.insert(vs.sId).second) {
      throw common::SnapshotError("volumes_malformed", "Volume id '" + vs.sId + "' declared twice");
    }
    vSpecs.push_back(std::move(vs));
  }
  return vSpecs;
}

std::optional<std::string> SnapshotLoader::loadNetworkStore(const fs::path& pathRoot) const {
  auto oFile = firstExisting(pathRoot, {"nfs.yaml", "nfs.yml"});
  if (!oFile) {
    return std::nullopt;
  }

  YAML::Node nConfig = loadYaml(*oFile, "network_store_malformed");
  if (!nConfig.IsMap()) {
    throw common::SnapshotError("network_store_malformed", "nfs.yaml must be a mapping {path}");
  }
  std::string sPath = requireString(nConfig, "path", "network_store_malformed", "nfs.yaml");
  if (!fs::path(sPath).is_absolute()) {
    throw common::SnapshotError("network_store_malformed",
                                "nfs.yaml path '" + sPath + "' must be absolute");
  }
  return sPath;
}

std::vector<common::SecretSpec> SnapshotLoader::loadSecrets(const fs::path& pathStackDir,
                                                            const std::string& sStack) const {
  std::vector<common::SecretSpec> vSpecs;
  auto oFile = firstExisting(pathStackDir, {"secrets.yaml", "secrets.yml"});
  if (!oFile) {
    return vSpecs;
  }

  YAML::Node nList = loadYaml(*oFile, "secrets_malformed");
  if (nList.IsNull()) {
    return vSpecs;
  }
  if (!nList.IsSequence()) {
    throw common::SnapshotError("secrets_malformed",
                                sStack + "/secrets.yaml must be a sequence of {id, env}");
  }

  std::set<std::string> setEnv;
  for (std::size_t i = 0; i < nList.size(); ++i) {
    const YAML::Node nItem = nList[i];
    const std::string sWhere = sStack + "/secrets.yaml entry " + std::to_string(i);
    if (!nItem.IsMap()) {
      throw common::SnapshotError("secrets_malformed", sWhere + " is not a mapping");
    }

    common::SecretSpec ss;
    ss.sId = requireString(nItem, "id", "secrets_malformed", sWhere);
    ss.sEnv = requireString(nItem, "env", "secrets_malformed", sWhere);
    if (!isPlainName(ss.sId)) {
      throw common::SnapshotError("secrets_malformed", sWhere + ": invalid id '" + ss.sId + "'");
    }
    if (!setEnv.insert(ss.sEnv).second) {
      throw common::SnapshotError("secrets_malformed",
                                  sWhere + ": env '" + ss.sEnv + "' targeted twice");
    }
    vSpecs.push_back(std::move(ss));
  }
  return vSpecs;
}

}  // namespace dockops::core
