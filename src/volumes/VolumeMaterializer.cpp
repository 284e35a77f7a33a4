#include "volumes/VolumeMaterializer.hpp"

#include "common/Logger.hpp"

#include <stdexcept>

namespace dockops::volumes {

VolumeMaterializer::VolumeMaterializer(runtime::IContainerRuntime& crRuntime,
                                       IDirectoryMirror& dmMirror,
                                       const common::Snapshot& snap)
    : _crRuntime(crRuntime),
      _dmMirror(dmMirror),
      _pathRoot(snap.pathRoot),
      _oBase(snap.oNetworkStorePath),
      _vSpecs(snap.vVolumes) {
  for (const auto& vs : _vSpecs) {
    _mSpecs.emplace(vs.sId, vs);
  }
}

VolumeMaterializer::~VolumeMaterializer() = default;

std::string VolumeMaterializer::bindingTarget(const std::string& sId) const {
  std::string sBase = _oBase.value_or("");
  while (sBase.size() > 1 && sBase.back() == '/') {
    sBase.pop_back();
  }
  return sBase + "/" + sId;
}

std::vector<common::VolumeFailure> VolumeMaterializer::prepare() {
  auto spLog = common::Logger::get();
  std::vector<common::VolumeFailure> vFailures;

  for (const auto& vs : _vSpecs) {
    const std::string& sId = vs.sId;
    common::RuntimeResult rr;
    if (vs.kind == common::VolumeKind::Volume) {
      rr = _crRuntime.ensureVolume(vs.sPath);
      if (rr.bSuccess) spLog->info("Volume '{}' ready", vs.sPath);
    } else {
      const auto pathDest = bindingTarget(sId);
      rr = _dmMirror.replace(_pathRoot / vs.sPath, pathDest);
      if (rr.bSuccess) spLog->info("Binding '{}' mirrored to {}", sId, pathDest);
    }

    if (!rr.bSuccess) {
      spLog->error("Failed to materialize '{}': {}", sId, rr.sErrorMessage);
      _setFailed.insert(sId);
      vFailures.push_back({sId, rr.sErrorMessage});
    }
  }
  return vFailures;
}

std::optional<std::string> VolumeMaterializer::rewriteShortMount(
    const std::string& sEntry, MaterializedStack& msOut) const {
  const auto uColon = sEntry.find(':');
  if (uColon == std::string::npos) {
    return std::nullopt;  // anonymous volume, no source token
  }
  const std::string sToken = sEntry.substr(0, uColon);
  auto it = _mSpecs.find(sToken);
  if (it == _mSpecs.end()) {
    return std::nullopt;
  }
  msOut.setReferencedIds.insert(sToken);
  if (it->second.kind != common::VolumeKind::Binding) {
    return std::nullopt;
  }
  return bindingTarget(sToken) + sEntry.substr(uColon);
}

void VolumeMaterializer::rewriteServiceMounts(YAML::Node& nDefinition,
                                              MaterializedStack& msOut) const {
  const YAML::Node& ncDefinition = nDefinition;
  YAML::Node nServices = ncDefinition["services"];
  if (!nServices || !nServices.IsMap()) {
    return;
  }

  for (auto itService = nServices.begin(); itService != nServices.end(); ++itService) {
    const YAML::Node& ncService = itService->second;
    if (!ncService.IsMap()) continue;
    YAML::Node nMounts = ncService["volumes"];
    if (!nMounts || !nMounts.IsSequence()) continue;

    for (std::size_t i = 0; i < nMounts.size(); ++i) {
      YAML::Node nEntry = nMounts[i];

      if (nEntry.IsScalar()) {
        if (auto oRewritten = rewriteShortMount(nEntry.Scalar(), msOut)) {
          nEntry = *oRewritten;
        }
        continue;
      }

      if (!nEntry.IsMap()) continue;
      const YAML::Node& ncEntry = nEntry;
      const YAML::Node nSource = ncEntry["source"];
      if (!nSource || !nSource.IsScalar()) continue;

      const std::string sToken = nSource.Scalar();
      auto it = _mSpecs.find(sToken);
      if (it == _mSpecs.end()) continue;

      msOut.setReferencedIds.insert(sToken);
      if (it->second.kind == common::VolumeKind::Binding) {
        nEntry["source"] = bindingTarget(sToken);
        nEntry["type"] = "bind";
      }
    }
  }
}

void VolumeMaterializer::rewriteTopLevelVolumes(YAML::Node& nDefinition,
                                                const MaterializedStack& msOut) const {
  const YAML::Node& ncDefinition = nDefinition;
  YAML::Node nTop = ncDefinition["volumes"];

  std::set<std::string> setDeclared;
  if (nTop && nTop.IsMap()) {
    for (auto it = nTop.begin(); it != nTop.end(); ++it) {
      setDeclared.insert(it->first.as<std::string>());
    }
  }

  std::set<std::string> setTouched = setDeclared;
  setTouched.insert(msOut.setReferencedIds.begin(), msOut.setReferencedIds.end());

  for (const auto& sId : setTouched) {
    auto it = _mSpecs.find(sId);
    if (it == _mSpecs.end()) continue;

    if (it->second.kind == common::VolumeKind::Binding) {
      if (setDeclared.count(sId) > 0) {
        nTop.remove(sId);
      }
      continue;
    }

    YAML::Node nDecl(YAML::NodeType::Map);
    nDecl["external"] = true;
    nDecl["name"] = it->second.sPath;
    nDefinition["volumes"][sId] = nDecl;
  }

  if (nTop && nTop.IsMap() && nTop.size() == 0) {
    nDefinition.remove("volumes");
  }
}

MaterializedStack VolumeMaterializer::materialize(const common::StackDeclaration& sdStack) const {
  MaterializedStack msOut;
  YAML::Node nDefinition = YAML::Clone(sdStack.nDefinition);

  rewriteServiceMounts(nDefinition, msOut);
  rewriteTopLevelVolumes(nDefinition, msOut);

  for (const auto& sId : msOut.setReferencedIds) {
    if (_setFailed.count(sId) > 0) {
      msOut.vUnavailableIds.push_back(sId);
    }
  }

  msOut.sDefinition = render(nDefinition);
  return msOut;
}

std::string VolumeMaterializer::render(const YAML::Node& nDefinition) {
  YAML::Emitter emOut;
  emOut << nDefinition;
  if (!emOut.good()) {
    throw std::runtime_error("Failed to serialize stack definition: " + emOut.GetLastError());
  }
  return std::string(emOut.c_str()) + "\n";
}

}  // namespace dockops::volumes
