#include "core/ImageReference.hpp"

#include <stdexcept>

namespace dockops::core {

namespace {

/// A leading path component is a registry host if it looks like one.
bool isRegistryHost(const std::string& sComponent) {
  return sComponent.find('.') != std::string::npos ||
         sComponent.find(':') != std::string::npos || sComponent == "localhost";
}

}  // namespace

ImageReference ImageReference::parse(const std::string& sRef) {
  if (sRef.empty()) {
    throw std::invalid_argument("empty image reference");
  }
  if (sRef.find_first_of(" \t\r\n") != std::string::npos) {
    throw std::invalid_argument("image reference contains whitespace: '" + sRef + "'");
  }

  ImageReference iref;
  std::string sRest = sRef;

  const auto uAt = sRest.find('@');
  if (uAt != std::string::npos) {
    iref.sDigest = sRest.substr(uAt + 1);
    sRest = sRest.substr(0, uAt);
    if (iref.sDigest.empty()) {
      throw std::invalid_argument("image reference has an empty digest: '" + sRef + "'");
    }
  }

  // A ':' after the last '/' separates the tag; earlier ones belong to a registry port
  const auto uSlash = sRest.rfind('/');
  const auto uColon = sRest.rfind(':');
  if (uColon != std::string::npos && (uSlash == std::string::npos || uColon > uSlash)) {
    iref.sTag = sRest.substr(uColon + 1);
    sRest = sRest.substr(0, uColon);
    if (iref.sTag.empty()) {
      throw std::invalid_argument("image reference has an empty tag: '" + sRef + "'");
    }
  }

  const auto uFirstSlash = sRest.find('/');
  if (uFirstSlash != std::string::npos && isRegistryHost(sRest.substr(0, uFirstSlash))) {
    iref.sRegistry = sRest.substr(0, uFirstSlash);
    sRest = sRest.substr(uFirstSlash + 1);
  }

  if (sRest.empty()) {
    throw std::invalid_argument("image reference has no repository: '" + sRef + "'");
  }
  iref.sRepository = sRest;
  return iref;
}

std::string ImageReference::canonical() const {
  std::string sOut = sRegistry.empty() ? sRepository : sRegistry + "/" + sRepository;
  if (!sDigest.empty()) {
    if (!sTag.empty()) sOut += ":" + sTag;
    return sOut + "@" + sDigest;
  }
  return sOut + ":" + (sTag.empty() ? std::string(kDefaultTag) : sTag);
}

std::string ImageReference::canonicalize(const std::string& sRef) {
  return parse(sRef).canonical();
}

}  // namespace dockops::core
