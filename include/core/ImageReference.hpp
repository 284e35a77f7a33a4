#pragma once

#include <string>

namespace dockops::core {

/// Parsed container image reference: [registry/]repository[:tag][@digest].
/// Class abbreviation: iref
struct ImageReference {
  std::string sRegistry;    // empty when the reference names no explicit registry host
  std::string sRepository;
  std::string sTag;         // empty when no tag was written
  std::string sDigest;      // "sha256:..." when pinned by digest

  static constexpr const char* kDefaultTag = "latest";

  /// Split a reference string. Throws std::invalid_argument on an empty or malformed one.
  static ImageReference parse(const std::string& sRef);

  /// Canonical identity used as the ledger key: an implicit tag is made explicit,
  /// digest-pinned references are kept verbatim, no registry is added.
  std::string canonical() const;

  /// Shorthand for parse(sRef).canonical().
  static std::string canonicalize(const std::string& sRef);
};

}  // namespace dockops::core
