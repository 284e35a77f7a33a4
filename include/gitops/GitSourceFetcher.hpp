#pragma once

#include <atomic>
#include <filesystem>
#include <string>

#include "gitops/ISourceFetcher.hpp"
#include "runtime/IProcessRunner.hpp"

namespace dockops::gitops {

/// Shallow-clones a git remote into a unique directory under the work dir.
/// Class abbreviation: gsf
class GitSourceFetcher : public ISourceFetcher {
 public:
  GitSourceFetcher(runtime::IProcessRunner& prRunner, std::filesystem::path pathWorkDir,
                   std::string sGitBin = "git", int iDepth = 1);
  ~GitSourceFetcher() override;

  std::filesystem::path fetch(const std::string& sUrl) override;
  void cleanup(const std::filesystem::path& pathTree) override;

  /// Expand "github.com/owner/repo" shorthand to an https clone URL.
  static std::string normalizeUrl(const std::string& sUrl);

 private:
  std::filesystem::path nextCheckoutPath();

  runtime::IProcessRunner& _prRunner;
  std::filesystem::path _pathWorkDir;
  std::string _sGitBin;
  int _iDepth;
  std::atomic<int> _iSequence{0};
};

}  // namespace dockops::gitops
