#include "gitops/GitSourceFetcher.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <unistd.h>

#include <chrono>
#include <system_error>
#include <vector>

namespace dockops::gitops {

GitSourceFetcher::GitSourceFetcher(runtime::IProcessRunner& prRunner,
                                   std::filesystem::path pathWorkDir, std::string sGitBin,
                                   int iDepth)
    : _prRunner(prRunner),
      _pathWorkDir(std::move(pathWorkDir)),
      _sGitBin(std::move(sGitBin)),
      _iDepth(iDepth) {}

GitSourceFetcher::~GitSourceFetcher() = default;

std::string GitSourceFetcher::normalizeUrl(const std::string& sUrl) {
  if (sUrl.rfind("github.com/", 0) == 0) {
    return "https://" + sUrl;
  }
  return sUrl;
}

std::filesystem::path GitSourceFetcher::nextCheckoutPath() {
  const auto iMillis = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
  return _pathWorkDir / ("tree-" + std::to_string(::getpid()) + "-" + std::to_string(iMillis) +
                         "-" + std::to_string(_iSequence.fetch_add(1)));
}

std::filesystem::path GitSourceFetcher::fetch(const std::string& sUrl) {
  auto spLog = common::Logger::get();
  const std::string sCloneUrl = normalizeUrl(sUrl);

  std::error_code ec;
  std::filesystem::create_directories(_pathWorkDir, ec);
  if (ec) {
    throw common::FetchError("work_dir_unavailable",
                             "Cannot create work directory " + _pathWorkDir.string() + ": " +
                                 ec.message());
  }

  const auto pathCheckout = nextCheckoutPath();
  std::vector<std::string> vArgs = {_sGitBin, "clone", "--quiet"};
  if (_iDepth > 0) {
    vArgs.push_back("--depth");
    vArgs.push_back(std::to_string(_iDepth));
  }
  vArgs.push_back(sCloneUrl);
  vArgs.push_back(pathCheckout.string());

  spLog->info("Cloning {} into {}", sCloneUrl, pathCheckout.string());

  runtime::ProcessResult pres;
  try {
    pres = _prRunner.run(vArgs);
  } catch (const std::exception& ex) {
    throw common::FetchError("clone_failed", "Failed to start git: " + std::string(ex.what()));
  }

  if (!pres.ok()) {
    cleanup(pathCheckout);
    std::string sErr = pres.sStderr;
    while (!sErr.empty() && (sErr.back() == '\n' || sErr.back() == '\r')) sErr.pop_back();
    throw common::FetchError("clone_failed", "Failed to clone " + sCloneUrl + ": " + sErr);
  }

  return pathCheckout;
}

void GitSourceFetcher::cleanup(const std::filesystem::path& pathTree) {
  std::error_code ec;
  std::filesystem::remove_all(pathTree, ec);
  if (ec) {
    common::Logger::get()->warn("Could not remove checkout {}: {}", pathTree.string(),
                                ec.message());
  }
}

}  // namespace dockops::gitops
