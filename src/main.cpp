#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/PassOrchestrator.hpp"
#include "dal/AdvisoryPassLock.hpp"
#include "dal/ConnectionPool.hpp"
#include "dal/ImageRepository.hpp"
#include "dal/Schema.hpp"
#include "dal/SourceCacheRepository.hpp"
#include "dal/StackRepository.hpp"
#include "gitops/GitSourceFetcher.hpp"
#include "runtime/DockerCliRuntime.hpp"
#include "runtime/ProcessRunner.hpp"
#include "secrets/FileSecretStore.hpp"
#include "volumes/LocalDirectoryMirror.hpp"

#ifndef DOCKOPS_VERSION
#define DOCKOPS_VERSION "0.0.0"
#endif

namespace {

void printUsage(std::ostream& os) {
  os << "Usage:\n"
        "  dockops watch <url> [--refresh]\n"
        "                           run one sync pass for a source tree\n"
        "  dockops status [--json]  show synced sources, stacks and images\n"
        "  dockops stop             remove every managed stack and image\n"
        "  dockops version          print the version\n";
}

void printSummary(const dockops::common::PassSummary& ps) {
  std::cout << "Synced " << ps.sUrl << "\n";
  std::cout << "Stacks:\n";
  for (const auto& so : ps.vStacks) {
    std::cout << "  " << so.sName << ": " << dockops::common::toString(so.action);
    if (!so.sMessage.empty()) std::cout << " (" << so.sMessage << ")";
    std::cout << "\n";
  }
  std::cout << "Images:\n";
  for (const auto& io : ps.vImages) {
    std::cout << "  " << io.sName << ": " << dockops::common::toString(io.action);
    if (io.action != dockops::common::ImageAction::Pulled && !io.sMessage.empty()) {
      std::cout << " (" << io.sMessage << ")";
    }
    std::cout << "\n";
  }
  for (const auto& vf : ps.vVolumeFailures) {
    std::cout << "Volume " << vf.sId << " failed: " << vf.sMessage << "\n";
  }
}

void printStatus(const dockops::core::StatusReport& rpt) {
  if (rpt.empty()) {
    std::cout << "Nothing has been synced yet. Run 'dockops watch <url>' first.\n";
    return;
  }
  const auto j = dockops::core::toJson(rpt);
  std::cout << "Sources:\n";
  for (const auto& jSource : j["sources"]) {
    std::cout << "  " << jSource["url"].get<std::string>() << " (last synced "
              << jSource["last_synced_at"].get<std::string>() << ")\n";
  }
  std::cout << "Stacks:\n";
  for (const auto& row : rpt.vStacks) {
    std::cout << "  " << row.sName << "  " << dockops::common::toString(row.status) << "  "
              << (row.sHash.empty() ? "-" : row.sHash.substr(0, 12)) << "\n";
  }
  std::cout << "Images:\n";
  for (const auto& row : rpt.vImages) {
    std::cout << "  " << row.sName << "  refs=" << row.iReferenceCount << "\n";
  }
}

}  // namespace

int main(int argc, char** argv) {
  std::vector<std::string> vArgs(argv + 1, argv + argc);
  if (vArgs.empty()) {
    printUsage(std::cerr);
    return 2;
  }

  const std::string sCommand = vArgs[0];
  if (sCommand == "version") {
    std::cout << "dockops " << DOCKOPS_VERSION << "\n";
    return 0;
  }
  if (sCommand == "help" || sCommand == "--help" || sCommand == "-h") {
    printUsage(std::cout);
    return 0;
  }

  const bool bWatch =
      sCommand == "watch" &&
      (vArgs.size() == 2 || (vArgs.size() == 3 && vArgs[2] == "--refresh"));
  const bool bStatus =
      sCommand == "status" && (vArgs.size() == 1 || (vArgs.size() == 2 && vArgs[1] == "--json"));
  const bool bStop = sCommand == "stop" && vArgs.size() == 1;
  if (!bWatch && !bStatus && !bStop) {
    printUsage(std::cerr);
    return 2;
  }

  try {
    // ── Configuration and logging ────────────────────────────────────────
    auto cfgApp = dockops::common::Config::load();
    dockops::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = dockops::common::Logger::get();

    // ── State store ──────────────────────────────────────────────────────
    auto cpPool = std::make_unique<dockops::dal::ConnectionPool>(cfgApp.sDbUrl,
                                                                 cfgApp.iDbPoolSize);
    spLog->info("ConnectionPool initialized (size={}, db={})", cfgApp.iDbPoolSize,
                dockops::dal::ConnectionPool::redactUrl(cfgApp.sDbUrl));
    dockops::dal::ensureSchema(*cpPool);

    dockops::dal::ImageRepository irImages(*cpPool);
    dockops::dal::StackRepository srStacks(*cpPool);
    dockops::dal::SourceCacheRepository scrSources(*cpPool);
    dockops::dal::AdvisoryPassLock aplLock(*cpPool);

    // ── Collaborators ────────────────────────────────────────────────────
    dockops::runtime::ProcessRunner prRunner;
    dockops::runtime::DockerCliRuntime dcrRuntime(prRunner, cfgApp.sDockerBin);
    dockops::gitops::GitSourceFetcher gsfFetcher(prRunner, cfgApp.sWorkDir, cfgApp.sGitBin,
                                                 cfgApp.iGitDepth);
    dockops::volumes::LocalDirectoryMirror ldmMirror;
    dockops::secrets::FileSecretStore fssSecrets(cfgApp.sSecretsPath);

    dockops::core::PassOrchestrator poOrchestrator({irImages, srStacks, scrSources, aplLock,
                                                    gsfFetcher, dcrRuntime, ldmMirror,
                                                    fssSecrets, cfgApp.iDigestWorkers});

    if (bWatch) {
      auto ps = poOrchestrator.sync(dockops::gitops::GitSourceFetcher::normalizeUrl(vArgs[1]),
                                    vArgs.size() == 3);
      printSummary(ps);
    } else if (bStatus) {
      auto rpt = poOrchestrator.status();
      if (vArgs.size() == 2) {
        std::cout << dockops::core::toJson(rpt).dump(2) << "\n";
      } else {
        printStatus(rpt);
      }
    } else {
      auto tr = poOrchestrator.teardown();
      std::cout << "Removed " << tr.iStacksRemoved << " stack(s) and " << tr.iImagesRemoved
                << " image(s)\n";
      for (const auto& sFailure : tr.vFailures) {
        std::cout << "  could not remove " << sFailure << "\n";
      }
    }
    return 0;
  } catch (const dockops::common::AppError& ex) {
    dockops::common::Logger::get()->error("[{}] {}", ex._sErrorCode, ex.what());
    return ex._iExitCode;
  } catch (const std::exception& ex) {
    dockops::common::Logger::get()->critical("Fatal: {}", ex.what());
    return EXIT_FAILURE;
  }
}
