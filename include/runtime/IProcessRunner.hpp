#pragma once

#include <map>
#include <string>
#include <vector>

namespace dockops::runtime {

/// Captured result of a child process.
/// Class abbreviation: pres
struct ProcessResult {
  int iExitCode = -1;
  std::string sStdout;
  std::string sStderr;

  bool ok() const { return iExitCode == 0; }
};

/// Options for a child process.
/// Class abbreviation: popt
struct ProcessOptions {
  std::string sWorkingDir;
  std::map<std::string, std::string> mExtraEnv;  // added to (or overriding) the inherited environment
};

/// Pure abstract interface for running external commands.
class IProcessRunner {
 public:
  virtual ~IProcessRunner() = default;

  /// Run vArgs[0] (looked up on PATH) with the remaining args and wait for it.
  /// Throws std::runtime_error if the process cannot be started at all.
  virtual ProcessResult run(const std::vector<std::string>& vArgs,
                            const ProcessOptions& popt = {}) = 0;
};

}  // namespace dockops::runtime
