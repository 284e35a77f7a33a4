#pragma once

#include "runtime/IProcessRunner.hpp"

namespace dockops::runtime {

/// fork/execvpe runner capturing stdout and stderr through pipes.
/// stdin is redirected from /dev/null.
/// Class abbreviation: prun
class ProcessRunner : public IProcessRunner {
 public:
  ProcessRunner();
  ~ProcessRunner() override;

  ProcessResult run(const std::vector<std::string>& vArgs,
                    const ProcessOptions& popt = {}) override;
};

}  // namespace dockops::runtime
