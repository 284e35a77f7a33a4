#include "runtime/ProcessRunner.hpp"

#include <openssl/crypto.h>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

extern char** environ;

namespace dockops::runtime {

namespace {

/// Build the child environment before fork; nothing after fork may allocate.
std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& mExtraEnv) {
  std::vector<std::string> vEnv;
  for (char** pEntry = environ; pEntry != nullptr && *pEntry != nullptr; ++pEntry) {
    std::string sEntry(*pEntry);
    const auto uEq = sEntry.find('=');
    const std::string sKey = sEntry.substr(0, uEq);
    if (mExtraEnv.find(sKey) == mExtraEnv.end()) {
      vEnv.push_back(std::move(sEntry));
    }
  }
  for (const auto& [sKey, sValue] : mExtraEnv) {
    vEnv.push_back(sKey + "=" + sValue);
  }
  return vEnv;
}

void closePipe(int vFds[2]) {
  if (vFds[0] >= 0) ::close(vFds[0]);
  if (vFds[1] >= 0) ::close(vFds[1]);
}

}  // namespace

ProcessRunner::ProcessRunner() = default;
ProcessRunner::~ProcessRunner() = default;

ProcessResult ProcessRunner::run(const std::vector<std::string>& vArgs,
                                 const ProcessOptions& popt) {
  if (vArgs.empty()) {
    throw std::invalid_argument("ProcessRunner::run called without a command");
  }

  std::vector<std::string> vEnv = buildEnvironment(popt.mExtraEnv);
  std::vector<char*> vEnvPtrs;
  vEnvPtrs.reserve(vEnv.size() + 1);
  for (auto& sEntry : vEnv) vEnvPtrs.push_back(sEntry.data());
  vEnvPtrs.push_back(nullptr);

  std::vector<std::string> vArgCopy = vArgs;
  std::vector<char*> vArgPtrs;
  vArgPtrs.reserve(vArgCopy.size() + 1);
  for (auto& sArg : vArgCopy) vArgPtrs.push_back(sArg.data());
  vArgPtrs.push_back(nullptr);

  int vOut[2] = {-1, -1};
  int vErr[2] = {-1, -1};
  if (::pipe2(vOut, O_CLOEXEC) != 0 || ::pipe2(vErr, O_CLOEXEC) != 0) {
    const int iErrno = errno;
    closePipe(vOut);
    closePipe(vErr);
    throw std::runtime_error(std::string("pipe failed: ") + std::strerror(iErrno));
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int iErrno = errno;
    closePipe(vOut);
    closePipe(vErr);
    throw std::runtime_error(std::string("fork failed: ") + std::strerror(iErrno));
  }

  if (pid == 0) {
    // Child process
    const int iNull = ::open("/dev/null", O_RDONLY);
    if (iNull >= 0) ::dup2(iNull, STDIN_FILENO);
    ::dup2(vOut[1], STDOUT_FILENO);
    ::dup2(vErr[1], STDERR_FILENO);

    if (!popt.sWorkingDir.empty() && ::chdir(popt.sWorkingDir.c_str()) != 0) {
      _exit(127);
    }

    ::execvpe(vArgPtrs[0], vArgPtrs.data(), vEnvPtrs.data());
    _exit(127);
  }

  // Parent process
  ::close(vOut[1]);
  ::close(vErr[1]);

  ProcessResult pres;
  pollfd vPoll[2] = {{vOut[0], POLLIN, 0}, {vErr[0], POLLIN, 0}};
  int iOpen = 2;
  char vBuf[4096];
  while (iOpen > 0) {
    if (::poll(vPoll, 2, -1) < 0) {
      if (errno == EINTR) continue;
      break;
    }
    for (int i = 0; i < 2; ++i) {
      if (vPoll[i].fd < 0 || vPoll[i].revents == 0) continue;
      const ssize_t n = ::read(vPoll[i].fd, vBuf, sizeof(vBuf));
      if (n > 0) {
        (i == 0 ? pres.sStdout : pres.sStderr).append(vBuf, static_cast<size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        ::close(vPoll[i].fd);
        vPoll[i].fd = -1;
        --iOpen;
      }
    }
  }
  for (auto& p : vPoll) {
    if (p.fd >= 0) ::close(p.fd);
  }

  // Extra env entries can carry secret values
  for (size_t i = vEnv.size() - popt.mExtraEnv.size(); i < vEnv.size(); ++i) {
    OPENSSL_cleanse(vEnv[i].data(), vEnv[i].size());
  }

  int iStatus = 0;
  while (::waitpid(pid, &iStatus, 0) < 0) {
    if (errno != EINTR) {
      throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
    }
  }
  if (WIFEXITED(iStatus)) {
    pres.iExitCode = WEXITSTATUS(iStatus);
  } else if (WIFSIGNALED(iStatus)) {
    pres.iExitCode = 128 + WTERMSIG(iStatus);
  }
  return pres;
}

}  // namespace dockops::runtime
