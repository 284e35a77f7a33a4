#include "core/ThreadPool.hpp"

namespace dockops::core {

ThreadPool::ThreadPool(int iSize) {
  if (iSize <= 0) {
    iSize = static_cast<int>(std::thread::hardware_concurrency());
    if (iSize <= 0) iSize = 1;
  }
  _vWorkers.reserve(static_cast<std::size_t>(iSize));
  for (int i = 0; i < iSize; ++i) {
    _vWorkers.emplace_back([this] { workerLoop(); });
  }
}

ThreadPool::~ThreadPool() { shutdown(); }

void ThreadPool::workerLoop() {
  for (;;) {
    std::packaged_task<void()> ptTask;
    {
      std::unique_lock lock(_mtx);
      _cv.wait(lock, [this] { return _bStopping || !_qTasks.empty(); });
      if (_qTasks.empty()) {
        return;  // stopping and drained
      }
      ptTask = std::move(_qTasks.front());
      _qTasks.pop();
    }
    // Exceptions land in the task's future.
    ptTask();
  }
}

void ThreadPool::shutdown() {
  {
    std::lock_guard lock(_mtx);
    if (_bStopping) return;
    _bStopping = true;
  }
  _cv.notify_all();
  for (auto& jt : _vWorkers) {
    if (jt.joinable()) jt.join();
  }
}

}  // namespace dockops::core
