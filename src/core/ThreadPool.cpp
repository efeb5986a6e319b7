#include "core/ThreadPool.hpp"

namespace ddns::core {

ThreadPool::ThreadPool(int iSize) {
  if (iSize <= 0) {
    iSize = static_cast<int>(std::thread::hardware_concurrency());
    if (iSize <= 0) iSize = 1;
  }
  _vWorkers.reserve(static_cast<size_t>(iSize));
  for (int i = 0; i < iSize; ++i) {
    _vWorkers.emplace_back([this]() { workerLoop(); });
  }
}

ThreadPool::~ThreadPool() { shutdown(); }

void ThreadPool::workerLoop() {
  while (true) {
    std::packaged_task<void()> task;
    {
      std::unique_lock<std::mutex> lock(_mtx);
      _cv.wait(lock, [this]() { return _bStopping || !_qTasks.empty(); });
      if (_qTasks.empty()) {
        return;  // stopping and drained
      }
      task = std::move(_qTasks.front());
      _qTasks.pop();
    }
    // Exceptions are captured in the task's future.
    task();
  }
}

void ThreadPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_bStopping) return;
    _bStopping = true;
  }
  _cv.notify_all();

  for (auto& thread : _vWorkers) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

}  // namespace ddns::core
