#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

namespace ddns::core {

/// Drives one periodic task forever: the first run starts immediately and
/// the next wait is armed only after the previous run returns, so runs
/// never overlap. Exceptions from the task are logged and contained.
/// Class abbreviation: cs
class CycleScheduler {
 public:
  enum class State { Idle, Running, Stopped };

  CycleScheduler(std::string sName, std::chrono::milliseconds durInterval,
                 std::function<void()> fnTask);
  ~CycleScheduler();

  CycleScheduler(const CycleScheduler&) = delete;
  CycleScheduler& operator=(const CycleScheduler&) = delete;

  /// Run the loop on the calling thread until stToken is signalled or
  /// oMaxCycles runs have completed. Returns the number of completed runs.
  int run(std::stop_token stToken, std::optional<int> oMaxCycles = std::nullopt);

  /// Run the loop on a background std::jthread.
  void start();

  /// Interrupt the wait (or let the in-flight run finish) and join.
  void stop();

  State state() const { return _state.load(); }
  int completedCycles() const { return _iCompleted.load(); }

 private:
  void runOnce();

  std::string _sName;
  std::chrono::milliseconds _durInterval;
  std::function<void()> _fnTask;

  std::jthread _thread;
  std::mutex _mtx;
  std::condition_variable_any _cv;
  std::atomic<State> _state{State::Idle};
  std::atomic<int> _iCompleted{0};
  bool _bStarted = false;
};

}  // namespace ddns::core
