#include "core/CycleScheduler.hpp"

#include "common/Logger.hpp"

#include <exception>
#include <utility>

namespace ddns::core {

CycleScheduler::CycleScheduler(std::string sName, std::chrono::milliseconds durInterval,
                               std::function<void()> fnTask)
    : _sName(std::move(sName)), _durInterval(durInterval), _fnTask(std::move(fnTask)) {}

CycleScheduler::~CycleScheduler() { stop(); }

void CycleScheduler::runOnce() {
  try {
    _fnTask();
  } catch (const std::exception& ex) {
    common::Logger::get()->error("CycleScheduler: '{}' run failed: {}", _sName, ex.what());
  }
}

int CycleScheduler::run(std::stop_token stToken, std::optional<int> oMaxCycles) {
  auto spLog = common::Logger::get();
  int iRuns = 0;

  while (!stToken.stop_requested()) {
    _state = State::Running;
    runOnce();
    ++iRuns;
    ++_iCompleted;

    if (oMaxCycles && iRuns >= *oMaxCycles) {
      break;
    }

    _state = State::Idle;
    spLog->debug("CycleScheduler: '{}' sleeping for {}ms", _sName, _durInterval.count());

    // Returns early if stToken is signalled while waiting.
    std::unique_lock<std::mutex> lock(_mtx);
    _cv.wait_for(lock, stToken, _durInterval, []() { return false; });
  }

  _state = State::Stopped;
  return iRuns;
}

void CycleScheduler::start() {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_bStarted) return;
  _bStarted = true;

  _thread = std::jthread([this](std::stop_token stToken) { run(stToken); });
}

void CycleScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (!_bStarted) return;
    _bStarted = false;
  }

  _thread.request_stop();
  if (_thread.joinable()) {
    _thread.join();
  }
}

}  // namespace ddns::core
