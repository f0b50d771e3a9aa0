#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace taskpilot::maintenance {

/*
  Runs one pass every `interval` on its own thread until stopped.

  Stop() cancels the pending wait immediately; a pass that is already
  running finishes first. Exceptions from a pass are logged and the timer
  keeps going.
*/
class PeriodicRunner {
 public:
  PeriodicRunner(std::string name, std::chrono::milliseconds interval, std::function<void()> pass);
  ~PeriodicRunner();

  PeriodicRunner(const PeriodicRunner&)            = delete;
  PeriodicRunner& operator=(const PeriodicRunner&) = delete;

  void Start();
  void Stop();

  std::uint64_t Runs() const {
    return runs_.load();
  }

  const std::string& name() const {
    return name_;
  }

 private:
  void Loop();

  std::string               name_;
  std::chrono::milliseconds interval_;
  std::function<void()>     pass_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;

  std::thread                thread_;
  std::atomic<std::uint64_t> runs_{0};
};

} // namespace taskpilot::maintenance
