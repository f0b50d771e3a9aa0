#include "periodic_runner.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace taskpilot::maintenance {

PeriodicRunner::PeriodicRunner(std::string name, std::chrono::milliseconds interval, std::function<void()> pass)
    : name_(std::move(name)), interval_(interval), pass_(std::move(pass)) {
  if (interval_.count() <= 0) throw std::invalid_argument("periodic runner " + name_ + " needs a positive interval");
  if (!pass_) throw std::invalid_argument("periodic runner " + name_ + " has no pass");
}

PeriodicRunner::~PeriodicRunner() {
  Stop();
}

void PeriodicRunner::Start() {
  if (thread_.joinable()) return;
  {
    std::lock_guard lock(mutex_);
    stopping_ = false;
  }
  thread_ = std::thread(&PeriodicRunner::Loop, this);
}

void PeriodicRunner::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void PeriodicRunner::Loop() {
  while (true) {
    {
      std::unique_lock lock(mutex_);
      if (cv_.wait_for(lock, interval_, [&] { return stopping_; })) break;
    }

    try {
      pass_();
    } catch (const std::exception& e) {
      TASKPILOT_LOG_ERROR("Maintenance pass failed", {observability::StringField("pass", name_), observability::StringField("error", e.what())});
    }
    ++runs_;
  }
}

} // namespace taskpilot::maintenance
