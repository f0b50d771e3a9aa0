#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <vector>

#include "internal/core/task_store.hpp"
#include "internal/maintenance/periodic_runner.hpp"

namespace taskpilot::maintenance {

struct SweepOptions {
  std::chrono::milliseconds stale_after         = std::chrono::hours(72);
  std::chrono::milliseconds notification_window = std::chrono::hours(24);
};

/*
  Background passes over the task store. Each returns how many tasks it
  touched. Notifications are deduplicated per kind and window, so running a
  pass twice inside one window is harmless.
*/
class MaintenanceSweeps {
 public:
  MaintenanceSweeps(std::shared_ptr<taskpilot::core::TaskStore> store, SweepOptions options);

  // deadline.overdue / deadline.today / deadline.tomorrow for open tasks.
  std::size_t DeadlineSweep(taskpilot::model::TimePoint now);

  // task.stuck for in_progress tasks untouched for stale_after.
  std::size_t StuckSweep(taskpilot::model::TimePoint now);

  // Materializes due occurrences of completed recurring tasks.
  std::size_t RecurrenceSweep(taskpilot::model::TimePoint now);

  std::size_t PrioritySweep(taskpilot::model::TimePoint now);

 private:
  std::shared_ptr<taskpilot::core::TaskStore> store_;
  SweepOptions                                options_;
};

struct MaintenanceIntervals {
  std::chrono::milliseconds deadline   = std::chrono::hours(1);
  std::chrono::milliseconds stuck      = std::chrono::hours(1);
  std::chrono::milliseconds recurrence = std::chrono::hours(1);
  std::chrono::milliseconds priority   = std::chrono::minutes(30);
};

// One timer per pass.
class MaintenanceScheduler {
 public:
  MaintenanceScheduler(std::shared_ptr<MaintenanceSweeps> sweeps, MaintenanceIntervals intervals);

  void Start();
  void Stop();

  const std::vector<std::unique_ptr<PeriodicRunner>>& runners() const {
    return runners_;
  }

 private:
  std::shared_ptr<MaintenanceSweeps>           sweeps_;
  std::vector<std::unique_ptr<PeriodicRunner>> runners_;
};

} // namespace taskpilot::maintenance
