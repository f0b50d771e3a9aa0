#include "internal/maintenance/sweeps.hpp"

#include <stdexcept>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/recurrence/recurrence.hpp"
#include "internal/util/time.hpp"

namespace taskpilot::maintenance {

using taskpilot::model::Notification;
using taskpilot::model::NotificationLevel;
using taskpilot::model::TaskStatus;
using taskpilot::model::TimePoint;
using taskpilot::observability::IntField;
using taskpilot::observability::StringField;

MaintenanceSweeps::MaintenanceSweeps(std::shared_ptr<taskpilot::core::TaskStore> store, SweepOptions options)
    : store_(std::move(store)), options_(options) {
  if (!store_) throw std::invalid_argument("maintenance sweeps require a task store");
}

std::size_t MaintenanceSweeps::DeadlineSweep(TimePoint now) {
  core::TaskFilter filter;
  filter.open_only = true;

  std::size_t notified = 0;
  for (const auto& task : store_->List(filter)) {
    if (!task.due_date) continue;

    Notification notification;
    notification.timestamp = now;

    const int days = util::CalendarDaysBetween(now, *task.due_date);
    if (days < 0) {
      notification.kind    = "deadline.overdue";
      notification.level   = NotificationLevel::kCritical;
      notification.message = "Task is overdue: " + task.title;
    } else if (days == 0) {
      notification.kind    = "deadline.today";
      notification.level   = NotificationLevel::kWarning;
      notification.message = "Task is due today: " + task.title;
    } else if (days == 1) {
      notification.kind    = "deadline.tomorrow";
      notification.level   = NotificationLevel::kInfo;
      notification.message = "Task is due tomorrow: " + task.title;
    } else {
      continue;
    }

    if (store_->AppendNotificationOnce(task.id, notification, now - options_.notification_window)) ++notified;
  }

  if (notified > 0) TASKPILOT_LOG_INFO("Deadline sweep", {IntField("notified", static_cast<int64_t>(notified))});
  return notified;
}

std::size_t MaintenanceSweeps::StuckSweep(TimePoint now) {
  core::TaskFilter filter;
  filter.status = TaskStatus::kInProgress;

  std::size_t flagged = 0;
  for (const auto& task : store_->List(filter)) {
    if (now - task.last_activity_at < options_.stale_after) continue;

    const auto hours = std::chrono::duration_cast<std::chrono::hours>(now - task.last_activity_at).count();

    Notification notification;
    notification.kind      = "task.stuck";
    notification.level     = NotificationLevel::kWarning;
    notification.message   = "No progress for " + std::to_string(hours) + "h: " + task.title;
    notification.timestamp = now;

    if (store_->AppendNotificationOnce(task.id, notification, now - options_.notification_window)) {
      ++flagged;
      TASKPILOT_LOG_WARN("Task looks stuck", {StringField("id", task.id), IntField("idle_hours", hours)});
    }
  }
  return flagged;
}

std::size_t MaintenanceSweeps::RecurrenceSweep(TimePoint now) {
  core::TaskFilter filter;
  filter.status = TaskStatus::kCompleted;

  std::size_t created = 0;
  for (const auto& task : store_->List(filter)) {
    if (!recurrence::IsDue(task, now)) continue;
    if (store_->MaterializeOccurrence(task.id, now)) ++created;
  }
  return created;
}

std::size_t MaintenanceSweeps::PrioritySweep(TimePoint now) {
  return store_->RecomputeAll(now);
}

MaintenanceScheduler::MaintenanceScheduler(std::shared_ptr<MaintenanceSweeps> sweeps, MaintenanceIntervals intervals)
    : sweeps_(std::move(sweeps)) {
  if (!sweeps_) throw std::invalid_argument("maintenance scheduler requires sweeps");

  auto* sweeps_ptr = sweeps_.get();
  runners_.push_back(std::make_unique<PeriodicRunner>("deadline", intervals.deadline, [sweeps_ptr] { sweeps_ptr->DeadlineSweep(util::Now()); }));
  runners_.push_back(std::make_unique<PeriodicRunner>("stuck", intervals.stuck, [sweeps_ptr] { sweeps_ptr->StuckSweep(util::Now()); }));
  runners_.push_back(std::make_unique<PeriodicRunner>("recurrence", intervals.recurrence, [sweeps_ptr] { sweeps_ptr->RecurrenceSweep(util::Now()); }));
  runners_.push_back(std::make_unique<PeriodicRunner>("priority", intervals.priority, [sweeps_ptr] { sweeps_ptr->PrioritySweep(util::Now()); }));
}

void MaintenanceScheduler::Start() {
  for (auto& runner : runners_) {
    runner->Start();
  }
  TASKPILOT_LOG_INFO("Maintenance started", {IntField("passes", static_cast<int64_t>(runners_.size()))});
}

void MaintenanceScheduler::Stop() {
  for (auto& runner : runners_) {
    runner->Stop();
  }
}

} // namespace taskpilot::maintenance
