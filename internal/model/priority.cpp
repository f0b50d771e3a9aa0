#include "internal/model/priority.hpp"

#include "internal/util/time.hpp"

namespace taskpilot::model {

double DueBonus(const std::optional<TimePoint>& due_date, TimePoint now) {
  if (!due_date) {
    return 0.0;
  }

  const int days = util::CalendarDaysBetween(now, *due_date);
  if (days < 0) return 3.0;
  if (days == 0) return 2.0;
  if (days <= 2) return 1.5;
  if (days <= 7) return 1.0;
  return 0.0;
}

double ComputeDynamicPriority(const Task& task, TimePoint now) {
  const double base             = 3.0 - static_cast<double>(static_cast<int>(task.priority));
  const double dependency_bonus = 0.2 * static_cast<double>(task.subtasks.size());

  double status_adj = 0.0;
  if (task.status == TaskStatus::kBlocked) {
    status_adj = -1.0;
  } else if (task.status == TaskStatus::kInProgress) {
    status_adj = 0.5;
  }

  return base + DueBonus(task.due_date, now) + dependency_bonus + status_adj;
}

} // namespace taskpilot::model
