#include "internal/recurrence/recurrence.hpp"

namespace taskpilot::recurrence {

using taskpilot::model::Recurrence;
using taskpilot::model::RecurrenceType;
using taskpilot::model::Task;
using taskpilot::model::TaskStatus;
using taskpilot::model::TimePoint;

std::chrono::hours Period(const Recurrence& recurrence) {
  constexpr std::chrono::hours kDay{24};
  const auto                   interval = static_cast<int64_t>(recurrence.interval);

  switch (recurrence.type) {
    case RecurrenceType::kDaily:
      return kDay * interval;
    case RecurrenceType::kWeekly:
      return kDay * 7 * interval;
    case RecurrenceType::kMonthly:
      return kDay * 30 * interval;
    case RecurrenceType::kYearly:
      return kDay * 365 * interval;
    case RecurrenceType::kNone:
    default:
      return std::chrono::hours{0};
  }
}

std::optional<TimePoint> Advance(const Recurrence& recurrence, TimePoint occurrence) {
  if (recurrence.type == RecurrenceType::kNone || recurrence.interval == 0) return std::nullopt;
  return occurrence + Period(recurrence);
}

std::optional<TimePoint> NextOccurrence(const Task& task) {
  return Advance(task.recurrence, task.due_date.value_or(task.created_at));
}

bool IsDue(const Task& task, TimePoint now) {
  return task.status == TaskStatus::kCompleted && task.recurrence.type != RecurrenceType::kNone && task.next_occurrence &&
         *task.next_occurrence <= now;
}

Task BuildInstance(const Task& source, TimePoint occurrence, std::string id, TimePoint now) {
  Task instance;
  instance.id               = std::move(id);
  instance.title            = source.title;
  instance.description      = source.description;
  instance.priority         = source.priority;
  instance.assigned_handler = source.assigned_handler;
  instance.estimated_hours  = source.estimated_hours;
  instance.tags             = source.tags;
  instance.recurrence       = source.recurrence;
  instance.series_id        = source.series_id.empty() ? source.id : source.series_id;

  instance.milestones = source.milestones;
  for (auto& milestone : instance.milestones) {
    milestone.completed = false;
  }

  instance.status           = TaskStatus::kPending;
  instance.progress         = 0;
  instance.due_date         = occurrence;
  instance.next_occurrence  = NextOccurrence(instance);
  instance.created_at       = now;
  instance.updated_at       = now;
  instance.last_activity_at = now;
  return instance;
}

} // namespace taskpilot::recurrence
