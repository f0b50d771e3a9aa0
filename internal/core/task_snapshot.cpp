#include "internal/core/task_snapshot.hpp"

#include "internal/util/time.hpp"

namespace taskpilot::core {

using taskpilot::model::Task;

taskpilot::v1::TaskRecord ToRecord(const Task& task) {
  taskpilot::v1::TaskRecord record;
  record.set_id(task.id);
  record.set_title(task.title);
  record.set_description(task.description);
  record.set_status(std::string(model::ToString(task.status)));
  record.set_priority(std::string(model::ToString(task.priority)));
  record.set_dynamic_priority_score(task.dynamic_priority_score);

  if (task.due_date) *record.mutable_due_date() = util::ToProto(*task.due_date);

  for (const auto& dep : task.dependencies) record.add_dependencies(dep);
  if (task.parent_id) record.set_parent_id(*task.parent_id);
  if (task.assigned_handler) record.set_assigned_handler(*task.assigned_handler);

  record.set_progress(task.progress);

  record.mutable_recurrence()->set_type(std::string(model::ToString(task.recurrence.type)));
  record.mutable_recurrence()->set_interval(task.recurrence.interval);
  if (task.next_occurrence) *record.mutable_next_occurrence() = util::ToProto(*task.next_occurrence);
  record.set_series_id(task.series_id);

  if (task.estimated_hours) record.set_estimated_hours(*task.estimated_hours);
  for (const auto& tag : task.tags) record.add_tags(tag);
  for (const auto& milestone : task.milestones) {
    auto* out = record.add_milestones();
    out->set_title(milestone.title);
    out->set_completed(milestone.completed);
  }

  *record.mutable_created_at() = util::ToProto(task.created_at);
  *record.mutable_updated_at()       = util::ToProto(task.updated_at);
  *record.mutable_last_activity_at() = util::ToProto(task.last_activity_at);

  for (const auto& n : task.notifications) {
    auto* out = record.add_notifications();
    out->set_message(n.message);
    out->set_level(std::string(model::ToString(n.level)));
    out->set_kind(n.kind);
    *out->mutable_timestamp() = util::ToProto(n.timestamp);
  }
  return record;
}

Task FromRecord(const taskpilot::v1::TaskRecord& record) {
  Task task;
  task.id                     = record.id();
  task.title                  = record.title();
  task.description            = record.description();
  task.status                 = model::ParseTaskStatus(record.status());
  task.priority               = model::ParsePriority(record.priority());
  task.dynamic_priority_score = record.dynamic_priority_score();

  if (record.has_due_date()) task.due_date = util::FromProto(record.due_date());

  task.dependencies.insert(record.dependencies().begin(), record.dependencies().end());
  if (record.has_parent_id()) task.parent_id = record.parent_id();
  if (record.has_assigned_handler()) task.assigned_handler = record.assigned_handler();

  task.progress = record.progress();

  if (record.has_recurrence()) {
    task.recurrence.type     = model::ParseRecurrenceType(record.recurrence().type());
    task.recurrence.interval = record.recurrence().interval();
  }
  if (record.has_next_occurrence()) task.next_occurrence = util::FromProto(record.next_occurrence());
  task.series_id = record.series_id().empty() ? record.id() : record.series_id();

  if (record.has_estimated_hours()) task.estimated_hours = record.estimated_hours();
  task.tags.insert(record.tags().begin(), record.tags().end());
  for (const auto& milestone : record.milestones()) {
    task.milestones.push_back({milestone.title(), milestone.completed()});
  }

  task.created_at = util::FromProto(record.created_at());
  task.updated_at       = util::FromProto(record.updated_at());
  task.last_activity_at = record.has_last_activity_at() ? util::FromProto(record.last_activity_at()) : task.updated_at;

  for (const auto& n : record.notifications()) {
    model::Notification notification;
    notification.message   = n.message();
    notification.level     = model::ParseNotificationLevel(n.level());
    notification.kind      = n.kind();
    notification.timestamp = util::FromProto(n.timestamp());
    task.notifications.push_back(std::move(notification));
  }
  return task;
}

taskpilot::v1::OccurrenceRecord ToRecord(const db::model::OccurrenceRecord& occurrence) {
  taskpilot::v1::OccurrenceRecord record;
  record.set_series_id(occurrence.series_id);
  record.set_occurrence_ms(occurrence.occurrence_ms);
  record.set_materialized_task_id(occurrence.materialized_task_id);
  record.set_created_at_ms(occurrence.created_at_ms);
  return record;
}

db::model::OccurrenceRecord FromRecord(const taskpilot::v1::OccurrenceRecord& record) {
  db::model::OccurrenceRecord occurrence;
  occurrence.series_id            = record.series_id();
  occurrence.occurrence_ms        = record.occurrence_ms();
  occurrence.materialized_task_id = record.materialized_task_id();
  occurrence.created_at_ms        = record.created_at_ms();
  return occurrence;
}

} // namespace taskpilot::core
