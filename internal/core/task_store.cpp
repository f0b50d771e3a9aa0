#include "internal/core/task_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include "internal/core/task_snapshot.hpp"
#include "internal/model/priority.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/recurrence/recurrence.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "taskpilot/v1/task_snapshot.pb.h"

namespace taskpilot::core {

using taskpilot::model::Notification;
using taskpilot::model::Task;
using taskpilot::model::TaskStatus;
using taskpilot::model::TimePoint;

namespace {

constexpr std::uint32_t kSnapshotFormatVersion = 1;

void ThrowIfDbError(const taskpilot::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case taskpilot::db::ErrorCode::AlreadyExists:
      throw taskpilot::util::AlreadyExists(message);
    case taskpilot::db::ErrorCode::NotFound:
      throw taskpilot::util::NotFound(message);
    case taskpilot::db::ErrorCode::Conflict:
      throw taskpilot::util::InvalidState(message);
    case taskpilot::db::ErrorCode::ConstraintViolation:
      throw taskpilot::util::ValidationError(message);
    default:
      throw std::runtime_error(message);
  }
}

// Millisecond resolution, which is what the SQLite backend keeps.
TimePoint StampNow() {
  return util::FromUnixMillis(util::ToUnixMillis(util::Now()));
}

// updated_at never goes backwards and never repeats.
TimePoint NextStamp(const Task& previous) {
  auto stamp = StampNow();
  if (stamp <= previous.updated_at) {
    stamp = previous.updated_at + std::chrono::milliseconds(1);
  }
  return stamp;
}

// Content changes move both stamps. Annotations (notifications, score
// refreshes) move updated_at only, so staleness follows last_activity_at.
void StampContentChange(Task& task, const Task& previous) {
  task.updated_at       = NextStamp(previous);
  task.last_activity_at = task.updated_at;
}

// Parent links and dependency edges of a decoded backup must resolve within
// the backup itself and must not loop.
void CheckReferences(const std::vector<Task>& tasks) {
  std::unordered_map<std::string, const Task*> by_id;
  for (const auto& task : tasks) {
    by_id.emplace(task.id, &task);
  }

  for (const auto& task : tasks) {
    if (task.parent_id && !by_id.contains(*task.parent_id)) {
      throw util::ValidationError("restore: task " + task.id + " has unknown parent " + *task.parent_id);
    }
    for (const auto& dep : task.dependencies) {
      if (!by_id.contains(dep)) throw util::ValidationError("restore: task " + task.id + " depends on unknown task " + dep);
    }
  }

  for (const auto& task : tasks) {
    std::set<std::string> chain{task.id};
    for (auto parent = task.parent_id; parent; parent = by_id.at(*parent)->parent_id) {
      if (!chain.insert(*parent).second) throw util::CycleDetected("restore: parent chain of " + task.id + " loops through " + *parent);
    }
  }

  const graph::DependencyGraph graph(tasks);
  for (const auto& task : tasks) {
    const auto report = graph.Validate(task.id);
    if (!report.ok) throw util::CycleDetected("restore: " + report.errors.front());
  }
}

bool IsBlank(const std::string& text) {
  return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string TransitionName(TaskStatus from, TaskStatus to) {
  return std::string(model::ToString(from)) + " -> " + std::string(model::ToString(to));
}

} // namespace

bool TaskFilter::Matches(const Task& task) const {
  if (status && task.status != *status) return false;
  if (priority && task.priority != *priority) return false;
  if (parent_id && task.parent_id != parent_id) return false;
  if (assigned_handler && task.assigned_handler != assigned_handler) return false;
  if (tag && !task.tags.contains(*tag)) return false;
  if (open_only && model::IsTerminal(task.status)) return false;
  return true;
}

TaskStore::TaskStore(std::shared_ptr<taskpilot::db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) throw std::invalid_argument("task store requires a repository");
}

void TaskStore::ValidateFields(const Task& task) const {
  if (IsBlank(task.title)) {
    throw util::ValidationError("task title must not be empty");
  }
  if (task.progress > 100) {
    throw util::ValidationError("task progress must be within 0..100, got " + std::to_string(task.progress));
  }
  if (task.recurrence.interval == 0) {
    throw util::ValidationError("recurrence interval must be a positive integer");
  }
  if (task.estimated_hours && *task.estimated_hours < 0.0) {
    throw util::ValidationError("estimated hours must not be negative");
  }
}

void TaskStore::RefreshScore(taskpilot::db::Transaction& tx, const std::string& id, TimePoint now) {
  auto task = repository_->GetTask(tx, id);
  if (!task) return;

  const double score = model::ComputeDynamicPriority(*task, now);
  if (score == task->dynamic_priority_score) return;

  task->dynamic_priority_score = score;
  task->updated_at             = NextStamp(*task);
  ThrowIfDbError(repository_->UpdateTask(tx, *task), "refresh priority");
}

void TaskStore::Touch(taskpilot::db::Transaction& tx, const std::string& id) {
  auto task = repository_->GetTask(tx, id);
  if (!task) throw util::NotFound("task not found: " + id);

  task->updated_at = NextStamp(*task);
  ThrowIfDbError(repository_->UpdateTask(tx, *task), "touch task");
}

void TaskStore::UnblockDependants(taskpilot::db::Transaction& tx, const std::string& completed_id, TimePoint now) {
  const auto                   tasks = repository_->ListTasks(tx);
  const graph::DependencyGraph graph(tasks);

  std::unordered_map<std::string, const Task*> by_id;
  for (const auto& task : tasks) {
    by_id.emplace(task.id, &task);
  }

  for (const auto& dependant_id : graph.Dependants(completed_id)) {
    const Task& task = *by_id.at(dependant_id);
    if (task.status != TaskStatus::kBlocked || !graph.IsReady(task.id).ready) continue;

    Task unblocked                   = task;
    unblocked.status                 = TaskStatus::kPending;
    StampContentChange(unblocked, task);
    unblocked.dynamic_priority_score = model::ComputeDynamicPriority(unblocked, now);
    ThrowIfDbError(repository_->UpdateTask(tx, unblocked), "unblock dependant");

    TASKPILOT_LOG_INFO("Task unblocked", {observability::StringField("id", task.id), observability::StringField("dependency", completed_id)});
  }
}

std::string TaskStore::Create(Task task) {
  ValidateFields(task);

  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();

  if (task.id.empty()) task.id = util::NewId();

  if (task.parent_id) {
    if (*task.parent_id == task.id) throw util::ValidationError("task cannot be its own parent");
    if (!repository_->GetTask(*tx, *task.parent_id)) throw util::ValidationError("unknown parent task: " + *task.parent_id);
  }
  for (const auto& dep : task.dependencies) {
    if (dep == task.id) throw util::CycleDetected("task cannot depend on itself");
    if (!repository_->GetTask(*tx, dep)) throw util::ValidationError("unknown dependency: " + dep);
  }

  if (task.progress == 100) task.status = TaskStatus::kCompleted;
  if (task.status == TaskStatus::kCompleted) task.progress = 100;

  const auto now  = StampNow();
  task.created_at = now;
  task.updated_at       = now;
  task.last_activity_at = now;
  if (task.series_id.empty()) task.series_id = task.id;
  task.subtasks.clear();
  task.next_occurrence        = recurrence::NextOccurrence(task);
  task.dynamic_priority_score = model::ComputeDynamicPriority(task, now);

  ThrowIfDbError(repository_->InsertTask(*tx, task), "create task");
  if (task.parent_id) RefreshScore(*tx, *task.parent_id, now);
  tx->Commit();

  TASKPILOT_LOG_INFO("Task created", {observability::StringField("id", task.id), observability::StringField("title", task.title)});
  return task.id;
}

std::optional<Task> TaskStore::Get(const std::string& id) const {
  std::lock_guard lock(mutex_);
  auto            tx   = repository_->Begin();
  auto            task = repository_->GetTask(*tx, id);
  tx->Commit();
  return task;
}

bool TaskStore::Update(const std::string& id, const TaskPatch& patch) {
  std::lock_guard lock(mutex_);
  auto            tx      = repository_->Begin();
  const auto      current = repository_->GetTask(*tx, id);
  if (!current) return false;

  Task task = *current;
  if (patch.title) task.title = *patch.title;
  if (patch.description) task.description = *patch.description;
  if (patch.priority) task.priority = *patch.priority;
  if (patch.due_date) task.due_date = *patch.due_date;
  if (patch.assigned_handler) task.assigned_handler = *patch.assigned_handler;
  if (patch.recurrence) task.recurrence = *patch.recurrence;
  if (patch.estimated_hours) task.estimated_hours = *patch.estimated_hours;
  if (patch.tags) task.tags = *patch.tags;
  if (patch.milestones) task.milestones = *patch.milestones;
  if (patch.status) task.status = *patch.status;
  if (patch.progress) {
    task.progress = *patch.progress;
    if (task.progress == 100) task.status = TaskStatus::kCompleted;
  }
  if (task.status == TaskStatus::kCompleted && current->status != TaskStatus::kCompleted) task.progress = 100;

  if (!model::CanTransition(current->status, task.status)) {
    throw util::ValidationError("invalid status transition " + TransitionName(current->status, task.status));
  }
  ValidateFields(task);

  if (patch.due_date || patch.recurrence) task.next_occurrence = recurrence::NextOccurrence(task);

  const auto now              = StampNow();
  StampContentChange(task, *current);
  task.dynamic_priority_score = model::ComputeDynamicPriority(task, now);
  ThrowIfDbError(repository_->UpdateTask(*tx, task), "update task");

  if (task.status == TaskStatus::kCompleted && current->status != TaskStatus::kCompleted) {
    UnblockDependants(*tx, id, now);
  }
  tx->Commit();
  return true;
}

bool TaskStore::Delete(const std::string& id) {
  std::lock_guard lock(mutex_);
  auto            tx   = repository_->Begin();
  const auto      root = repository_->GetTask(*tx, id);
  if (!root) return false;

  const auto tasks = repository_->ListTasks(*tx);

  std::unordered_map<std::string, std::vector<std::string>> children;
  for (const auto& task : tasks) {
    if (task.parent_id) children[*task.parent_id].push_back(task.id);
  }

  std::set<std::string>    doomed;
  std::vector<std::string> stack{id};
  while (!stack.empty()) {
    auto current = std::move(stack.back());
    stack.pop_back();
    if (!doomed.insert(current).second) continue;
    if (auto it = children.find(current); it != children.end()) {
      stack.insert(stack.end(), it->second.begin(), it->second.end());
    }
  }

  for (const auto& doomed_id : doomed) {
    ThrowIfDbError(repository_->DeleteTask(*tx, doomed_id), "delete task");
  }

  const auto now = StampNow();
  for (const auto& task : tasks) {
    if (doomed.contains(task.id)) continue;

    Task scrubbed = task;
    std::erase_if(scrubbed.dependencies, [&](const std::string& dep) { return doomed.contains(dep); });
    if (scrubbed.dependencies.size() == task.dependencies.size()) continue;

    StampContentChange(scrubbed, task);
    scrubbed.dynamic_priority_score = model::ComputeDynamicPriority(scrubbed, now);
    ThrowIfDbError(repository_->UpdateTask(*tx, scrubbed), "scrub dependency");
  }

  if (root->parent_id && !doomed.contains(*root->parent_id)) RefreshScore(*tx, *root->parent_id, now);
  tx->Commit();

  TASKPILOT_LOG_INFO("Task deleted", {observability::StringField("id", id), observability::IntField("removed", static_cast<int64_t>(doomed.size()))});
  return true;
}

std::vector<Task> TaskStore::List(const TaskFilter& filter) const {
  std::lock_guard lock(mutex_);
  auto            tx    = repository_->Begin();
  auto            tasks = repository_->ListTasks(*tx);
  tx->Commit();

  std::erase_if(tasks, [&](const Task& task) { return !filter.Matches(task); });
  return tasks;
}

std::vector<Task> TaskStore::Ranked(const TaskFilter& filter, TimePoint now) const {
  auto tasks = List(filter);
  for (auto& task : tasks) {
    task.dynamic_priority_score = model::ComputeDynamicPriority(task, now);
  }

  std::stable_sort(tasks.begin(), tasks.end(), [](const Task& a, const Task& b) {
    if (a.dynamic_priority_score != b.dynamic_priority_score) return a.dynamic_priority_score > b.dynamic_priority_score;
    return a.created_at < b.created_at;
  });
  return tasks;
}

void TaskStore::Backup(const std::string& path) const {
  taskpilot::v1::TaskSnapshot snapshot;
  snapshot.set_format_version(kSnapshotFormatVersion);
  *snapshot.mutable_created_at() = util::ToProto(util::Now());

  {
    std::lock_guard lock(mutex_);
    auto            tx    = repository_->Begin();
    const auto      tasks = repository_->ListTasks(*tx);

    std::set<std::string> series;
    for (const auto& task : tasks) {
      *snapshot.add_tasks() = ToRecord(task);
      series.insert(task.series_id.empty() ? task.id : task.series_id);
    }
    for (const auto& series_id : series) {
      for (const auto& occurrence : repository_->ListOccurrences(*tx, series_id)) {
        *snapshot.add_occurrences() = ToRecord(occurrence);
      }
    }
    tx->Commit();
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(snapshot, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("backup: failed to serialize snapshot: " + std::string(status.message()));
  }

  // Write beside the target and rename so a crash never leaves half a file.
  const std::string tmp_path = path + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("backup: cannot open " + tmp_path);
    out << json;
    out.flush();
    if (!out) throw std::runtime_error("backup: write failed for " + tmp_path);
  }
  std::filesystem::rename(tmp_path, path);

  TASKPILOT_LOG_INFO("Backup written",
                     {observability::StringField("path", path), observability::IntField("tasks", snapshot.tasks_size())});
}

void TaskStore::Restore(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw util::NotFound("restore: cannot read backup " + path);

  std::stringstream buffer;
  buffer << in.rdbuf();

  taskpilot::v1::TaskSnapshot              snapshot;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(buffer.str(), &snapshot, options);
  if (!status.ok()) {
    throw util::ValidationError("restore: malformed backup: " + std::string(status.message()));
  }
  if (snapshot.format_version() != kSnapshotFormatVersion) {
    throw util::ValidationError("restore: unsupported backup format version " + std::to_string(snapshot.format_version()));
  }

  // Decode everything before touching the store.
  std::vector<Task>     tasks;
  std::set<std::string> ids;
  tasks.reserve(snapshot.tasks_size());
  for (const auto& record : snapshot.tasks()) {
    if (record.id().empty()) throw util::ValidationError("restore: task without id");
    auto task = FromRecord(record);
    ValidateFields(task);
    if (!ids.insert(task.id).second) throw util::ValidationError("restore: duplicate task id " + task.id);
    tasks.push_back(std::move(task));
  }

  CheckReferences(tasks);

  std::vector<taskpilot::db::model::OccurrenceRecord> occurrences;
  for (const auto& record : snapshot.occurrences()) {
    occurrences.push_back(FromRecord(record));
  }

  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteAllTasks(*tx), "restore: clear store");
  for (const auto& task : tasks) {
    ThrowIfDbError(repository_->InsertTask(*tx, task), "restore: insert task");
  }
  for (const auto& occurrence : occurrences) {
    ThrowIfDbError(repository_->ClaimOccurrence(*tx, occurrence), "restore: occurrence ledger");
  }
  tx->Commit();

  TASKPILOT_LOG_INFO("Backup restored", {observability::StringField("path", path), observability::IntField("tasks", static_cast<int64_t>(tasks.size()))});
}

bool TaskStore::AddDependency(const std::string& id, const std::string& dependency_id) {
  std::lock_guard lock(mutex_);
  auto            tx   = repository_->Begin();
  const auto      task = repository_->GetTask(*tx, id);
  if (!task) return false;

  if (!repository_->GetTask(*tx, dependency_id)) throw util::ValidationError("unknown dependency: " + dependency_id);
  if (task->dependencies.contains(dependency_id)) return true;

  const graph::DependencyGraph graph(repository_->ListTasks(*tx));
  if (graph.WouldCreateCycle(id, dependency_id)) {
    throw util::CycleDetected("dependency " + id + " -> " + dependency_id + " would create a cycle");
  }

  Task updated = *task;
  updated.dependencies.insert(dependency_id);
  StampContentChange(updated, *task);
  updated.dynamic_priority_score = model::ComputeDynamicPriority(updated, StampNow());
  ThrowIfDbError(repository_->UpdateTask(*tx, updated), "add dependency");
  tx->Commit();
  return true;
}

bool TaskStore::RemoveDependency(const std::string& id, const std::string& dependency_id) {
  std::lock_guard lock(mutex_);
  auto            tx   = repository_->Begin();
  const auto      task = repository_->GetTask(*tx, id);
  if (!task || !task->dependencies.contains(dependency_id)) return false;

  Task updated = *task;
  updated.dependencies.erase(dependency_id);
  StampContentChange(updated, *task);
  updated.dynamic_priority_score = model::ComputeDynamicPriority(updated, StampNow());
  ThrowIfDbError(repository_->UpdateTask(*tx, updated), "remove dependency");
  tx->Commit();
  return true;
}

bool TaskStore::AppendNotification(const std::string& id, const Notification& notification) {
  std::lock_guard lock(mutex_);
  auto            tx     = repository_->Begin();
  const auto      result = repository_->AppendNotification(*tx, id, notification);
  if (result.code == taskpilot::db::ErrorCode::NotFound) return false;
  ThrowIfDbError(result, "append notification");
  Touch(*tx, id);
  tx->Commit();
  return true;
}

bool TaskStore::AppendNotificationOnce(const std::string& id, const Notification& notification, TimePoint since) {
  std::lock_guard lock(mutex_);
  auto            tx   = repository_->Begin();
  const auto      task = repository_->GetTask(*tx, id);
  if (!task) return false;

  const bool seen = std::any_of(task->notifications.begin(), task->notifications.end(), [&](const Notification& existing) {
    return existing.kind == notification.kind && existing.timestamp >= since;
  });
  if (seen) return false;

  ThrowIfDbError(repository_->AppendNotification(*tx, id, notification), "append notification");
  Touch(*tx, id);
  tx->Commit();
  return true;
}

bool TaskStore::RecomputePriority(const std::string& id, TimePoint now) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  if (!repository_->GetTask(*tx, id)) return false;

  RefreshScore(*tx, id, now);
  tx->Commit();
  return true;
}

std::size_t TaskStore::RecomputeAll(TimePoint now) {
  std::lock_guard lock(mutex_);
  auto            tx      = repository_->Begin();
  std::size_t     changed = 0;

  for (auto& task : repository_->ListTasks(*tx)) {
    if (model::IsTerminal(task.status)) continue;

    const double score = model::ComputeDynamicPriority(task, now);
    if (score == task.dynamic_priority_score) continue;

    TASKPILOT_LOG_DEBUG("Priority rescored", {observability::StringField("id", task.id), observability::DoubleField("score", score)});
    task.dynamic_priority_score = score;
    task.updated_at             = NextStamp(task);
    ThrowIfDbError(repository_->UpdateTask(*tx, task), "recompute priority");
    ++changed;
  }
  tx->Commit();
  return changed;
}

graph::ValidationReport TaskStore::Validate(const std::string& id) const {
  std::lock_guard              lock(mutex_);
  auto                         tx = repository_->Begin();
  const graph::DependencyGraph graph(repository_->ListTasks(*tx));
  tx->Commit();
  return graph.Validate(id);
}

std::optional<graph::Readiness> TaskStore::IsReady(const std::string& id) const {
  std::lock_guard              lock(mutex_);
  auto                         tx = repository_->Begin();
  const graph::DependencyGraph graph(repository_->ListTasks(*tx));
  tx->Commit();

  if (!graph.Contains(id)) return std::nullopt;
  return graph.IsReady(id);
}

std::optional<std::string> TaskStore::MaterializeOccurrence(const std::string& id, TimePoint now) {
  std::lock_guard lock(mutex_);
  auto            tx     = repository_->Begin();
  const auto      source = repository_->GetTask(*tx, id);
  if (!source || !recurrence::IsDue(*source, now)) return std::nullopt;

  const auto occurrence = *source->next_occurrence;

  Task advanced            = *source;
  advanced.next_occurrence = recurrence::Advance(source->recurrence, occurrence);
  advanced.updated_at      = NextStamp(*source);

  taskpilot::db::model::OccurrenceRecord claim;
  claim.series_id            = source->series_id.empty() ? source->id : source->series_id;
  claim.occurrence_ms        = util::ToUnixMillis(occurrence);
  claim.materialized_task_id = util::NewId();
  claim.created_at_ms        = util::ToUnixMillis(now);

  const auto claimed = repository_->ClaimOccurrence(*tx, claim);
  if (claimed.code == taskpilot::db::ErrorCode::AlreadyExists) {
    ThrowIfDbError(repository_->UpdateTask(*tx, advanced), "advance recurrence");
    tx->Commit();
    return std::nullopt;
  }
  ThrowIfDbError(claimed, "claim occurrence");

  auto instance                   = recurrence::BuildInstance(*source, occurrence, claim.materialized_task_id, StampNow());
  instance.dynamic_priority_score = model::ComputeDynamicPriority(instance, now);
  ThrowIfDbError(repository_->InsertTask(*tx, instance), "materialize occurrence");
  ThrowIfDbError(repository_->UpdateTask(*tx, advanced), "advance recurrence");

  Notification notification;
  notification.message   = "Next occurrence created: " + instance.id;
  notification.level     = model::NotificationLevel::kInfo;
  notification.kind      = "recurrence.materialized";
  notification.timestamp = now;
  ThrowIfDbError(repository_->AppendNotification(*tx, id, notification), "materialize occurrence");
  tx->Commit();

  TASKPILOT_LOG_INFO("Recurring task materialized",
                     {observability::StringField("source", id), observability::StringField("instance", instance.id)});
  return instance.id;
}

} // namespace taskpilot::core
