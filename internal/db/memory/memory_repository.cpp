#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace taskpilot::db::memory {

namespace {

using TaskMap = std::unordered_map<std::string, taskpilot::model::Task>;

taskpilot::model::Task WithDerivedSubtasks(const TaskMap& tasks, const taskpilot::model::Task& stored) {
  taskpilot::model::Task task = stored;
  task.subtasks.clear();
  for (const auto& [id, other] : tasks) {
    if (other.parent_id && *other.parent_id == stored.id) {
      task.subtasks.insert(id);
    }
  }
  return task;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertTask(Transaction& t, const taskpilot::model::Task& task) {
  auto& s = TX(t).Mutable();
  if (s.tasks.contains(task.id)) return Result::Err(ErrorCode::AlreadyExists, "task already exists: " + task.id);
  auto& stored = s.tasks[task.id];
  stored       = task;
  stored.subtasks.clear();
  return Result::Ok();
}

std::optional<taskpilot::model::Task> MemoryRepository::GetTask(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.tasks.find(id);
  if (it == s.tasks.end()) return std::nullopt;
  return WithDerivedSubtasks(s.tasks, it->second);
}

std::vector<taskpilot::model::Task> MemoryRepository::ListTasks(Transaction& t) {
  const auto&                         s = TX(t).View();
  std::vector<taskpilot::model::Task> tasks;
  tasks.reserve(s.tasks.size());
  for (const auto& [_, task] : s.tasks) {
    tasks.push_back(WithDerivedSubtasks(s.tasks, task));
  }
  std::sort(tasks.begin(), tasks.end(), [](const auto& a, const auto& b) {
    if (a.created_at != b.created_at) return a.created_at < b.created_at;
    return a.id < b.id;
  });
  return tasks;
}

Result MemoryRepository::UpdateTask(Transaction& t, const taskpilot::model::Task& task) {
  auto& s  = TX(t).Mutable();
  auto  it = s.tasks.find(task.id);
  if (it == s.tasks.end()) return Result::Err(ErrorCode::NotFound, "task not found: " + task.id);

  auto notifications  = std::move(it->second.notifications);
  it->second          = task;
  it->second.notifications = std::move(notifications);
  it->second.subtasks.clear();
  return Result::Ok();
}

Result MemoryRepository::DeleteTask(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.tasks.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "task not found: " + id);
  return Result::Ok();
}

Result MemoryRepository::DeleteAllTasks(Transaction& t) {
  auto& s = TX(t).Mutable();
  s.tasks.clear();
  s.occurrences.clear();
  return Result::Ok();
}

Result MemoryRepository::AppendNotification(Transaction& t, const std::string& id, const taskpilot::model::Notification& notification) {
  auto& s  = TX(t).Mutable();
  auto  it = s.tasks.find(id);
  if (it == s.tasks.end()) return Result::Err(ErrorCode::NotFound, "task not found: " + id);
  it->second.notifications.push_back(notification);
  return Result::Ok();
}

Result MemoryRepository::ClaimOccurrence(Transaction& t, const model::OccurrenceRecord& record) {
  auto&      s   = TX(t).Mutable();
  const auto key = std::make_pair(record.series_id, record.occurrence_ms);
  if (s.occurrences.contains(key)) return Result::Err(ErrorCode::AlreadyExists, "occurrence already materialized");
  s.occurrences.emplace(key, record);
  return Result::Ok();
}

std::vector<model::OccurrenceRecord> MemoryRepository::ListOccurrences(Transaction& t, const std::string& series_id) {
  std::vector<model::OccurrenceRecord> out;
  for (const auto& [key, record] : TX(t).View().occurrences) {
    if (key.first == series_id) out.push_back(record);
  }
  return out;
}

} // namespace taskpilot::db::memory
