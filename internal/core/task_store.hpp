#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/graph/dependency_graph.hpp"
#include "internal/model/task.hpp"

namespace taskpilot::core {

/*
  Partial update. Only engaged fields are applied; the nested optionals
  distinguish "leave as is" from "clear".
*/
struct TaskPatch {
  std::optional<std::string>                              title;
  std::optional<std::string>                              description;
  std::optional<taskpilot::model::TaskStatus>             status;
  std::optional<taskpilot::model::Priority>               priority;
  std::optional<std::optional<taskpilot::model::TimePoint>> due_date;
  std::optional<std::optional<std::string>>               assigned_handler;
  std::optional<std::uint32_t>                            progress;
  std::optional<taskpilot::model::Recurrence>             recurrence;
  std::optional<std::optional<double>>                    estimated_hours;
  std::optional<std::set<std::string>>                    tags;
  std::optional<std::vector<taskpilot::model::Milestone>> milestones;
};

struct TaskFilter {
  std::optional<taskpilot::model::TaskStatus> status;
  std::optional<taskpilot::model::Priority>   priority;
  std::optional<std::string>                  parent_id;
  std::optional<std::string>                  assigned_handler;
  std::optional<std::string>                  tag;
  // Excludes completed and cancelled tasks.
  bool open_only = false;

  bool Matches(const taskpilot::model::Task& task) const;
};

/*
  TaskStore

  Owns every mutation of the task set. Each public call runs in exactly one
  repository transaction under a store-wide mutex, so a call either fully
  applies or leaves nothing behind.

  Unknown ids are reported as empty optionals or false. Invalid input throws
  util::ValidationError (util::CycleDetected for dependency cycles) before
  anything is written.
*/
class TaskStore {
 public:
  explicit TaskStore(std::shared_ptr<taskpilot::db::Repository> repository);

  // Returns the id (generated when `task.id` is empty).
  std::string Create(taskpilot::model::Task task);

  std::optional<taskpilot::model::Task> Get(const std::string& id) const;

  bool Update(const std::string& id, const TaskPatch& patch);

  // Removes the task and all of its descendants, and drops the removed ids
  // from every remaining dependency set.
  bool Delete(const std::string& id);

  std::vector<taskpilot::model::Task> List(const TaskFilter& filter = {}) const;

  // Scores recomputed at `now`, highest first.
  std::vector<taskpilot::model::Task> Ranked(const TaskFilter& filter, taskpilot::model::TimePoint now) const;

  void Backup(const std::string& path) const;
  void Restore(const std::string& path);

  bool AddDependency(const std::string& id, const std::string& dependency_id);
  bool RemoveDependency(const std::string& id, const std::string& dependency_id);

  bool AppendNotification(const std::string& id, const taskpilot::model::Notification& notification);

  // Appends unless a notification of the same kind was recorded at or after
  // `since`. Returns true when appended.
  bool AppendNotificationOnce(const std::string& id, const taskpilot::model::Notification& notification,
                              taskpilot::model::TimePoint since);

  bool RecomputePriority(const std::string& id, taskpilot::model::TimePoint now);

  // Open tasks only. Returns the number of scores that changed.
  std::size_t RecomputeAll(taskpilot::model::TimePoint now);

  taskpilot::graph::ValidationReport           Validate(const std::string& id) const;
  std::optional<taskpilot::graph::Readiness>   IsReady(const std::string& id) const;

  // Creates the instance for the source's due occurrence. Empty when the
  // task is not due or the occurrence was already claimed; in both cases
  // the source's next occurrence is left pointing past the claimed one.
  std::optional<std::string> MaterializeOccurrence(const std::string& id, taskpilot::model::TimePoint now);

 private:
  void ValidateFields(const taskpilot::model::Task& task) const;
  void UnblockDependants(taskpilot::db::Transaction& tx, const std::string& completed_id, taskpilot::model::TimePoint now);
  void RefreshScore(taskpilot::db::Transaction& tx, const std::string& id, taskpilot::model::TimePoint now);
  void Touch(taskpilot::db::Transaction& tx, const std::string& id);

  std::shared_ptr<taskpilot::db::Repository> repository_;

  mutable std::mutex mutex_;
};

} // namespace taskpilot::core
