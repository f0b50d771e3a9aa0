#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/occurrence_record.hpp"
#include "internal/model/task.hpp"

namespace taskpilot::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A rolled back transaction leaves no trace

  Row semantics:

  - Task::subtasks is never stored. Reads derive it from the parent_id of
    the other rows, so parent/child links cannot drift apart.
  - Notifications are append-only. UpdateTask ignores Task::notifications;
    use AppendNotification.
  - DeleteTask removes one row and the rows it owns (its dependency edges,
    tags, milestones, notifications). Cascading to subtasks and scrubbing
    dependency references is the caller's job.

  The DB is the source of truth for tasks.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Tasks
  // ---------------------------------------------------------------------

  virtual Result InsertTask(Transaction&, const taskpilot::model::Task&) = 0;

  virtual std::optional<taskpilot::model::Task> GetTask(Transaction&, const std::string& id) = 0;

  virtual std::vector<taskpilot::model::Task> ListTasks(Transaction&) = 0;

  virtual Result UpdateTask(Transaction&, const taskpilot::model::Task&) = 0;

  virtual Result DeleteTask(Transaction&, const std::string& id) = 0;

  virtual Result DeleteAllTasks(Transaction&) = 0;

  virtual Result AppendNotification(Transaction&, const std::string& id, const taskpilot::model::Notification&) = 0;

  // ---------------------------------------------------------------------
  // Recurrence ledger
  // ---------------------------------------------------------------------

  // AlreadyExists when the occurrence was claimed before.
  virtual Result ClaimOccurrence(Transaction&, const model::OccurrenceRecord&) = 0;

  virtual std::vector<model::OccurrenceRecord> ListOccurrences(Transaction&, const std::string& series_id) = 0;
};

} // namespace taskpilot::db
