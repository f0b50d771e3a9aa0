#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace taskpilot::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertTask(Transaction&, const taskpilot::model::Task&) override;
  std::optional<taskpilot::model::Task> GetTask(Transaction&, const std::string&) override;
  std::vector<taskpilot::model::Task> ListTasks(Transaction&) override;
  Result UpdateTask(Transaction&, const taskpilot::model::Task&) override;
  Result DeleteTask(Transaction&, const std::string&) override;
  Result DeleteAllTasks(Transaction&) override;
  Result AppendNotification(Transaction&, const std::string&, const taskpilot::model::Notification&) override;

  Result ClaimOccurrence(Transaction&, const model::OccurrenceRecord&) override;
  std::vector<model::OccurrenceRecord> ListOccurrences(Transaction&, const std::string&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  // Child rows (dependencies, tags, milestones) are rewritten wholesale.
  static Result WriteChildren(sqlite3* db, const taskpilot::model::Task& task);
  static Result LoadChildren(sqlite3* db, taskpilot::model::Task& task);
};

}
