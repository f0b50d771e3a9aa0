#pragma once

#include <string>
#include <vector>

namespace taskpilot::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs migrations in order.
  Statements must be idempotent (CREATE ... IF NOT EXISTS).
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// Ordered schema for the task store.
const std::vector<std::string>& TaskSchema();

} // namespace taskpilot::db::sql
