#include "internal/db/sql/migrations.hpp"

namespace taskpilot::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& TaskSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS task (id TEXT PRIMARY KEY, title TEXT NOT NULL, description TEXT NOT NULL DEFAULT '', status INTEGER NOT NULL, "
      "priority INTEGER NOT NULL, dynamic_priority_score REAL NOT NULL DEFAULT 0, due_at_ms INTEGER, parent_id TEXT, assigned_handler TEXT, "
      "progress INTEGER NOT NULL DEFAULT 0, recurrence_type INTEGER NOT NULL DEFAULT 0, recurrence_interval INTEGER NOT NULL DEFAULT 1, "
      "next_occurrence_ms INTEGER, series_id TEXT NOT NULL, estimated_hours REAL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, "
      "last_activity_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS task_parent_idx ON task(parent_id);",
      "CREATE TABLE IF NOT EXISTS task_dependency (task_id TEXT NOT NULL REFERENCES task(id) ON DELETE CASCADE, depends_on_id TEXT NOT NULL, "
      "PRIMARY KEY (task_id, depends_on_id));",
      "CREATE INDEX IF NOT EXISTS task_dependency_target_idx ON task_dependency(depends_on_id);",
      "CREATE TABLE IF NOT EXISTS task_tag (task_id TEXT NOT NULL REFERENCES task(id) ON DELETE CASCADE, tag TEXT NOT NULL, PRIMARY KEY (task_id, tag));",
      "CREATE TABLE IF NOT EXISTS task_milestone (task_id TEXT NOT NULL REFERENCES task(id) ON DELETE CASCADE, position INTEGER NOT NULL, "
      "title TEXT NOT NULL, completed INTEGER NOT NULL DEFAULT 0, PRIMARY KEY (task_id, position));",
      "CREATE TABLE IF NOT EXISTS task_notification (seq INTEGER PRIMARY KEY AUTOINCREMENT, task_id TEXT NOT NULL REFERENCES task(id) ON DELETE CASCADE, "
      "message TEXT NOT NULL, level INTEGER NOT NULL, kind TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS task_notification_task_idx ON task_notification(task_id);",
      "CREATE TABLE IF NOT EXISTS recurrence_occurrence (series_id TEXT NOT NULL, occurrence_ms INTEGER NOT NULL, materialized_task_id TEXT NOT NULL, "
      "created_at_ms INTEGER NOT NULL, PRIMARY KEY (series_id, occurrence_ms));",
      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO schema_migrations(version, applied_at_ms) VALUES (1, CAST(strftime('%s','now') AS INTEGER) * 1000);"};
  return kSchema;
}

} // namespace taskpilot::db::sql
