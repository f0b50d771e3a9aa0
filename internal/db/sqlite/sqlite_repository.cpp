#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/util/time.hpp"

namespace taskpilot::db::sqlite {

using taskpilot::db::ErrorCode;
using taskpilot::db::Result;
using taskpilot::model::Task;

namespace {

// Finalizes on scope exit.
class Stmt {
 public:
  Stmt(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      st_ = nullptr;
    }
  }
  ~Stmt() {
    if (st_) sqlite3_finalize(st_);
  }

  Stmt(const Stmt&)            = delete;
  Stmt& operator=(const Stmt&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }
  explicit operator bool() const {
    return st_ != nullptr;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptTime(sqlite3_stmt* st, int idx, const std::optional<taskpilot::model::TimePoint>& tp) {
  if (tp) {
    BindI64(st, idx, util::ToUnixMillis(*tp));
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

std::optional<taskpilot::model::TimePoint> ColOptTime(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return util::FromUnixMillis(ColI64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

constexpr const char* kTaskColumns =
    "id,title,description,status,priority,dynamic_priority_score,due_at_ms,parent_id,assigned_handler,progress,"
    "recurrence_type,recurrence_interval,next_occurrence_ms,series_id,estimated_hours,created_at_ms,updated_at_ms,last_activity_at_ms";

Task ReadTaskRow(sqlite3_stmt* st) {
  Task task;
  task.id                     = ColText(st, 0);
  task.title                  = ColText(st, 1);
  task.description            = ColText(st, 2);
  task.status                 = static_cast<taskpilot::model::TaskStatus>(ColI32(st, 3));
  task.priority               = static_cast<taskpilot::model::Priority>(ColI32(st, 4));
  task.dynamic_priority_score = sqlite3_column_double(st, 5);
  task.due_date               = ColOptTime(st, 6);
  task.parent_id              = ColOptText(st, 7);
  task.assigned_handler       = ColOptText(st, 8);
  task.progress               = static_cast<uint32_t>(ColI32(st, 9));
  task.recurrence.type        = static_cast<taskpilot::model::RecurrenceType>(ColI32(st, 10));
  task.recurrence.interval    = static_cast<uint32_t>(ColI32(st, 11));
  task.next_occurrence        = ColOptTime(st, 12);
  task.series_id              = ColText(st, 13);
  if (sqlite3_column_type(st, 14) != SQLITE_NULL) {
    task.estimated_hours = sqlite3_column_double(st, 14);
  }
  task.created_at = util::FromUnixMillis(ColI64(st, 15));
  task.updated_at       = util::FromUnixMillis(ColI64(st, 16));
  task.last_activity_at = util::FromUnixMillis(ColI64(st, 17));
  return task;
}

// Binds every column after id, starting at `idx`.
void BindTaskColumns(sqlite3_stmt* st, int idx, const Task& task) {
  BindText(st, idx++, task.title);
  BindText(st, idx++, task.description);
  BindI32(st, idx++, static_cast<int>(task.status));
  BindI32(st, idx++, static_cast<int>(task.priority));
  sqlite3_bind_double(st, idx++, task.dynamic_priority_score);
  BindOptTime(st, idx++, task.due_date);
  BindOptText(st, idx++, task.parent_id);
  BindOptText(st, idx++, task.assigned_handler);
  BindI32(st, idx++, static_cast<int>(task.progress));
  BindI32(st, idx++, static_cast<int>(task.recurrence.type));
  BindI32(st, idx++, static_cast<int>(task.recurrence.interval));
  BindOptTime(st, idx++, task.next_occurrence);
  BindText(st, idx++, task.series_id);
  if (task.estimated_hours) {
    sqlite3_bind_double(st, idx++, *task.estimated_hours);
  } else {
    sqlite3_bind_null(st, idx++);
  }
  BindI64(st, idx++, util::ToUnixMillis(task.created_at));
  BindI64(st, idx++, util::ToUnixMillis(task.updated_at));
  BindI64(st, idx, util::ToUnixMillis(task.last_activity_at));
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Child rows
// ------------------------------------------------------------------

Result SqliteRepository::WriteChildren(sqlite3* db, const Task& task) {
  for (const char* sql : {"DELETE FROM task_dependency WHERE task_id=?;", "DELETE FROM task_tag WHERE task_id=?;",
                          "DELETE FROM task_milestone WHERE task_id=?;"}) {
    Stmt st(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, task.id);
    if (auto r = Translate(db, sqlite3_step(st.get())); !r) return r;
  }

  for (const auto& dep : task.dependencies) {
    Stmt st(db, "INSERT INTO task_dependency(task_id,depends_on_id) VALUES(?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, task.id);
    BindText(st.get(), 2, dep);
    if (auto r = Translate(db, sqlite3_step(st.get())); !r) return r;
  }

  for (const auto& tag : task.tags) {
    Stmt st(db, "INSERT INTO task_tag(task_id,tag) VALUES(?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, task.id);
    BindText(st.get(), 2, tag);
    if (auto r = Translate(db, sqlite3_step(st.get())); !r) return r;
  }

  int position = 0;
  for (const auto& milestone : task.milestones) {
    Stmt st(db, "INSERT INTO task_milestone(task_id,position,title,completed) VALUES(?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, task.id);
    BindI32(st.get(), 2, position++);
    BindText(st.get(), 3, milestone.title);
    BindI32(st.get(), 4, milestone.completed ? 1 : 0);
    if (auto r = Translate(db, sqlite3_step(st.get())); !r) return r;
  }

  return Result::Ok();
}

Result SqliteRepository::LoadChildren(sqlite3* db, Task& task) {
  {
    Stmt st(db, "SELECT depends_on_id FROM task_dependency WHERE task_id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, task.id);
    while (sqlite3_step(st.get()) == SQLITE_ROW) task.dependencies.insert(ColText(st.get(), 0));
  }
  {
    Stmt st(db, "SELECT id FROM task WHERE parent_id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, task.id);
    while (sqlite3_step(st.get()) == SQLITE_ROW) task.subtasks.insert(ColText(st.get(), 0));
  }
  {
    Stmt st(db, "SELECT tag FROM task_tag WHERE task_id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, task.id);
    while (sqlite3_step(st.get()) == SQLITE_ROW) task.tags.insert(ColText(st.get(), 0));
  }
  {
    Stmt st(db, "SELECT title,completed FROM task_milestone WHERE task_id=? ORDER BY position;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, task.id);
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
      task.milestones.push_back({ColText(st.get(), 0), ColI32(st.get(), 1) != 0});
    }
  }
  {
    Stmt st(db, "SELECT message,level,kind,created_at_ms FROM task_notification WHERE task_id=? ORDER BY seq;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(st.get(), 1, task.id);
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
      taskpilot::model::Notification n;
      n.message   = ColText(st.get(), 0);
      n.level     = static_cast<taskpilot::model::NotificationLevel>(ColI32(st.get(), 1));
      n.kind      = ColText(st.get(), 2);
      n.timestamp = util::FromUnixMillis(ColI64(st.get(), 3));
      task.notifications.push_back(std::move(n));
    }
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result SqliteRepository::InsertTask(Transaction& t, const Task& task) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO task(") + kTaskColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";
  Stmt              st(db, sql.c_str());
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, task.id);
  BindTaskColumns(st.get(), 2, task);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "task already exists: " + task.id);
  if (auto r = Translate(db, rc); !r) return r;

  if (auto r = WriteChildren(db, task); !r) return r;

  for (const auto& n : task.notifications) {
    if (auto r = AppendNotification(t, task.id, n); !r) return r;
  }
  return Result::Ok();
}

std::optional<Task> SqliteRepository::GetTask(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kTaskColumns + " FROM task WHERE id=?;";
  Stmt              st(db, sql.c_str());
  if (!st) return std::nullopt;

  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  Task task = ReadTaskRow(st.get());
  if (!LoadChildren(db, task)) return std::nullopt;
  return task;
}

std::vector<Task> SqliteRepository::ListTasks(Transaction& t) {
  auto* db = TX(t).Handle();

  std::vector<Task> tasks;
  {
    const std::string sql = std::string("SELECT ") + kTaskColumns + " FROM task ORDER BY created_at_ms, id;";
    Stmt              st(db, sql.c_str());
    if (!st) return {};
    while (sqlite3_step(st.get()) == SQLITE_ROW) tasks.push_back(ReadTaskRow(st.get()));
  }

  for (auto& task : tasks) {
    if (!LoadChildren(db, task)) return {};
  }
  return tasks;
}

Result SqliteRepository::UpdateTask(Transaction& t, const Task& task) {
  auto* db = TX(t).Handle();

  const char* sql =
      "UPDATE task SET title=?,description=?,status=?,priority=?,dynamic_priority_score=?,due_at_ms=?,parent_id=?,assigned_handler=?,"
      "progress=?,recurrence_type=?,recurrence_interval=?,next_occurrence_ms=?,series_id=?,estimated_hours=?,created_at_ms=?,updated_at_ms=?,last_activity_at_ms=? "
      "WHERE id=?;";
  Stmt st(db, sql);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindTaskColumns(st.get(), 1, task);
  BindText(st.get(), 18, task.id);

  if (auto r = Translate(db, sqlite3_step(st.get())); !r) return r;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "task not found: " + task.id);

  return WriteChildren(db, task);
}

Result SqliteRepository::DeleteTask(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Stmt st(db, "DELETE FROM task WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, id);
  if (auto r = Translate(db, sqlite3_step(st.get())); !r) return r;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "task not found: " + id);
  return Result::Ok();
}

Result SqliteRepository::DeleteAllTasks(Transaction& t) {
  auto* db = TX(t).Handle();

  for (const char* sql : {"DELETE FROM task_notification;", "DELETE FROM task_milestone;", "DELETE FROM task_tag;",
                          "DELETE FROM task_dependency;", "DELETE FROM task;", "DELETE FROM recurrence_occurrence;"}) {
    Stmt st(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    if (auto r = Translate(db, sqlite3_step(st.get())); !r) return r;
  }
  return Result::Ok();
}

Result SqliteRepository::AppendNotification(Transaction& t, const std::string& id, const taskpilot::model::Notification& n) {
  auto* db = TX(t).Handle();

  {
    Stmt exists(db, "SELECT 1 FROM task WHERE id=?;");
    if (!exists) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(exists.get(), 1, id);
    if (sqlite3_step(exists.get()) != SQLITE_ROW) return Result::Err(ErrorCode::NotFound, "task not found: " + id);
  }

  Stmt st(db, "INSERT INTO task_notification(task_id,message,level,kind,created_at_ms) VALUES(?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, id);
  BindText(st.get(), 2, n.message);
  BindI32(st.get(), 3, static_cast<int>(n.level));
  BindText(st.get(), 4, n.kind);
  BindI64(st.get(), 5, util::ToUnixMillis(n.timestamp));

  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Recurrence ledger
// ------------------------------------------------------------------

Result SqliteRepository::ClaimOccurrence(Transaction& t, const model::OccurrenceRecord& r) {
  auto* db = TX(t).Handle();

  Stmt st(db, "INSERT INTO recurrence_occurrence(series_id,occurrence_ms,materialized_task_id,created_at_ms) VALUES(?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.series_id);
  BindI64(st.get(), 2, r.occurrence_ms);
  BindText(st.get(), 3, r.materialized_task_id);
  BindI64(st.get(), 4, r.created_at_ms);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "occurrence already materialized");
  return Translate(db, rc);
}

std::vector<model::OccurrenceRecord> SqliteRepository::ListOccurrences(Transaction& t, const std::string& series_id) {
  auto* db = TX(t).Handle();

  Stmt st(db, "SELECT series_id,occurrence_ms,materialized_task_id,created_at_ms FROM recurrence_occurrence WHERE series_id=? ORDER BY occurrence_ms;");
  if (!st) return {};

  BindText(st.get(), 1, series_id);

  std::vector<model::OccurrenceRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::OccurrenceRecord r;
    r.series_id            = ColText(st.get(), 0);
    r.occurrence_ms        = ColI64(st.get(), 1);
    r.materialized_task_id = ColText(st.get(), 2);
    r.created_at_ms        = ColI64(st.get(), 3);
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace taskpilot::db::sqlite
