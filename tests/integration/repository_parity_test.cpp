#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/occurrence_record.hpp"
#include "internal/util/time.hpp"

#if TASKPILOT_DB_SQLITE
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using taskpilot::db::ErrorCode;
using taskpilot::db::Repository;
using taskpilot::db::memory::MemoryRepository;
using taskpilot::db::model::OccurrenceRecord;
using taskpilot::model::Notification;
using taskpilot::model::NotificationLevel;
using taskpilot::model::Priority;
using taskpilot::model::RecurrenceType;
using taskpilot::model::Task;
using taskpilot::model::TaskStatus;

int64_t NowMs() {
  return taskpilot::util::ToUnixMillis(taskpilot::util::Now());
}

// Millisecond precision survives every backend.
taskpilot::model::TimePoint StampMs(int64_t ms) {
  return taskpilot::util::FromUnixMillis(ms);
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

Task MakeTask(const std::string& id, const std::string& title) {
  const auto now = StampMs(NowMs());

  Task task;
  task.id         = id;
  task.title      = title;
  task.series_id  = id;
  task.created_at = now;
  task.updated_at = now;
  // Distinct from updated_at so a swapped column shows up.
  task.last_activity_at = now - std::chrono::hours(1);
  return task;
}

void VerifyInsertGetUpdateDelete(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();

  Task task                   = MakeTask(id, "Write quarterly report");
  task.description            = "numbers from finance";
  task.priority               = Priority::kHigh;
  task.dynamic_priority_score = 2.5;
  task.due_date               = StampMs(NowMs() + 86'400'000);
  task.assigned_handler       = "task_manager";
  task.estimated_hours        = 1.5;
  task.recurrence.type        = RecurrenceType::kWeekly;
  task.recurrence.interval    = 2;
  task.tags                   = {"work", "finance"};
  task.milestones             = {{"draft", true}, {"review", false}};
  assert(repo.InsertTask(*tx, task));

  auto duplicate = repo.InsertTask(*tx, task);
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  auto loaded = repo.GetTask(*tx, id);
  assert(loaded.has_value());
  assert(loaded->title == "Write quarterly report");
  assert(loaded->priority == Priority::kHigh);
  assert(loaded->dynamic_priority_score == 2.5);
  assert(loaded->due_date == task.due_date);
  assert(loaded->assigned_handler == std::optional<std::string>("task_manager"));
  assert(loaded->estimated_hours == std::optional<double>(1.5));
  assert(loaded->recurrence.type == RecurrenceType::kWeekly);
  assert(loaded->recurrence.interval == 2);
  assert(loaded->tags.size() == 2);
  assert(loaded->milestones.size() == 2);
  assert(loaded->milestones[0].title == "draft" && loaded->milestones[0].completed);
  assert(loaded->created_at == task.created_at);
  assert(loaded->updated_at == task.updated_at);
  assert(loaded->last_activity_at == task.last_activity_at);

  loaded->status   = TaskStatus::kInProgress;
  loaded->progress = 40;
  loaded->tags     = {"work"};
  loaded->milestones.clear();
  loaded->assigned_handler.reset();
  assert(repo.UpdateTask(*tx, *loaded));

  auto updated = repo.GetTask(*tx, id);
  assert(updated.has_value());
  assert(updated->status == TaskStatus::kInProgress);
  assert(updated->progress == 40);
  assert(updated->tags.size() == 1);
  assert(updated->milestones.empty());
  assert(!updated->assigned_handler.has_value());

  assert(repo.DeleteTask(*tx, id));
  assert(!repo.GetTask(*tx, id).has_value());
  assert(repo.DeleteTask(*tx, id).code == ErrorCode::NotFound);

  Task missing = MakeTask(id + "-missing", "never stored");
  assert(repo.UpdateTask(*tx, missing).code == ErrorCode::NotFound);
  tx->Commit();
}

void VerifyDerivedSubtasks(Repository& repo, const std::string& parent_id) {
  auto tx = repo.Begin();

  assert(repo.InsertTask(*tx, MakeTask(parent_id, "Plan offsite")));

  Task first      = MakeTask(parent_id + "-venue", "Book venue");
  first.parent_id = parent_id;
  assert(repo.InsertTask(*tx, first));

  Task second         = MakeTask(parent_id + "-agenda", "Draft agenda");
  second.parent_id    = parent_id;
  second.dependencies = {first.id};
  assert(repo.InsertTask(*tx, second));

  auto parent = repo.GetTask(*tx, parent_id);
  assert(parent.has_value());
  assert(parent->subtasks.size() == 2);
  assert(parent->subtasks.contains(first.id));
  assert(parent->subtasks.contains(second.id));

  auto agenda = repo.GetTask(*tx, second.id);
  assert(agenda->dependencies.size() == 1);
  assert(agenda->dependencies.contains(first.id));

  // Subtasks written by the caller are ignored.
  parent->subtasks = {"bogus"};
  assert(repo.UpdateTask(*tx, *parent));
  assert(repo.GetTask(*tx, parent_id)->subtasks.size() == 2);

  assert(repo.DeleteTask(*tx, second.id));
  assert(repo.GetTask(*tx, parent_id)->subtasks.size() == 1);
  tx->Commit();
}

void VerifyNotificationsAppendOnly(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();
  assert(repo.InsertTask(*tx, MakeTask(id, "Renew passport")));

  Notification first{"Due tomorrow", NotificationLevel::kInfo, "deadline.tomorrow", StampMs(NowMs())};
  Notification second{"Due today", NotificationLevel::kWarning, "deadline.today", StampMs(NowMs() + 1)};
  assert(repo.AppendNotification(*tx, id, first));
  assert(repo.AppendNotification(*tx, id, second));
  assert(repo.AppendNotification(*tx, id + "-missing", first).code == ErrorCode::NotFound);

  auto task = repo.GetTask(*tx, id);
  assert(task->notifications.size() == 2);
  assert(task->notifications[0].kind == "deadline.tomorrow");
  assert(task->notifications[1].level == NotificationLevel::kWarning);

  // UpdateTask does not rewrite history.
  task->notifications.clear();
  task->title = "Renew passport and visa";
  assert(repo.UpdateTask(*tx, *task));
  assert(repo.GetTask(*tx, id)->notifications.size() == 2);
  tx->Commit();
}

void VerifyOccurrenceLedger(Repository& repo, const std::string& series_id) {
  auto tx = repo.Begin();

  OccurrenceRecord claim{.series_id = series_id, .occurrence_ms = 1'700'000'000'000, .materialized_task_id = "instance-1", .created_at_ms = NowMs()};
  assert(repo.ClaimOccurrence(*tx, claim));

  OccurrenceRecord again = claim;
  again.materialized_task_id = "instance-2";
  assert(repo.ClaimOccurrence(*tx, again).code == ErrorCode::AlreadyExists);

  OccurrenceRecord next = claim;
  next.occurrence_ms += 86'400'000;
  next.materialized_task_id = "instance-3";
  assert(repo.ClaimOccurrence(*tx, next));

  auto ledger = repo.ListOccurrences(*tx, series_id);
  assert(ledger.size() == 2);
  assert(ledger[0].materialized_task_id == "instance-1");
  assert(ledger[1].materialized_task_id == "instance-3");
  assert(repo.ListOccurrences(*tx, series_id + "-other").empty());
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertTask(*tx, MakeTask(id, "discarded")));
    tx->Rollback();
  }

  {
    // Dropping an uncommitted transaction rolls it back too.
    auto tx = repo.Begin();
    assert(repo.InsertTask(*tx, MakeTask(id + "-dropped", "discarded")));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetTask(*check_tx, id).has_value());
  assert(!repo.GetTask(*check_tx, id + "-dropped").has_value());
  check_tx->Commit();
}

void VerifyDeleteAll(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();
  assert(repo.InsertTask(*tx, MakeTask(id, "temporary")));
  assert(repo.DeleteAllTasks(*tx));
  assert(repo.ListTasks(*tx).empty());
  tx->Rollback();

  auto check_tx = repo.Begin();
  assert(repo.ListTasks(*check_tx).size() > 0);
  check_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();

    Task parent     = MakeTask(id, "Move house");
    parent.status   = TaskStatus::kInProgress;
    parent.progress = 30;
    parent.tags     = {"home"};
    assert(repo->InsertTask(*tx, parent));

    Task child      = MakeTask(id + "-child", "Pack books");
    child.parent_id = id;
    assert(repo->InsertTask(*tx, child));

    Notification note{"Stuck for a while", NotificationLevel::kWarning, "task.stuck", StampMs(NowMs())};
    assert(repo->AppendNotification(*tx, id, note));

    OccurrenceRecord claim{.series_id = id, .occurrence_ms = 1'700'000'000'000, .materialized_task_id = id + "-child", .created_at_ms = NowMs()};
    assert(repo->ClaimOccurrence(*tx, claim));

    tx->Commit();
  }

  backend.restart(repo);

  auto tx     = repo->Begin();
  auto parent = repo->GetTask(*tx, id);
  assert(parent.has_value());
  assert(parent->status == TaskStatus::kInProgress);
  assert(parent->progress == 30);
  assert(parent->tags.contains("home"));
  assert(parent->subtasks.contains(id + "-child"));
  assert(parent->notifications.size() == 1);
  assert(parent->notifications[0].kind == "task.stuck");
  assert(repo->ListOccurrences(*tx, id).size() == 1);
  tx->Commit();

  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if TASKPILOT_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("taskpilot_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<taskpilot::db::sqlite::SqliteDB>(db_path);
    taskpilot::db::sql::RunMigrations(*db, taskpilot::db::sql::TaskSchema());
    return std::make_shared<taskpilot::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() { std::filesystem::remove(db_path); },
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyInsertGetUpdateDelete(*repo, backend.name + "-task-life");
  VerifyDerivedSubtasks(*repo, backend.name + "-parent");
  VerifyNotificationsAppendOnly(*repo, backend.name + "-notes");
  VerifyOccurrenceLedger(*repo, backend.name + "-series");
  VerifyRollbackBehavior(*repo, backend.name + "-rollback");
  VerifyDeleteAll(*repo, backend.name + "-delete-all");

  repo.reset();
  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if TASKPILOT_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "taskpilot_integration_repository_parity: pass\n";
  return 0;
}
