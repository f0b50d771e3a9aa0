#include "factory.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/handlers/builtin_handlers.hpp"
#include "internal/handlers/keyword_classifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#if TASKPILOT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace taskpilot::factory {

using taskpilot::runtime::config::MaintenanceConfig;
using taskpilot::runtime::config::RuntimeConfig;
using taskpilot::runtime::config::SupervisorConfig;

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_memory()) {
    TASKPILOT_LOG_WARN("Using in-memory task store; tasks are lost on exit");
    return std::make_shared<db::memory::MemoryRepository>();
  }

#if TASKPILOT_DB_SQLITE
  const std::string path = database.has_sqlite() && !database.sqlite().path().empty() ? database.sqlite().path() : "taskpilot.db";

  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path);
  db::sql::RunMigrations(*sqlite_db, db::sql::TaskSchema());

  TASKPILOT_LOG_INFO("Task store opened", {observability::StringField("path", path)});
  return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
  throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
}

dispatch::SupervisorOptions ToSupervisorOptions(const SupervisorConfig& config) {
  dispatch::SupervisorOptions options;
  if (!config.default_handler().empty()) options.default_handler = config.default_handler();
  if (config.max_acquire_attempts() > 0) options.max_acquire_attempts = config.max_acquire_attempts();
  if (config.interaction_log_capacity() > 0) options.interaction_log_capacity = config.interaction_log_capacity();
  options.acquire_backoff = util::ToChrono(config.acquire_backoff(), options.acquire_backoff);
  options.handler_timeout = util::ToChrono(config.handler_timeout(), std::chrono::milliseconds(0));
  return options;
}

maintenance::SweepOptions ToSweepOptions(const MaintenanceConfig& config) {
  maintenance::SweepOptions options;
  options.stale_after         = util::ToChrono(config.stale_after(), options.stale_after);
  options.notification_window = util::ToChrono(config.notification_window(), options.notification_window);
  return options;
}

maintenance::MaintenanceIntervals ToMaintenanceIntervals(const MaintenanceConfig& config) {
  maintenance::MaintenanceIntervals intervals;
  intervals.deadline   = util::ToChrono(config.deadline_sweep_interval(), intervals.deadline);
  intervals.stuck      = util::ToChrono(config.stuck_sweep_interval(), intervals.stuck);
  intervals.recurrence = util::ToChrono(config.recurrence_sweep_interval(), intervals.recurrence);
  intervals.priority   = util::ToChrono(config.priority_sweep_interval(), intervals.priority);
  return intervals;
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.store      = std::make_shared<core::TaskStore>(app.repository);

  // ------------------------------------------------------------------
  // Dispatch
  // ------------------------------------------------------------------
  std::vector<std::string> names(config.supervisor().handlers().begin(), config.supervisor().handlers().end());
  if (names.empty()) names = handlers::BuiltinHandlerNames();

  auto options = ToSupervisorOptions(config.supervisor());
  if (std::find(names.begin(), names.end(), options.default_handler) == names.end()) {
    throw std::runtime_error("default handler " + options.default_handler + " is not in the handler list");
  }

  app.registry   = std::make_shared<dispatch::HandlerRegistry>(names);
  app.queue      = std::make_shared<queue::WorkQueue>();
  app.supervisor = std::make_shared<dispatch::Supervisor>(app.store, app.registry, app.queue, handlers::BuildHandlers(names, app.store),
                                                          std::make_shared<handlers::KeywordClassifier>(), nullptr, std::move(options));

  // ------------------------------------------------------------------
  // Maintenance
  // ------------------------------------------------------------------
  app.sweeps      = std::make_shared<maintenance::MaintenanceSweeps>(app.store, ToSweepOptions(config.maintenance()));
  app.maintenance = std::make_shared<maintenance::MaintenanceScheduler>(app.sweeps, ToMaintenanceIntervals(config.maintenance()));

  return app;
}

} // namespace taskpilot::factory
