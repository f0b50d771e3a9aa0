#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/task_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/dispatch/handler_registry.hpp"
#include "internal/dispatch/supervisor.hpp"
#include "internal/maintenance/sweeps.hpp"
#include "internal/queue/work_queue.hpp"

namespace taskpilot::factory {

/*
  Application

  Owns all long-lived components. Nothing is started here; the caller
  starts the supervisor and the maintenance timers.
*/
struct Application {
  std::shared_ptr<db::Repository>                    repository;
  std::shared_ptr<core::TaskStore>                   store;
  std::shared_ptr<dispatch::HandlerRegistry>         registry;
  std::shared_ptr<queue::WorkQueue>                  queue;
  std::shared_ptr<dispatch::Supervisor>              supervisor;
  std::shared_ptr<maintenance::MaintenanceSweeps>    sweeps;
  std::shared_ptr<maintenance::MaintenanceScheduler> maintenance;
};

/*
  The only place that knows concrete repository types. Opening the durable
  store and bootstrapping its schema happen here; failure throws.
*/
std::shared_ptr<db::Repository> BuildRepository(const taskpilot::runtime::config::RuntimeConfig& config);

dispatch::SupervisorOptions      ToSupervisorOptions(const taskpilot::runtime::config::SupervisorConfig& config);
maintenance::SweepOptions        ToSweepOptions(const taskpilot::runtime::config::MaintenanceConfig& config);
maintenance::MaintenanceIntervals ToMaintenanceIntervals(const taskpilot::runtime::config::MaintenanceConfig& config);

Application Build(const taskpilot::runtime::config::RuntimeConfig& config);

} // namespace taskpilot::factory
