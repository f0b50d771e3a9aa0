#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/task_snapshot.hpp"
#include "internal/core/task_store.hpp"
#include "internal/factory.hpp"
#include "internal/handlers/builtin_handlers.hpp"
#include "internal/maintenance/sweeps.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using taskpilot::core::TaskFilter;
using taskpilot::core::TaskPatch;
using taskpilot::core::TaskStore;
using taskpilot::model::Task;

static void Usage() {
  std::cout << "Usage:\n"
            << "  taskctl <config.yaml> create <title> [--description text] [--priority critical|high|medium|low]\n"
            << "                                     [--due YYYY-MM-DD] [--handler name] [--parent id]\n"
            << "                                     [--recur daily|weekly|monthly|yearly[:interval]] [--tag tag]...\n"
            << "  taskctl <config.yaml> get <id>\n"
            << "  taskctl <config.yaml> list [--open] [--status status] [--tag tag]\n"
            << "  taskctl <config.yaml> ranked\n"
            << "  taskctl <config.yaml> status <id> <status>\n"
            << "  taskctl <config.yaml> progress <id> <0..100>\n"
            << "  taskctl <config.yaml> complete <id>\n"
            << "  taskctl <config.yaml> delete <id>\n"
            << "  taskctl <config.yaml> depend <id> <dependency_id>\n"
            << "  taskctl <config.yaml> undepend <id> <dependency_id>\n"
            << "  taskctl <config.yaml> validate <id>\n"
            << "  taskctl <config.yaml> ready <id>\n"
            << "  taskctl <config.yaml> backup <path>\n"
            << "  taskctl <config.yaml> restore <path>\n"
            << "  taskctl <config.yaml> stats\n"
            << "  taskctl <config.yaml> sweep\n";
}

static void PrintTask(const Task& task) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(taskpilot::core::ToRecord(task), &json, options);
  if (!status.ok()) {
    std::cerr << "cannot render task " << task.id << ": " << status.message() << "\n";
    return;
  }
  std::cout << json;
}

static void PrintSummary(const Task& task) {
  std::cout << task.id << "  " << taskpilot::model::ToString(task.status) << "  " << taskpilot::model::ToString(task.priority) << "  "
            << task.dynamic_priority_score << "  " << task.title;
  if (task.due_date) std::cout << "  due " << taskpilot::util::FormatLocalDate(*task.due_date);
  std::cout << "\n";
}

static taskpilot::model::Recurrence ParseRecurrence(const std::string& value) {
  taskpilot::model::Recurrence recurrence;
  const auto                   colon = value.find(':');
  recurrence.type                    = taskpilot::model::ParseRecurrenceType(value.substr(0, colon));
  if (colon != std::string::npos) recurrence.interval = taskpilot::model::ParseRecurrenceInterval(value.substr(colon + 1));
  return recurrence;
}

static Task ParseCreate(const std::vector<std::string>& args) {
  if (args.empty()) throw taskpilot::util::ValidationError("create needs a title");

  Task task;
  task.title = args[0];
  for (size_t i = 1; i < args.size(); ++i) {
    const auto& flag = args[i];
    if (i + 1 >= args.size()) throw taskpilot::util::ValidationError("missing value for " + flag);
    const auto& value = args[++i];

    if (flag == "--description") {
      task.description = value;
    } else if (flag == "--priority") {
      task.priority = taskpilot::model::ParsePriority(value);
    } else if (flag == "--due") {
      auto due = taskpilot::util::ParseLocalDate(value);
      if (!due) throw taskpilot::util::ValidationError("invalid date " + value + ", expected YYYY-MM-DD");
      task.due_date = *due;
    } else if (flag == "--handler") {
      task.assigned_handler = value;
    } else if (flag == "--parent") {
      task.parent_id = value;
    } else if (flag == "--recur") {
      task.recurrence = ParseRecurrence(value);
    } else if (flag == "--tag") {
      task.tags.insert(value);
    } else {
      throw taskpilot::util::ValidationError("unknown option " + flag);
    }
  }
  return task;
}

static int NotFound(const std::string& id) {
  std::cerr << "task not found: " << id << "\n";
  return 3;
}

static int Run(const taskpilot::runtime::config::RuntimeConfig& config, const std::string& cmd, const std::vector<std::string>& args) {
  auto store = std::make_shared<TaskStore>(taskpilot::factory::BuildRepository(config));

  auto need = [&](size_t count) {
    if (args.size() < count) {
      Usage();
      std::exit(1);
    }
  };

  if (cmd == "create") {
    std::cout << store->Create(ParseCreate(args)) << "\n";
    return 0;
  }

  if (cmd == "get") {
    need(1);
    auto task = store->Get(args[0]);
    if (!task) return NotFound(args[0]);
    PrintTask(*task);
    std::cout << "\n";
    return 0;
  }

  if (cmd == "list") {
    TaskFilter filter;
    for (size_t i = 0; i < args.size(); ++i) {
      if (args[i] == "--open") {
        filter.open_only = true;
      } else if (args[i] == "--status" && i + 1 < args.size()) {
        filter.status = taskpilot::model::ParseTaskStatus(args[++i]);
      } else if (args[i] == "--tag" && i + 1 < args.size()) {
        filter.tag = args[++i];
      } else {
        Usage();
        return 1;
      }
    }
    for (const auto& task : store->List(filter)) PrintSummary(task);
    return 0;
  }

  if (cmd == "ranked") {
    TaskFilter filter;
    filter.open_only = true;
    for (const auto& task : store->Ranked(filter, taskpilot::util::Now())) PrintSummary(task);
    return 0;
  }

  if (cmd == "status" || cmd == "progress" || cmd == "complete") {
    need(cmd == "complete" ? 1 : 2);
    TaskPatch patch;
    if (cmd == "status") patch.status = taskpilot::model::ParseTaskStatus(args[1]);
    if (cmd == "progress") patch.progress = taskpilot::model::ParseProgress(args[1]);
    if (cmd == "complete") patch.status = taskpilot::model::TaskStatus::kCompleted;
    if (!store->Update(args[0], patch)) return NotFound(args[0]);
    return 0;
  }

  if (cmd == "delete") {
    need(1);
    if (!store->Delete(args[0])) return NotFound(args[0]);
    return 0;
  }

  if (cmd == "depend" || cmd == "undepend") {
    need(2);
    const bool ok = cmd == "depend" ? store->AddDependency(args[0], args[1]) : store->RemoveDependency(args[0], args[1]);
    if (!ok) return NotFound(args[0]);
    return 0;
  }

  if (cmd == "validate") {
    need(1);
    const auto report = store->Validate(args[0]);
    std::cout << (report.ok ? "ok" : "invalid") << "\n";
    for (const auto& error : report.errors) std::cout << "  " << error << "\n";
    return report.ok ? 0 : 4;
  }

  if (cmd == "ready") {
    need(1);
    const auto readiness = store->IsReady(args[0]);
    if (!readiness) return NotFound(args[0]);
    std::cout << (readiness->ready ? "ready" : "waiting") << "\n";
    for (const auto& blocking : readiness->blocking) std::cout << "  " << blocking << "\n";
    return 0;
  }

  if (cmd == "backup") {
    need(1);
    store->Backup(args[0]);
    return 0;
  }

  if (cmd == "restore") {
    need(1);
    store->Restore(args[0]);
    return 0;
  }

  if (cmd == "stats") {
    const auto tasks = store->List();
    const auto stats = taskpilot::handlers::ComputeStats(tasks);
    std::cout << "total=" << stats.total << " completed=" << stats.completed << " pending=" << stats.pending
              << " high_priority_pending=" << stats.high_priority_pending << " completion_rate=" << stats.completion_rate << "\n";
    for (const auto& suggestion : taskpilot::handlers::SuggestNextActions(tasks, taskpilot::util::Now())) {
      std::cout << "- " << suggestion << "\n";
    }
    return 0;
  }

  if (cmd == "sweep") {
    taskpilot::maintenance::MaintenanceSweeps sweeps(store, taskpilot::factory::ToSweepOptions(config.maintenance()));
    const auto                                now = taskpilot::util::Now();
    std::cout << "deadline=" << sweeps.DeadlineSweep(now) << " stuck=" << sweeps.StuckSweep(now)
              << " recurrence=" << sweeps.RecurrenceSweep(now) << " priority=" << sweeps.PrioritySweep(now) << "\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string              config_path = argv[1];
  const std::string              cmd         = argv[2];
  const std::vector<std::string> args(argv + 3, argv + argc);

  try {
    auto config = taskpilot::config::ConfigLoader::LoadFromYaml(config_path);
    config.mutable_logging()->set_level("warn");
    taskpilot::observability::InitializeLogging(config);

    const int rc = Run(config, cmd, args);
    taskpilot::observability::ShutdownLogging();
    return rc;
  } catch (const taskpilot::util::CycleDetected& e) {
    std::cerr << "cycle: " << e.what() << "\n";
    return 4;
  } catch (const taskpilot::util::ValidationError& e) {
    std::cerr << "invalid: " << e.what() << "\n";
    return 4;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }
}
