#include "internal/handlers/builtin_handlers.hpp"

#include <cmath>
#include <sstream>

#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"

namespace taskpilot::handlers {

using taskpilot::dispatch::HandlerRequest;
using taskpilot::dispatch::HandlerResult;
using taskpilot::model::Priority;
using taskpilot::model::Task;
using taskpilot::model::TaskStatus;
using taskpilot::model::TimePoint;

const std::vector<std::string>& BuiltinHandlerNames() {
  static const std::vector<std::string> kNames = {kTaskManager,   kAnalyticsDashboard, kPrioritizationEngine, kCalendarOrchestrator,
                                                  kEmailTriage,   kFocusSupport,       kSmartReminders,       kGeneralChat};
  return kNames;
}

TaskStats ComputeStats(const std::vector<Task>& tasks) {
  TaskStats stats;
  stats.total = tasks.size();
  for (const auto& task : tasks) {
    if (task.status == TaskStatus::kCompleted) ++stats.completed;
    if (task.status == TaskStatus::kPending) ++stats.pending;
    if ((task.priority == Priority::kCritical || task.priority == Priority::kHigh) && task.status != TaskStatus::kCompleted) {
      ++stats.high_priority_pending;
    }
  }
  if (stats.total > 0) {
    const double rate     = 100.0 * static_cast<double>(stats.completed) / static_cast<double>(stats.total);
    stats.completion_rate = std::round(rate * 10.0) / 10.0;
  }
  return stats;
}

std::vector<std::string> SuggestNextActions(const std::vector<Task>& tasks, TimePoint now) {
  std::size_t overdue = 0;
  std::size_t urgent  = 0;
  std::size_t due_tomorrow = 0;

  for (const auto& task : tasks) {
    if (task.status == TaskStatus::kCompleted) continue;

    if (task.priority == Priority::kCritical || task.priority == Priority::kHigh) ++urgent;
    if (!task.due_date) continue;

    const int days = util::CalendarDaysBetween(now, *task.due_date);
    if (days < 0) ++overdue;
    if (days == 1) ++due_tomorrow;
  }

  std::vector<std::string> suggestions;
  if (overdue > 0) {
    suggestions.push_back("You have " + std::to_string(overdue) + " overdue task(s). Consider completing them first.");
  }
  if (urgent > 0) {
    suggestions.push_back("Focus on " + std::to_string(urgent) + " high priority task(s).");
  }
  if (due_tomorrow > 0) {
    suggestions.push_back(std::to_string(due_tomorrow) + " task(s) due tomorrow.");
  }
  return suggestions;
}

HandlerResult TaskListHandler::Handle(const HandlerRequest&) {
  core::TaskFilter filter;
  filter.open_only = true;

  const auto tasks = store_->Ranked(filter, util::Now());
  if (tasks.empty()) return {true, "No open tasks."};

  std::ostringstream out;
  out.precision(2);
  out << std::fixed << "Open tasks (" << tasks.size() << "):";
  std::size_t rank = 1;
  for (const auto& task : tasks) {
    out << "\n" << rank++ << ". " << task.title << " [" << model::ToString(task.priority) << ", " << model::ToString(task.status)
        << ", score " << task.dynamic_priority_score << "]";
    if (task.due_date) out << " due " << util::FormatLocalDate(*task.due_date);
  }
  return {true, out.str()};
}

HandlerResult AnalyticsHandler::Handle(const HandlerRequest&) {
  const auto tasks = store_->List();
  const auto stats = ComputeStats(tasks);

  std::ostringstream out;
  out.precision(1);
  out << std::fixed << "Total: " << stats.total << ", completed: " << stats.completed << ", pending: " << stats.pending
      << ", high priority open: " << stats.high_priority_pending << ", completion rate: " << stats.completion_rate << "%";

  for (const auto& suggestion : SuggestNextActions(tasks, util::Now())) {
    out << "\n- " << suggestion;
  }
  return {true, out.str()};
}

HandlerResult AcknowledgeHandler::Handle(const HandlerRequest& request) {
  std::string text = name_ + " received: " + request.query;
  if (request.task) text += " (task " + request.task->id + ")";
  return {true, text};
}

taskpilot::dispatch::Supervisor::HandlerMap BuildHandlers(const std::vector<std::string>& names, std::shared_ptr<core::TaskStore> store) {
  taskpilot::dispatch::Supervisor::HandlerMap handlers;
  for (const auto& name : names) {
    if (name == kTaskManager || name == kPrioritizationEngine) {
      handlers.emplace(name, std::make_shared<TaskListHandler>(store));
    } else if (name == kAnalyticsDashboard) {
      handlers.emplace(name, std::make_shared<AnalyticsHandler>(store));
    } else {
      handlers.emplace(name, std::make_shared<AcknowledgeHandler>(name));
    }
  }
  return handlers;
}

} // namespace taskpilot::handlers
