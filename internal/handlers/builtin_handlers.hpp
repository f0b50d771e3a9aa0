#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/task_store.hpp"
#include "internal/dispatch/handler.hpp"
#include "internal/dispatch/supervisor.hpp"

namespace taskpilot::handlers {

constexpr const char* kTaskManager          = "task_manager";
constexpr const char* kAnalyticsDashboard   = "analytics_dashboard";
constexpr const char* kPrioritizationEngine = "prioritization_engine";
constexpr const char* kCalendarOrchestrator = "calendar_orchestrator";
constexpr const char* kEmailTriage          = "email_triage";
constexpr const char* kFocusSupport         = "focus_support";
constexpr const char* kSmartReminders       = "smart_reminders";
constexpr const char* kGeneralChat          = "general_chat";

const std::vector<std::string>& BuiltinHandlerNames();

struct TaskStats {
  std::size_t total                 = 0;
  std::size_t completed             = 0;
  std::size_t pending               = 0;
  std::size_t high_priority_pending = 0;
  // Percent, one decimal.
  double completion_rate = 0.0;
};

TaskStats ComputeStats(const std::vector<taskpilot::model::Task>& tasks);

// Overdue work first, then critical/high work, then what is due tomorrow.
std::vector<std::string> SuggestNextActions(const std::vector<taskpilot::model::Task>& tasks, taskpilot::model::TimePoint now);

// Open tasks ranked by dynamic priority.
class TaskListHandler : public taskpilot::dispatch::Handler {
 public:
  explicit TaskListHandler(std::shared_ptr<taskpilot::core::TaskStore> store) : store_(std::move(store)) {
  }

  taskpilot::dispatch::HandlerResult Handle(const taskpilot::dispatch::HandlerRequest& request) override;

 private:
  std::shared_ptr<taskpilot::core::TaskStore> store_;
};

class AnalyticsHandler : public taskpilot::dispatch::Handler {
 public:
  explicit AnalyticsHandler(std::shared_ptr<taskpilot::core::TaskStore> store) : store_(std::move(store)) {
  }

  taskpilot::dispatch::HandlerResult Handle(const taskpilot::dispatch::HandlerRequest& request) override;

 private:
  std::shared_ptr<taskpilot::core::TaskStore> store_;
};

// Stands in for handlers backed by external services.
class AcknowledgeHandler : public taskpilot::dispatch::Handler {
 public:
  explicit AcknowledgeHandler(std::string name) : name_(std::move(name)) {
  }

  taskpilot::dispatch::HandlerResult Handle(const taskpilot::dispatch::HandlerRequest& request) override;

 private:
  std::string name_;
};

// Binds every name to its built-in implementation.
taskpilot::dispatch::Supervisor::HandlerMap BuildHandlers(const std::vector<std::string>& names,
                                                          std::shared_ptr<taskpilot::core::TaskStore> store);

} // namespace taskpilot::handlers
