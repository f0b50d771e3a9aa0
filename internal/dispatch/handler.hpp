#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/dispatch/interaction_log.hpp"
#include "internal/model/task.hpp"

namespace taskpilot::dispatch {

struct HandlerRequest {
  std::string                           query;
  std::optional<taskpilot::model::Task> task;
  // Most recent interactions first.
  std::vector<Interaction> context;
};

struct HandlerResult {
  bool        ok = true;
  std::string text;
};

/*
  A named unit of work the Supervisor dispatches to. Implementations may
  block and may throw; both are handled at the dispatch boundary.
*/
class Handler {
 public:
  virtual ~Handler() = default;

  virtual HandlerResult Handle(const HandlerRequest& request) = 0;
};

// Maps free text onto a handler name.
class IntentClassifier {
 public:
  virtual ~IntentClassifier() = default;

  virtual std::string Classify(const std::string& text) = 0;
};

struct SubtaskSpec {
  std::string title;
  std::string description;
};

// Splits a goal into ordered subtasks.
class GoalDecomposer {
 public:
  virtual ~GoalDecomposer() = default;

  virtual std::vector<SubtaskSpec> Decompose(const std::string& goal) = 0;
};

} // namespace taskpilot::dispatch
