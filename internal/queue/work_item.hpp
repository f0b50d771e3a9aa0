#pragma once

#include <optional>
#include <string>

namespace taskpilot::queue {

// One dispatch request. Ephemeral: never persisted.
struct WorkItem {
  std::optional<std::string> task_id;
  std::string                query;
  std::optional<std::string> assigned_handler;
};

} // namespace taskpilot::queue
