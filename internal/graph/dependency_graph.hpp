#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/task.hpp"

namespace taskpilot::graph {

struct ValidationReport {
  bool                     ok = true;
  std::vector<std::string> errors;
};

struct Readiness {
  bool ready = true;
  // "<title> (<status>)" for every dependency that is not completed.
  std::vector<std::string> blocking;
};

/*
  Read-only view over the dependency edges of a task set.

  Built from a snapshot taken inside a store transaction, so the answers are
  consistent with that transaction. Edges point from a task to the tasks it
  waits on.
*/
class DependencyGraph {
 public:
  explicit DependencyGraph(const std::vector<taskpilot::model::Task>& tasks);

  bool Contains(const std::string& id) const;

  // Walks everything reachable from `id`. A node revisited while still on
  // the DFS stack is a cycle; a node finished earlier is a shared (diamond)
  // dependency and is fine. Dangling ids are reported too.
  ValidationReport Validate(const std::string& id) const;

  Readiness IsReady(const std::string& id) const;

  // True when adding the edge id -> dependency_id would close a cycle,
  // including the self edge.
  bool WouldCreateCycle(const std::string& id, const std::string& dependency_id) const;

  // Tasks that list `id` as a dependency.
  std::vector<std::string> Dependants(const std::string& id) const;

 private:
  struct Node {
    std::string                title;
    taskpilot::model::TaskStatus status = taskpilot::model::TaskStatus::kPending;
    std::vector<std::string>   dependencies;
  };

  enum class Mark { kUnvisited, kOnStack, kDone };

  void Visit(const std::string& id, std::unordered_map<std::string, Mark>& marks, std::vector<std::string>& path,
             ValidationReport& report) const;

  std::string Describe(const std::string& id) const;

  std::unordered_map<std::string, Node> nodes_;
};

} // namespace taskpilot::graph
