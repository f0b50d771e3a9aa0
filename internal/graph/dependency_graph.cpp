#include "internal/graph/dependency_graph.hpp"

#include <algorithm>
#include <unordered_set>

namespace taskpilot::graph {

using taskpilot::model::Task;
using taskpilot::model::TaskStatus;

DependencyGraph::DependencyGraph(const std::vector<Task>& tasks) {
  nodes_.reserve(tasks.size());
  for (const auto& task : tasks) {
    Node node;
    node.title  = task.title;
    node.status = task.status;
    node.dependencies.assign(task.dependencies.begin(), task.dependencies.end());
    nodes_.emplace(task.id, std::move(node));
  }
}

bool DependencyGraph::Contains(const std::string& id) const {
  return nodes_.contains(id);
}

std::string DependencyGraph::Describe(const std::string& id) const {
  auto it = nodes_.find(id);
  if (it == nodes_.end() || it->second.title.empty()) return id;
  return it->second.title;
}

void DependencyGraph::Visit(const std::string& id, std::unordered_map<std::string, Mark>& marks, std::vector<std::string>& path,
                            ValidationReport& report) const {
  marks[id] = Mark::kOnStack;
  path.push_back(id);

  const auto& node = nodes_.at(id);
  for (const auto& dep : node.dependencies) {
    if (!nodes_.contains(dep)) {
      report.ok = false;
      report.errors.push_back("missing dependency " + dep + " required by " + Describe(id));
      continue;
    }

    const auto mark = marks.contains(dep) ? marks[dep] : Mark::kUnvisited;
    if (mark == Mark::kDone) continue;

    if (mark == Mark::kOnStack) {
      std::string cycle;
      auto        start = std::find(path.begin(), path.end(), dep);
      for (auto it = start; it != path.end(); ++it) {
        cycle += Describe(*it) + " -> ";
      }
      cycle += Describe(dep);

      report.ok = false;
      report.errors.push_back("dependency cycle: " + cycle);
      continue;
    }

    Visit(dep, marks, path, report);
  }

  path.pop_back();
  marks[id] = Mark::kDone;
}

ValidationReport DependencyGraph::Validate(const std::string& id) const {
  ValidationReport report;
  if (!nodes_.contains(id)) {
    report.ok = false;
    report.errors.push_back("task not found: " + id);
    return report;
  }

  std::unordered_map<std::string, Mark> marks;
  std::vector<std::string>              path;
  Visit(id, marks, path, report);
  return report;
}

Readiness DependencyGraph::IsReady(const std::string& id) const {
  Readiness readiness;

  auto it = nodes_.find(id);
  if (it == nodes_.end()) {
    readiness.ready = false;
    return readiness;
  }

  for (const auto& dep : it->second.dependencies) {
    auto dep_it = nodes_.find(dep);
    if (dep_it == nodes_.end()) {
      readiness.blocking.push_back(dep + " (missing)");
      continue;
    }
    if (dep_it->second.status != TaskStatus::kCompleted) {
      readiness.blocking.push_back(dep_it->second.title + " (" + std::string(taskpilot::model::ToString(dep_it->second.status)) + ")");
    }
  }

  readiness.ready = readiness.blocking.empty();
  return readiness;
}

bool DependencyGraph::WouldCreateCycle(const std::string& id, const std::string& dependency_id) const {
  if (id == dependency_id) return true;

  // The new edge closes a cycle iff `id` is already reachable from `dependency_id`.
  std::unordered_set<std::string> visited;
  std::vector<std::string>        stack{dependency_id};

  while (!stack.empty()) {
    auto current = std::move(stack.back());
    stack.pop_back();

    if (current == id) return true;
    if (!visited.insert(current).second) continue;

    auto it = nodes_.find(current);
    if (it == nodes_.end()) continue;
    for (const auto& dep : it->second.dependencies) {
      if (!visited.contains(dep)) stack.push_back(dep);
    }
  }
  return false;
}

std::vector<std::string> DependencyGraph::Dependants(const std::string& id) const {
  std::vector<std::string> out;
  for (const auto& [node_id, node] : nodes_) {
    if (std::find(node.dependencies.begin(), node.dependencies.end(), id) != node.dependencies.end()) {
      out.push_back(node_id);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace taskpilot::graph
