#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/task.hpp"

namespace taskpilot::dispatch {

struct Interaction {
  std::string                 query;
  std::string                 handler;
  std::string                 response;
  bool                        ok = true;
  taskpilot::model::TimePoint timestamp{};
  std::optional<std::string>  task_id;
};

/*
  Bounded interaction history, most recent first. The oldest entry is
  dropped once the capacity is reached.
*/
class InteractionLog {
 public:
  explicit InteractionLog(std::size_t capacity);

  void Record(Interaction interaction);

  std::vector<Interaction> Recent(std::size_t limit) const;

  std::size_t Size() const;
  std::size_t Capacity() const {
    return capacity_;
  }

 private:
  const std::size_t       capacity_;
  mutable std::mutex      mutex_;
  std::deque<Interaction> entries_;
};

} // namespace taskpilot::dispatch
