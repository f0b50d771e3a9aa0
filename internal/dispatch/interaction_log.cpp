#include "internal/dispatch/interaction_log.hpp"

#include <algorithm>
#include <stdexcept>

namespace taskpilot::dispatch {

InteractionLog::InteractionLog(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) throw std::invalid_argument("interaction log capacity must be positive");
}

void InteractionLog::Record(Interaction interaction) {
  std::lock_guard lock(mutex_);
  entries_.push_front(std::move(interaction));
  while (entries_.size() > capacity_) {
    entries_.pop_back();
  }
}

std::vector<Interaction> InteractionLog::Recent(std::size_t limit) const {
  std::lock_guard lock(mutex_);
  const auto      count = std::min(limit, entries_.size());
  return {entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(count)};
}

std::size_t InteractionLog::Size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

} // namespace taskpilot::dispatch
