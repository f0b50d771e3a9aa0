#include "internal/dispatch/handler_registry.hpp"

#include <stdexcept>

namespace taskpilot::dispatch {

std::string_view ToString(HandlerState state) {
  return state == HandlerState::kBusy ? "busy" : "idle";
}

HandlerRegistry::HandlerRegistry(const std::vector<std::string>& names) {
  for (const auto& name : names) {
    if (name.empty()) throw std::invalid_argument("handler name must not be empty");
    busy_.emplace(name, false);
  }
}

bool HandlerRegistry::Contains(const std::string& name) const {
  std::lock_guard lock(mutex_);
  return busy_.contains(name);
}

bool HandlerRegistry::TryAcquire(const std::string& name) {
  std::lock_guard lock(mutex_);

  auto it = busy_.find(name);
  if (it == busy_.end() || it->second) return false;

  it->second = true;
  return true;
}

void HandlerRegistry::Release(const std::string& name) {
  std::lock_guard lock(mutex_);

  auto it = busy_.find(name);
  if (it == busy_.end()) return;
  it->second = false;
}

std::map<std::string, HandlerState> HandlerRegistry::Snapshot() const {
  std::lock_guard lock(mutex_);

  std::map<std::string, HandlerState> out;
  for (const auto& [name, busy] : busy_) {
    out.emplace(name, busy ? HandlerState::kBusy : HandlerState::kIdle);
  }
  return out;
}

std::vector<std::string> HandlerRegistry::Names() const {
  std::lock_guard lock(mutex_);

  std::vector<std::string> out;
  out.reserve(busy_.size());
  for (const auto& [name, busy] : busy_) {
    out.push_back(name);
  }
  return out;
}

} // namespace taskpilot::dispatch
