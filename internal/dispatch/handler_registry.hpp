#pragma once

#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace taskpilot::dispatch {

enum class HandlerState { kIdle, kBusy };

std::string_view ToString(HandlerState state);

/*
  Fixed set of handler names with an idle/busy flag each.

  TryAcquire is the one check-and-set that decides which dispatch may talk
  to a handler; at most one caller holds a handler at a time.
*/
class HandlerRegistry {
 public:
  explicit HandlerRegistry(const std::vector<std::string>& names);

  bool Contains(const std::string& name) const;

  // False when the handler is busy or unknown.
  bool TryAcquire(const std::string& name);

  void Release(const std::string& name);

  std::map<std::string, HandlerState> Snapshot() const;

  std::vector<std::string> Names() const;

 private:
  mutable std::mutex          mutex_;
  std::map<std::string, bool> busy_;
};

/*
  Owns one acquisition and releases it on destruction. Adopts a handler
  already acquired through TryAcquire.
*/
class HandlerLease {
 public:
  HandlerLease(HandlerRegistry& registry, std::string name) : registry_(&registry), name_(std::move(name)) {
  }
  ~HandlerLease() {
    if (registry_) registry_->Release(name_);
  }

  HandlerLease(const HandlerLease&)            = delete;
  HandlerLease& operator=(const HandlerLease&) = delete;

  HandlerLease(HandlerLease&& other) noexcept : registry_(other.registry_), name_(std::move(other.name_)) {
    other.registry_ = nullptr;
  }
  HandlerLease& operator=(HandlerLease&&) = delete;

  const std::string& name() const {
    return name_;
  }

 private:
  HandlerRegistry* registry_;
  std::string      name_;
};

} // namespace taskpilot::dispatch
