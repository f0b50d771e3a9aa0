#include "internal/model/task.hpp"

#include <charconv>
#include <string>

#include "internal/util/errors.hpp"

namespace taskpilot::model {

std::string_view ToString(TaskStatus status) {
  switch (status) {
    case TaskStatus::kPending:
      return "pending";
    case TaskStatus::kInProgress:
      return "in_progress";
    case TaskStatus::kCompleted:
      return "completed";
    case TaskStatus::kBlocked:
      return "blocked";
    case TaskStatus::kOnHold:
      return "on_hold";
    case TaskStatus::kCancelled:
      return "cancelled";
    case TaskStatus::kReview:
      return "review";
  }
  return "unknown";
}

std::string_view ToString(Priority priority) {
  switch (priority) {
    case Priority::kCritical:
      return "critical";
    case Priority::kHigh:
      return "high";
    case Priority::kMedium:
      return "medium";
    case Priority::kLow:
      return "low";
  }
  return "unknown";
}

std::string_view ToString(RecurrenceType type) {
  switch (type) {
    case RecurrenceType::kNone:
      return "none";
    case RecurrenceType::kDaily:
      return "daily";
    case RecurrenceType::kWeekly:
      return "weekly";
    case RecurrenceType::kMonthly:
      return "monthly";
    case RecurrenceType::kYearly:
      return "yearly";
  }
  return "unknown";
}

std::string_view ToString(NotificationLevel level) {
  switch (level) {
    case NotificationLevel::kInfo:
      return "info";
    case NotificationLevel::kWarning:
      return "warning";
    case NotificationLevel::kCritical:
      return "critical";
  }
  return "unknown";
}

TaskStatus ParseTaskStatus(std::string_view name) {
  if (name == "pending") return TaskStatus::kPending;
  if (name == "in_progress") return TaskStatus::kInProgress;
  if (name == "completed") return TaskStatus::kCompleted;
  if (name == "blocked") return TaskStatus::kBlocked;
  if (name == "on_hold") return TaskStatus::kOnHold;
  if (name == "cancelled") return TaskStatus::kCancelled;
  if (name == "review") return TaskStatus::kReview;
  throw util::ValidationError("unknown task status: " + std::string(name));
}

Priority ParsePriority(std::string_view name) {
  if (name == "critical") return Priority::kCritical;
  if (name == "high") return Priority::kHigh;
  if (name == "medium") return Priority::kMedium;
  if (name == "low") return Priority::kLow;
  throw util::ValidationError("unknown priority: " + std::string(name));
}

RecurrenceType ParseRecurrenceType(std::string_view name) {
  if (name == "none") return RecurrenceType::kNone;
  if (name == "daily") return RecurrenceType::kDaily;
  if (name == "weekly") return RecurrenceType::kWeekly;
  if (name == "monthly") return RecurrenceType::kMonthly;
  if (name == "yearly") return RecurrenceType::kYearly;
  throw util::ValidationError("unknown recurrence type: " + std::string(name));
}

NotificationLevel ParseNotificationLevel(std::string_view name) {
  if (name == "info") return NotificationLevel::kInfo;
  if (name == "warning") return NotificationLevel::kWarning;
  if (name == "critical") return NotificationLevel::kCritical;
  throw util::ValidationError("unknown notification level: " + std::string(name));
}

namespace {

std::optional<std::uint32_t> ParseDecimal(std::string_view text) {
  std::uint32_t value = 0;
  const auto* end     = text.data() + text.size();
  const auto  result  = std::from_chars(text.data(), end, value);
  if (text.empty() || result.ec != std::errc() || result.ptr != end) return std::nullopt;
  return value;
}

} // namespace

std::uint32_t ParseProgress(std::string_view text) {
  const auto value = ParseDecimal(text);
  if (!value || *value > 100) throw util::ValidationError("progress must be an integer within 0..100, got '" + std::string(text) + "'");
  return *value;
}

std::uint32_t ParseRecurrenceInterval(std::string_view text) {
  const auto value = ParseDecimal(text);
  if (!value || *value == 0) throw util::ValidationError("recurrence interval must be a positive integer, got '" + std::string(text) + "'");
  return *value;
}

} // namespace taskpilot::model
