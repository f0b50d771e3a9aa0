#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace taskpilot::model {

using TimePoint = std::chrono::system_clock::time_point;

enum class TaskStatus : std::uint8_t {
  kPending    = 0,
  kInProgress = 1,
  kCompleted  = 2,
  kBlocked    = 3,
  kOnHold     = 4,
  kCancelled  = 5,
  kReview     = 6,
};

// Rank order: critical is the most urgent.
enum class Priority : std::uint8_t {
  kCritical = 0,
  kHigh     = 1,
  kMedium   = 2,
  kLow      = 3,
};

enum class RecurrenceType : std::uint8_t {
  kNone    = 0,
  kDaily   = 1,
  kWeekly  = 2,
  kMonthly = 3,
  kYearly  = 4,
};

enum class NotificationLevel : std::uint8_t {
  kInfo     = 0,
  kWarning  = 1,
  kCritical = 2,
};

struct Recurrence {
  RecurrenceType type     = RecurrenceType::kNone;
  std::uint32_t  interval = 1;
};

struct Notification {
  std::string       message;
  NotificationLevel level = NotificationLevel::kInfo;
  // Machine key ("deadline.today", "dispatch.failed", ...) used to dedup sweeps.
  std::string kind;
  TimePoint   timestamp{};
};

struct Milestone {
  std::string title;
  bool        completed = false;
};

struct Task {
  std::string id;
  std::string title;
  std::string description;

  TaskStatus status   = TaskStatus::kPending;
  Priority   priority = Priority::kMedium;
  double     dynamic_priority_score = 0.0;

  std::optional<TimePoint> due_date;

  std::set<std::string>      dependencies;
  std::set<std::string>      subtasks;
  std::optional<std::string> parent_id;
  std::optional<std::string> assigned_handler;

  std::uint32_t progress = 0;

  Recurrence               recurrence;
  std::optional<TimePoint> next_occurrence;
  std::string              series_id;

  std::optional<double>  estimated_hours;
  std::set<std::string>  tags;
  std::vector<Milestone> milestones;

  TimePoint created_at{};
  TimePoint updated_at{};
  // Last content change. Notifications and score refreshes leave it alone.
  TimePoint last_activity_at{};

  std::vector<Notification> notifications;
};

std::string_view ToString(TaskStatus status);
std::string_view ToString(Priority priority);
std::string_view ToString(RecurrenceType type);
std::string_view ToString(NotificationLevel level);

// Parsers throw util::ValidationError on unknown names.
TaskStatus        ParseTaskStatus(std::string_view name);
Priority          ParsePriority(std::string_view name);
RecurrenceType    ParseRecurrenceType(std::string_view name);
NotificationLevel ParseNotificationLevel(std::string_view name);

// Decimal text only: no sign, no whitespace, nothing that would wrap.
std::uint32_t ParseProgress(std::string_view text);
std::uint32_t ParseRecurrenceInterval(std::string_view text);

} // namespace taskpilot::model
