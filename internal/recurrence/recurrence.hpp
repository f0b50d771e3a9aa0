#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "internal/model/task.hpp"

namespace taskpilot::recurrence {

/*
  Fixed-length periods: a month is 30 days and a year 365 days. Calendar
  arithmetic is intentionally not attempted.
*/
std::chrono::hours Period(const taskpilot::model::Recurrence& recurrence);

// Occurrence after the task's due date (creation time when it has none).
// Empty for non-recurring tasks.
std::optional<taskpilot::model::TimePoint> NextOccurrence(const taskpilot::model::Task& task);

// Occurrence following `occurrence` in the same series.
std::optional<taskpilot::model::TimePoint> Advance(const taskpilot::model::Recurrence& recurrence, taskpilot::model::TimePoint occurrence);

// True for completed recurring tasks whose next occurrence is at or before `now`.
bool IsDue(const taskpilot::model::Task& task, taskpilot::model::TimePoint now);

/*
  New pending instance for `occurrence`.

  Copies title, description, priority, handler, effort, tags and recurrence;
  milestones are reset. The instance joins the source's series.
*/
taskpilot::model::Task BuildInstance(const taskpilot::model::Task& source, taskpilot::model::TimePoint occurrence, std::string id,
                                     taskpilot::model::TimePoint now);

} // namespace taskpilot::recurrence
