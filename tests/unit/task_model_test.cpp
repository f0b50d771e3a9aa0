#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "internal/model/priority.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/model/task.hpp"
#include "internal/recurrence/recurrence.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using taskpilot::model::Priority;
using taskpilot::model::RecurrenceType;
using taskpilot::model::Task;
using taskpilot::model::TaskStatus;
using taskpilot::model::TimePoint;

TimePoint Day(const std::string& date) {
  auto parsed = taskpilot::util::ParseLocalDate(date);
  assert(parsed.has_value());
  return *parsed;
}

void TestStatusTransitions() {
  using taskpilot::model::CanTransition;

  assert(CanTransition(TaskStatus::kPending, TaskStatus::kInProgress));
  assert(CanTransition(TaskStatus::kInProgress, TaskStatus::kReview));
  assert(CanTransition(TaskStatus::kInProgress, TaskStatus::kPending));
  assert(CanTransition(TaskStatus::kBlocked, TaskStatus::kPending));
  assert(CanTransition(TaskStatus::kReview, TaskStatus::kInProgress));
  assert(CanTransition(TaskStatus::kOnHold, TaskStatus::kCompleted));
  assert(CanTransition(TaskStatus::kPending, TaskStatus::kCancelled));

  assert(!CanTransition(TaskStatus::kPending, TaskStatus::kReview));
  assert(!CanTransition(TaskStatus::kReview, TaskStatus::kBlocked));
  assert(!CanTransition(TaskStatus::kCompleted, TaskStatus::kPending));
  assert(!CanTransition(TaskStatus::kCancelled, TaskStatus::kInProgress));

  assert(CanTransition(TaskStatus::kCompleted, TaskStatus::kCompleted));
  assert(taskpilot::model::IsTerminal(TaskStatus::kCancelled));
  assert(!taskpilot::model::IsTerminal(TaskStatus::kBlocked));
}

void TestNamesParseBothWays() {
  assert(taskpilot::model::ParseTaskStatus("in_progress") == TaskStatus::kInProgress);
  assert(taskpilot::model::ToString(TaskStatus::kOnHold) == "on_hold");
  assert(taskpilot::model::ParsePriority("critical") == Priority::kCritical);
  assert(taskpilot::model::ParseRecurrenceType("monthly") == RecurrenceType::kMonthly);
  assert(taskpilot::model::ToString(taskpilot::model::NotificationLevel::kWarning) == "warning");

  bool threw = false;
  try {
    (void)taskpilot::model::ParsePriority("urgent");
  } catch (const taskpilot::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestNumericArgumentsRejectWrapAround() {
  using taskpilot::model::ParseProgress;
  using taskpilot::model::ParseRecurrenceInterval;

  const auto rejected = [](auto&& parse, const char* text) {
    try {
      (void)parse(text);
    } catch (const taskpilot::util::ValidationError&) {
      return true;
    }
    return false;
  };

  assert(ParseProgress("0") == 0);
  assert(ParseProgress("100") == 100);
  assert(rejected(ParseProgress, "101"));
  // 2^32 + 100 would narrow to 100 and complete the task.
  assert(rejected(ParseProgress, "4294967396"));
  assert(rejected(ParseProgress, "-1"));
  assert(rejected(ParseProgress, " 50"));
  assert(rejected(ParseProgress, "50%"));
  assert(rejected(ParseProgress, ""));

  assert(ParseRecurrenceInterval("3") == 3);
  assert(rejected(ParseRecurrenceInterval, "0"));
  assert(rejected(ParseRecurrenceInterval, "-2"));
  assert(rejected(ParseRecurrenceInterval, "99999999999"));
}

void TestDueBonusByCalendarDay() {
  using taskpilot::model::DueBonus;
  const auto now = Day("2026-03-10");

  assert(DueBonus(std::nullopt, now) == 0.0);
  assert(DueBonus(Day("2026-03-09"), now) == 3.0);
  assert(DueBonus(Day("2026-03-10"), now) == 2.0);
  // Earlier on the same day still counts as today, not overdue.
  assert(DueBonus(now - std::chrono::hours(3), now) == 2.0);
  assert(DueBonus(Day("2026-03-12"), now) == 1.5);
  assert(DueBonus(Day("2026-03-17"), now) == 1.0);
  assert(DueBonus(Day("2026-03-18"), now) == 0.0);
}

void TestDynamicPriorityScore() {
  const auto now = Day("2026-03-10");

  Task task;
  task.priority = Priority::kHigh;
  assert(taskpilot::model::ComputeDynamicPriority(task, now) == 2.0);

  task.due_date = Day("2026-03-10");
  task.subtasks = {"a", "b"};
  task.status   = TaskStatus::kInProgress;
  const double score = taskpilot::model::ComputeDynamicPriority(task, now);
  assert(score > 4.89 && score < 4.91);

  task.status   = TaskStatus::kBlocked;
  task.priority = Priority::kLow;
  task.subtasks.clear();
  task.due_date.reset();
  assert(taskpilot::model::ComputeDynamicPriority(task, now) == -1.0);
}

void TestRecurrencePeriods() {
  using taskpilot::model::Recurrence;
  using taskpilot::recurrence::Period;

  assert(Period(Recurrence{RecurrenceType::kDaily, 3}) == std::chrono::hours(72));
  assert(Period(Recurrence{RecurrenceType::kWeekly, 1}) == std::chrono::hours(24 * 7));
  assert(Period(Recurrence{RecurrenceType::kMonthly, 2}) == std::chrono::hours(24 * 60));
  assert(Period(Recurrence{RecurrenceType::kYearly, 1}) == std::chrono::hours(24 * 365));

  Task task;
  task.created_at = Day("2026-01-01");
  assert(!taskpilot::recurrence::NextOccurrence(task).has_value());

  task.recurrence = Recurrence{RecurrenceType::kWeekly, 1};
  assert(*taskpilot::recurrence::NextOccurrence(task) == task.created_at + std::chrono::hours(24 * 7));

  task.due_date = Day("2026-02-01");
  assert(*taskpilot::recurrence::NextOccurrence(task) == *task.due_date + std::chrono::hours(24 * 7));
}

void TestRecurrenceDueAndInstance() {
  const auto now = Day("2026-03-10");

  Task source;
  source.id               = "source";
  source.series_id        = "source";
  source.title            = "Water plants";
  source.priority         = Priority::kLow;
  source.assigned_handler = "smart_reminders";
  source.tags             = {"home"};
  source.milestones       = {{"front yard", true}};
  source.recurrence       = {RecurrenceType::kDaily, 1};
  source.status           = TaskStatus::kCompleted;
  source.progress         = 100;
  source.next_occurrence  = Day("2026-03-09");

  assert(taskpilot::recurrence::IsDue(source, now));

  source.status = TaskStatus::kInProgress;
  assert(!taskpilot::recurrence::IsDue(source, now));
  source.status = TaskStatus::kCompleted;
  assert(!taskpilot::recurrence::IsDue(source, Day("2026-03-08")));

  const auto instance = taskpilot::recurrence::BuildInstance(source, *source.next_occurrence, "instance", now);
  assert(instance.id == "instance");
  assert(instance.series_id == "source");
  assert(instance.title == "Water plants");
  assert(instance.status == TaskStatus::kPending);
  assert(instance.progress == 0);
  assert(instance.due_date == source.next_occurrence);
  assert(instance.assigned_handler == source.assigned_handler);
  assert(instance.tags == source.tags);
  assert(instance.milestones.size() == 1 && !instance.milestones[0].completed);
  assert(instance.notifications.empty());
  assert(*instance.next_occurrence == Day("2026-03-09") + std::chrono::hours(24));
}

} // namespace

int main() {
  TestStatusTransitions();
  TestNamesParseBothWays();
  TestNumericArgumentsRejectWrapAround();
  TestDueBonusByCalendarDay();
  TestDynamicPriorityScore();
  TestRecurrencePeriods();
  TestRecurrenceDueAndInstance();

  std::cout << "taskpilot_unit_task_model: pass\n";
  return 0;
}
