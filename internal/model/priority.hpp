#pragma once

#include "internal/model/task.hpp"

namespace taskpilot::model {

/*
  Dynamic priority score.

    base            = 3 - rank(priority)           critical=3 .. low=0
    dueBonus        = overdue 3 | today 2 | <=2 days 1.5 | <=7 days 1 | else 0
    dependencyBonus = 0.2 * |subtasks|
    statusAdj       = blocked -1 | in_progress +0.5 | else 0

  Due proximity is measured in local calendar days relative to `now`.
  The score is not clamped; sort descending for most urgent first.
*/

double DueBonus(const std::optional<TimePoint>& due_date, TimePoint now);

double ComputeDynamicPriority(const Task& task, TimePoint now);

} // namespace taskpilot::model
