#pragma once

#include "internal/model/task.hpp"

namespace taskpilot::model {

constexpr bool IsTerminal(TaskStatus status) {
  return status == TaskStatus::kCompleted || status == TaskStatus::kCancelled;
}

/*
  Task status transitions.

    pending     -> in_progress | blocked | on_hold
    in_progress -> blocked | on_hold | review | pending (restore after a failed dispatch)
    blocked     -> pending | in_progress (manual re-submission)
    on_hold     -> in_progress | pending
    review      -> in_progress

  Any non-terminal state may be completed or cancelled directly.
  Terminal states only accept a same-state write.
*/
constexpr bool CanTransition(TaskStatus from, TaskStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == TaskStatus::kCompleted || to == TaskStatus::kCancelled) {
    return true;
  }

  switch (from) {
    case TaskStatus::kPending:
      return to == TaskStatus::kInProgress || to == TaskStatus::kBlocked || to == TaskStatus::kOnHold;
    case TaskStatus::kInProgress:
      return to == TaskStatus::kBlocked || to == TaskStatus::kOnHold || to == TaskStatus::kReview || to == TaskStatus::kPending;
    case TaskStatus::kBlocked:
      return to == TaskStatus::kPending || to == TaskStatus::kInProgress;
    case TaskStatus::kOnHold:
      return to == TaskStatus::kInProgress || to == TaskStatus::kPending;
    case TaskStatus::kReview:
      return to == TaskStatus::kInProgress;
    default:
      return false;
  }
}

} // namespace taskpilot::model
