#pragma once

#include <cstdint>
#include <string>

namespace taskpilot::db::model {

/*
  Ledger row claiming one occurrence of a recurrence series.

  (series_id, occurrence_ms) is unique: a second claim for the same
  occurrence fails with AlreadyExists, which is what keeps materialization
  idempotent.
*/
struct OccurrenceRecord {
  std::string series_id;
  int64_t     occurrence_ms = 0;

  std::string materialized_task_id;
  int64_t     created_at_ms = 0;
};

} // namespace taskpilot::db::model
