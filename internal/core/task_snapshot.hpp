#pragma once

#include "internal/db/model/occurrence_record.hpp"
#include "internal/model/task.hpp"
#include "taskpilot/v1/task_snapshot.pb.h"

namespace taskpilot::core {

// Conversions between the in-memory model and the backup file format.
// FromRecord throws util::ValidationError on unknown enum names.

taskpilot::v1::TaskRecord ToRecord(const taskpilot::model::Task& task);
taskpilot::model::Task    FromRecord(const taskpilot::v1::TaskRecord& record);

taskpilot::v1::OccurrenceRecord          ToRecord(const taskpilot::db::model::OccurrenceRecord& occurrence);
taskpilot::db::model::OccurrenceRecord   FromRecord(const taskpilot::v1::OccurrenceRecord& record);

} // namespace taskpilot::core
