#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace taskpilot::db::memory {

class MemoryTransaction;

/*
  Volatile repository used by tests and by `database: { memory: {} }`.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertTask(Transaction&, const taskpilot::model::Task&) override;
  std::optional<taskpilot::model::Task> GetTask(Transaction&, const std::string&) override;
  std::vector<taskpilot::model::Task> ListTasks(Transaction&) override;
  Result UpdateTask(Transaction&, const taskpilot::model::Task&) override;
  Result DeleteTask(Transaction&, const std::string&) override;
  Result DeleteAllTasks(Transaction&) override;
  Result AppendNotification(Transaction&, const std::string&, const taskpilot::model::Notification&) override;

  Result ClaimOccurrence(Transaction&, const model::OccurrenceRecord&) override;
  std::vector<model::OccurrenceRecord> ListOccurrences(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, taskpilot::model::Task> tasks;
    std::map<std::pair<std::string, int64_t>, model::OccurrenceRecord> occurrences;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
