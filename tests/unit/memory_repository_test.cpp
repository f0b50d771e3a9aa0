#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/time.hpp"

namespace {

using taskpilot::db::memory::MemoryRepository;
using taskpilot::model::Task;

Task MakeTask(const std::string& id) {
  Task task;
  task.id         = id;
  task.title      = "title " + id;
  task.series_id  = id;
  task.created_at = taskpilot::util::Now();
  task.updated_at = task.created_at;
  return task;
}

void TestReadOnlyCommitsNeverConflict() {
  MemoryRepository repo;

  auto reader = repo.Begin();
  assert(repo.ListTasks(*reader).empty());

  {
    auto writer = repo.Begin();
    assert(repo.InsertTask(*writer, MakeTask("a")));
    writer->Commit();
  }

  // The reader saw an older state but wrote nothing.
  reader->Commit();
  assert(reader->IsCommitted());

  // A second writer that began after the reader is unaffected by it.
  auto writer = repo.Begin();
  assert(repo.InsertTask(*writer, MakeTask("b")));
  writer->Commit();

  auto check = repo.Begin();
  assert(repo.ListTasks(*check).size() == 2);
  check->Commit();
}

void TestInterleavedWritersConflict() {
  MemoryRepository repo;

  auto first  = repo.Begin();
  auto second = repo.Begin();
  assert(repo.InsertTask(*first, MakeTask("first")));
  assert(repo.InsertTask(*second, MakeTask("second")));
  first->Commit();

  bool threw = false;
  try {
    second->Commit();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(!second->IsCommitted());

  auto check = repo.Begin();
  assert(repo.GetTask(*check, "first").has_value());
  assert(!repo.GetTask(*check, "second").has_value());
  check->Commit();
}

void TestFinishedTransactionRejectsReuse() {
  MemoryRepository repo;

  auto tx = repo.Begin();
  assert(repo.InsertTask(*tx, MakeTask("once")));
  tx->Commit();

  bool threw = false;
  try {
    tx->Commit();
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);

  auto rolled = repo.Begin();
  rolled->Rollback();
  threw = false;
  try {
    repo.InsertTask(*rolled, MakeTask("late"));
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestReadOnlyCommitsNeverConflict();
  TestInterleavedWritersConflict();
  TestFinishedTransactionRejectsReuse();

  std::cout << "taskpilot_unit_memory_repository: pass\n";
  return 0;
}
