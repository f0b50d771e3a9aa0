#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "work_item.hpp"

namespace taskpilot::queue {

/*
  Thread-safe blocking FIFO feeding the dispatcher.

  Many producers, one consumer. After Shutdown() the remaining items are
  still handed out; Dequeue returns empty once the queue is drained.
*/
class WorkQueue {
 public:
  void Enqueue(WorkItem item);

  // blocking wait
  std::optional<WorkItem> Dequeue();

  void Shutdown();

  std::size_t Size() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<WorkItem>    queue_;
  bool                    shutdown_ = false;
};

} // namespace taskpilot::queue
