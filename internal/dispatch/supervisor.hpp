#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/task_store.hpp"
#include "internal/dispatch/handler.hpp"
#include "internal/dispatch/handler_registry.hpp"
#include "internal/dispatch/interaction_log.hpp"
#include "internal/queue/work_queue.hpp"

namespace taskpilot::dispatch {

struct SupervisorOptions {
  std::string               default_handler      = "general_chat";
  std::uint32_t             max_acquire_attempts = 5;
  std::chrono::milliseconds acquire_backoff{500};
  // Zero disables the check. A call that overruns is reported as failed
  // once it returns; it is never interrupted.
  std::chrono::milliseconds handler_timeout{0};
  std::size_t               interaction_log_capacity = 50;
  // Interactions handed to each handler as context.
  std::size_t context_size = 5;
};

/*
  Supervisor

  Single consumer of the work queue. For every item it resolves a handler,
  moves the referenced task to in_progress, waits for the handler with
  bounded retries and runs the call on its own thread, so calls to
  different handlers overlap while each handler serves one call at a time.

  A handler that stays busy past the retry budget leaves its task blocked
  with a dispatch.blocked notification. The item is not re-queued;
  SubmitTask re-submits it.
*/
class Supervisor {
 public:
  using HandlerMap = std::map<std::string, std::shared_ptr<Handler>>;

  Supervisor(std::shared_ptr<taskpilot::core::TaskStore> store, std::shared_ptr<HandlerRegistry> registry,
             std::shared_ptr<taskpilot::queue::WorkQueue> queue, HandlerMap handlers, std::shared_ptr<IntentClassifier> classifier,
             std::shared_ptr<GoalDecomposer> decomposer, SupervisorOptions options);
  ~Supervisor();

  Supervisor(const Supervisor&)            = delete;
  Supervisor& operator=(const Supervisor&) = delete;

  void Start();

  // Stops the dispatcher, interrupts retry waits and joins in-flight calls.
  // Items still queued are dropped.
  void Stop();

  void Submit(taskpilot::queue::WorkItem item);

  // Queues an existing task under its assigned handler. False when the id
  // is unknown or the task is already completed or cancelled.
  bool SubmitTask(const std::string& id);

  // Creates a parent task for `goal` plus one child per subtask. Returns the
  // parent id. Children are not queued.
  std::string EnqueueComplexGoal(const std::string& goal);

  std::map<std::string, HandlerState> HandlerStates() const;
  std::vector<Interaction>            RecentInteractions(std::size_t limit) const;

  // Waits until every submitted item has been dispatched and every handler
  // call has returned. False on timeout.
  bool WaitIdle(std::chrono::milliseconds timeout);

  // One dispatch step on the calling thread. The handler call itself still
  // runs on a worker thread.
  void Process(taskpilot::queue::WorkItem item);

 private:
  void Run();

  std::string ResolveHandler(const taskpilot::queue::WorkItem& item);
  bool        SleepBackoff();
  void        Launch(std::function<void()> fn);
  void        ReapFinishedLocked();

  void Invoke(const std::string& handler, const taskpilot::queue::WorkItem& item, std::optional<taskpilot::model::Task> task,
              std::optional<taskpilot::model::TaskStatus> previous_status);

  void MarkBlocked(const std::string& task_id, const std::string& handler);
  void RestoreAfterFailure(const std::string& task_id, taskpilot::model::TaskStatus previous_status, const std::string& error);

  std::shared_ptr<taskpilot::core::TaskStore>  store_;
  std::shared_ptr<HandlerRegistry>             registry_;
  std::shared_ptr<taskpilot::queue::WorkQueue> queue_;
  HandlerMap                                   handlers_;
  std::shared_ptr<IntentClassifier>            classifier_;
  std::shared_ptr<GoalDecomposer>              decomposer_;
  SupervisorOptions                            options_;

  InteractionLog interactions_;

  std::thread dispatcher_;

  // Guards stopping_ for the retry wait.
  std::mutex              stop_mutex_;
  std::condition_variable stop_cv_;
  bool                    stopping_ = false;
  bool                    started_  = false;

  // Worker bookkeeping and the idle condition.
  std::mutex                        workers_mutex_;
  std::condition_variable           idle_cv_;
  std::map<std::uint64_t, std::thread> workers_;
  std::vector<std::uint64_t>        finished_;
  std::uint64_t                     next_worker_id_ = 0;
  std::size_t                       pending_        = 0;
  std::size_t                       in_flight_      = 0;
};

} // namespace taskpilot::dispatch
