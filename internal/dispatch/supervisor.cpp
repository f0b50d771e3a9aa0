#include "internal/dispatch/supervisor.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace taskpilot::dispatch {

using taskpilot::model::Notification;
using taskpilot::model::NotificationLevel;
using taskpilot::model::Task;
using taskpilot::model::TaskStatus;
using taskpilot::observability::IntField;
using taskpilot::observability::StringField;
using taskpilot::queue::WorkItem;

namespace {

constexpr std::size_t kMinSubtasks = 3;
constexpr std::size_t kMaxSubtasks = 7;

bool IsBlank(const std::string& text) {
  return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::vector<SubtaskSpec> FallbackPlan(const std::string& goal) {
  return {{"Research " + goal, "Gather what is needed for: " + goal},
          {"Plan " + goal, "Break the work down and schedule it"},
          {"Execute " + goal, "Carry out the plan"}};
}

} // namespace

Supervisor::Supervisor(std::shared_ptr<taskpilot::core::TaskStore> store, std::shared_ptr<HandlerRegistry> registry,
                       std::shared_ptr<taskpilot::queue::WorkQueue> queue, HandlerMap handlers, std::shared_ptr<IntentClassifier> classifier,
                       std::shared_ptr<GoalDecomposer> decomposer, SupervisorOptions options)
    : store_(std::move(store)),
      registry_(std::move(registry)),
      queue_(std::move(queue)),
      handlers_(std::move(handlers)),
      classifier_(std::move(classifier)),
      decomposer_(std::move(decomposer)),
      options_(std::move(options)),
      interactions_(options_.interaction_log_capacity) {
  if (!store_ || !registry_ || !queue_) throw std::invalid_argument("supervisor requires a task store, a handler registry and a queue");
  if (!registry_->Contains(options_.default_handler)) {
    throw std::invalid_argument("default handler is not registered: " + options_.default_handler);
  }
  if (options_.max_acquire_attempts == 0) options_.max_acquire_attempts = 1;
}

Supervisor::~Supervisor() {
  Stop();
}

void Supervisor::Start() {
  if (started_) return;
  started_    = true;
  dispatcher_ = std::thread(&Supervisor::Run, this);

  TASKPILOT_LOG_INFO("Supervisor started", {IntField("handlers", static_cast<int64_t>(registry_->Names().size())),
                                            StringField("default_handler", options_.default_handler)});
}

void Supervisor::Stop() {
  {
    std::lock_guard lock(stop_mutex_);
    if (stopping_) return;
    stopping_ = true;
  }
  stop_cv_.notify_all();
  queue_->Shutdown();

  if (dispatcher_.joinable()) dispatcher_.join();

  std::map<std::uint64_t, std::thread> workers;
  {
    std::lock_guard lock(workers_mutex_);
    workers.swap(workers_);
    finished_.clear();
    pending_ = 0;
  }
  for (auto& [id, worker] : workers) {
    if (worker.joinable()) worker.join();
  }
  idle_cv_.notify_all();

  if (started_) TASKPILOT_LOG_INFO("Supervisor stopped");
}

void Supervisor::Submit(WorkItem item) {
  {
    std::lock_guard lock(workers_mutex_);
    ++pending_;
  }
  queue_->Enqueue(std::move(item));
}

bool Supervisor::SubmitTask(const std::string& id) {
  const auto task = store_->Get(id);
  if (!task || model::IsTerminal(task->status)) return false;

  WorkItem item;
  item.task_id          = task->id;
  item.query            = task->title;
  item.assigned_handler = task->assigned_handler;
  Submit(std::move(item));
  return true;
}

std::string Supervisor::EnqueueComplexGoal(const std::string& goal) {
  std::vector<SubtaskSpec> specs;
  if (decomposer_) {
    try {
      specs = decomposer_->Decompose(goal);
    } catch (const std::exception& e) {
      TASKPILOT_LOG_WARN("Goal decomposition failed, using fallback plan", {StringField("error", e.what())});
      specs.clear();
    }
  }

  std::erase_if(specs, [](const SubtaskSpec& spec) { return IsBlank(spec.title); });
  if (specs.size() < kMinSubtasks) specs = FallbackPlan(goal);
  if (specs.size() > kMaxSubtasks) specs.resize(kMaxSubtasks);

  Task parent;
  parent.title       = goal;
  parent.description = "Complex goal";
  parent.status      = TaskStatus::kInProgress;
  const auto parent_id = store_->Create(parent);

  for (const auto& spec : specs) {
    Task child;
    child.title       = spec.title;
    child.description = spec.description;
    child.parent_id   = parent_id;
    store_->Create(child);
  }

  TASKPILOT_LOG_INFO("Complex goal planned", {StringField("id", parent_id), IntField("subtasks", static_cast<int64_t>(specs.size()))});
  return parent_id;
}

std::map<std::string, HandlerState> Supervisor::HandlerStates() const {
  return registry_->Snapshot();
}

std::vector<Interaction> Supervisor::RecentInteractions(std::size_t limit) const {
  return interactions_.Recent(limit);
}

bool Supervisor::WaitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock lock(workers_mutex_);
  return idle_cv_.wait_for(lock, timeout, [&] { return pending_ == 0 && in_flight_ == 0; });
}

void Supervisor::Run() {
  while (auto item = queue_->Dequeue()) {
    {
      std::lock_guard lock(stop_mutex_);
      if (stopping_) break;
    }

    try {
      Process(std::move(*item));
    } catch (const std::exception& e) {
      TASKPILOT_LOG_ERROR("Dispatch failed", {StringField("error", e.what())});
    }

    {
      std::lock_guard lock(workers_mutex_);
      if (pending_ > 0) --pending_;
    }
    idle_cv_.notify_all();
  }
}

std::string Supervisor::ResolveHandler(const WorkItem& item) {
  if (item.assigned_handler && !item.assigned_handler->empty()) {
    if (registry_->Contains(*item.assigned_handler)) return *item.assigned_handler;
    TASKPILOT_LOG_WARN("Unknown assigned handler, using default",
                       {StringField("handler", *item.assigned_handler), StringField("default", options_.default_handler)});
    return options_.default_handler;
  }

  if (classifier_) {
    try {
      auto name = classifier_->Classify(item.query);
      if (registry_->Contains(name)) return name;
      TASKPILOT_LOG_WARN("Classifier returned unknown handler, using default",
                         {StringField("handler", name), StringField("default", options_.default_handler)});
    } catch (const std::exception& e) {
      TASKPILOT_LOG_WARN("Classifier failed, using default", {StringField("error", e.what()), StringField("default", options_.default_handler)});
    }
  }
  return options_.default_handler;
}

bool Supervisor::SleepBackoff() {
  std::unique_lock lock(stop_mutex_);
  return !stop_cv_.wait_for(lock, options_.acquire_backoff, [&] { return stopping_; });
}

void Supervisor::Launch(std::function<void()> fn) {
  std::lock_guard lock(workers_mutex_);
  ReapFinishedLocked();

  const auto id = next_worker_id_++;
  workers_.emplace(id, std::thread([this, id, fn = std::move(fn)]() mutable {
    fn();
    // Drop captures (and the handler lease) before reporting idle.
    fn = nullptr;
    {
      std::lock_guard done_lock(workers_mutex_);
      finished_.push_back(id);
      --in_flight_;
    }
    idle_cv_.notify_all();
  }));
  ++in_flight_;
}

void Supervisor::ReapFinishedLocked() {
  for (const auto id : finished_) {
    auto it = workers_.find(id);
    if (it == workers_.end()) continue;
    if (it->second.joinable()) it->second.join();
    workers_.erase(it);
  }
  finished_.clear();
}

void Supervisor::Process(WorkItem item) {
  const auto handler = ResolveHandler(item);

  std::optional<Task>       task;
  std::optional<TaskStatus> previous_status;
  if (item.task_id) {
    try {
      task = store_->Get(*item.task_id);
      if (!task) {
        TASKPILOT_LOG_WARN("Dropping work item for unknown task", {StringField("task_id", *item.task_id)});
        return;
      }
      if (model::IsTerminal(task->status)) {
        TASKPILOT_LOG_WARN("Dropping work item for finished task",
                           {StringField("task_id", task->id), StringField("status", std::string(model::ToString(task->status)))});
        return;
      }

      previous_status = task->status;
      core::TaskPatch patch;
      patch.status = TaskStatus::kInProgress;
      if (!store_->Update(task->id, patch)) {
        TASKPILOT_LOG_WARN("Dropping work item, task removed before dispatch", {StringField("task_id", task->id)});
        return;
      }
      task->status = TaskStatus::kInProgress;
    } catch (const std::exception& e) {
      TASKPILOT_LOG_ERROR("Dropping work item, task could not be started", {StringField("task_id", *item.task_id), StringField("error", e.what())});
      return;
    }
    if (item.query.empty()) item.query = task->title;
  }

  bool acquired = false;
  for (std::uint32_t attempt = 1; attempt <= options_.max_acquire_attempts; ++attempt) {
    if (registry_->TryAcquire(handler)) {
      acquired = true;
      break;
    }
    if (attempt == options_.max_acquire_attempts) break;

    TASKPILOT_LOG_INFO("Handler busy, retrying", {StringField("handler", handler), IntField("attempt", attempt)});
    if (!SleepBackoff()) {
      TASKPILOT_LOG_WARN("Dispatch interrupted by shutdown", {StringField("handler", handler)});
      if (task) {
        try {
          core::TaskPatch patch;
          patch.status = *previous_status;
          if (!store_->Update(task->id, patch)) {
            TASKPILOT_LOG_WARN("Task removed while waiting for its handler", {StringField("task_id", task->id)});
          }
        } catch (const std::exception& e) {
          TASKPILOT_LOG_ERROR("Could not restore task status", {StringField("task_id", task->id), StringField("error", e.what())});
        }
      }
      return;
    }
  }

  if (!acquired) {
    TASKPILOT_LOG_WARN("Handler stayed busy, abandoning work item",
                       {StringField("handler", handler), IntField("attempts", options_.max_acquire_attempts)});
    if (task) MarkBlocked(task->id, handler);

    Interaction interaction;
    interaction.query     = item.query;
    interaction.handler   = handler;
    interaction.response  = "handler busy";
    interaction.ok        = false;
    interaction.timestamp = util::Now();
    interaction.task_id   = item.task_id;
    interactions_.Record(std::move(interaction));
    return;
  }

  // The worker owns the lease; the handler is released when the call returns.
  auto lease = std::make_shared<HandlerLease>(*registry_, handler);
  try {
    Launch([this, lease, handler, item, task, previous_status] { Invoke(handler, item, task, previous_status); });
  } catch (const std::system_error& e) {
    TASKPILOT_LOG_ERROR("Could not start handler thread", {StringField("handler", handler), StringField("error", e.what())});
    if (task) RestoreAfterFailure(task->id, *previous_status, e.what());
  }
}

void Supervisor::Invoke(const std::string& handler, const WorkItem& item, std::optional<Task> task, std::optional<TaskStatus> previous_status) {
  HandlerRequest request;
  request.query   = item.query;
  request.task    = task;
  request.context = interactions_.Recent(options_.context_size);

  HandlerResult result;
  std::string   error;
  const auto    started = std::chrono::steady_clock::now();

  auto it = handlers_.find(handler);
  if (it == handlers_.end() || !it->second) {
    error = "no handler bound to " + handler;
  } else {
    try {
      result = it->second->Handle(request);
      if (!result.ok) error = result.text.empty() ? "handler reported failure" : result.text;
    } catch (const std::exception& e) {
      error = e.what();
    }
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  if (error.empty() && options_.handler_timeout.count() > 0 && elapsed > options_.handler_timeout) {
    error = "handler exceeded timeout of " + std::to_string(options_.handler_timeout.count()) + "ms";
  }
  const bool ok = error.empty();

  if (task) {
    if (ok) {
      try {
        core::TaskPatch patch;
        patch.status   = TaskStatus::kCompleted;
        patch.progress = 100;
        if (!store_->Update(task->id, patch)) {
          TASKPILOT_LOG_WARN("Task removed while its handler ran", {StringField("task_id", task->id)});
        }
      } catch (const std::exception& e) {
        TASKPILOT_LOG_WARN("Could not complete task", {StringField("task_id", task->id), StringField("error", e.what())});
      }
    } else {
      RestoreAfterFailure(task->id, *previous_status, error);
    }
  }

  Interaction interaction;
  interaction.query     = item.query;
  interaction.handler   = handler;
  interaction.response  = ok ? result.text : error;
  interaction.ok        = ok;
  interaction.timestamp = util::Now();
  interaction.task_id   = item.task_id;
  interactions_.Record(std::move(interaction));

  if (ok) {
    TASKPILOT_LOG_INFO("Dispatch finished", {StringField("handler", handler), IntField("elapsed_ms", elapsed.count())});
  } else {
    TASKPILOT_LOG_WARN("Dispatch failed", {StringField("handler", handler), StringField("error", error), IntField("elapsed_ms", elapsed.count())});
  }
}

void Supervisor::MarkBlocked(const std::string& task_id, const std::string& handler) {
  try {
    core::TaskPatch patch;
    patch.status = TaskStatus::kBlocked;
    if (!store_->Update(task_id, patch)) {
      TASKPILOT_LOG_WARN("Task removed while waiting for its handler", {StringField("task_id", task_id)});
      return;
    }

    Notification notification;
    notification.message = "Handler " + handler + " stayed busy after " + std::to_string(options_.max_acquire_attempts) +
                           " attempts; re-submit the task to retry";
    notification.level     = NotificationLevel::kWarning;
    notification.kind      = "dispatch.blocked";
    notification.timestamp = util::Now();
    if (!store_->AppendNotification(task_id, notification)) {
      TASKPILOT_LOG_WARN("Task removed before it could be flagged", {StringField("task_id", task_id)});
    }
  } catch (const std::exception& e) {
    TASKPILOT_LOG_ERROR("Could not mark task blocked", {StringField("task_id", task_id), StringField("error", e.what())});
  }
}

void Supervisor::RestoreAfterFailure(const std::string& task_id, TaskStatus previous_status, const std::string& error) {
  try {
    core::TaskPatch patch;
    patch.status = previous_status;
    if (!store_->Update(task_id, patch)) {
      TASKPILOT_LOG_WARN("Task removed while its handler ran", {StringField("task_id", task_id)});
      return;
    }

    Notification notification;
    notification.message   = "Dispatch failed: " + error;
    notification.level     = NotificationLevel::kWarning;
    notification.kind      = "dispatch.failed";
    notification.timestamp = util::Now();
    if (!store_->AppendNotification(task_id, notification)) {
      TASKPILOT_LOG_WARN("Task removed before it could be flagged", {StringField("task_id", task_id)});
    }
  } catch (const std::exception& e) {
    TASKPILOT_LOG_ERROR("Could not restore task after failed dispatch", {StringField("task_id", task_id), StringField("error", e.what())});
  }
}

} // namespace taskpilot::dispatch
