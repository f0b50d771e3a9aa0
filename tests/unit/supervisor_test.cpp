#include "internal/dispatch/supervisor.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"

namespace {

using namespace std::chrono_literals;

using taskpilot::core::TaskFilter;
using taskpilot::core::TaskPatch;
using taskpilot::core::TaskStore;
using taskpilot::dispatch::GoalDecomposer;
using taskpilot::dispatch::Handler;
using taskpilot::dispatch::HandlerRegistry;
using taskpilot::dispatch::HandlerRequest;
using taskpilot::dispatch::HandlerResult;
using taskpilot::dispatch::HandlerState;
using taskpilot::dispatch::IntentClassifier;
using taskpilot::dispatch::SubtaskSpec;
using taskpilot::dispatch::Supervisor;
using taskpilot::dispatch::SupervisorOptions;
using taskpilot::model::Task;
using taskpilot::model::TaskStatus;
using taskpilot::queue::WorkItem;
using taskpilot::queue::WorkQueue;

class EchoHandler final : public Handler {
 public:
  explicit EchoHandler(std::string name) : name_(std::move(name)) {
  }

  HandlerResult Handle(const HandlerRequest& request) override {
    {
      std::lock_guard lock(mutex_);
      last_context_size_ = request.context.size();
      if (!request.context.empty()) last_context_head_ = request.context.front().query;
      ++calls_;
    }
    return {true, name_ + ": " + request.query};
  }

  std::size_t last_context_size() const {
    std::lock_guard lock(mutex_);
    return last_context_size_;
  }
  std::string last_context_head() const {
    std::lock_guard lock(mutex_);
    return last_context_head_;
  }
  int calls() const {
    std::lock_guard lock(mutex_);
    return calls_;
  }

 private:
  std::string        name_;
  mutable std::mutex mutex_;
  std::size_t        last_context_size_ = 0;
  std::string        last_context_head_;
  int                calls_ = 0;
};

class ThrowingHandler final : public Handler {
 public:
  HandlerResult Handle(const HandlerRequest&) override {
    throw std::runtime_error("upstream unavailable");
  }
};

class SlowHandler final : public Handler {
 public:
  explicit SlowHandler(std::chrono::milliseconds delay) : delay_(delay) {
  }

  HandlerResult Handle(const HandlerRequest&) override {
    std::this_thread::sleep_for(delay_);
    return {true, "late answer"};
  }

 private:
  std::chrono::milliseconds delay_;
};

// One side signals, the other waits for the signal while holding its handler.
struct Rendezvous {
  std::mutex              mutex;
  std::condition_variable cv;
  bool                    signalled = false;

  void Signal() {
    {
      std::lock_guard lock(mutex);
      signalled = true;
    }
    cv.notify_all();
  }

  bool Wait(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex);
    return cv.wait_for(lock, timeout, [&] { return signalled; });
  }
};

class WaitingHandler final : public Handler {
 public:
  explicit WaitingHandler(std::shared_ptr<Rendezvous> rendezvous) : rendezvous_(std::move(rendezvous)) {
  }

  HandlerResult Handle(const HandlerRequest&) override {
    if (!rendezvous_->Wait(2s)) return {false, "peer never ran"};
    return {true, "peer ran concurrently"};
  }

 private:
  std::shared_ptr<Rendezvous> rendezvous_;
};

class SignallingHandler final : public Handler {
 public:
  explicit SignallingHandler(std::shared_ptr<Rendezvous> rendezvous) : rendezvous_(std::move(rendezvous)) {
  }

  HandlerResult Handle(const HandlerRequest&) override {
    rendezvous_->Signal();
    return {true, "signalled"};
  }

 private:
  std::shared_ptr<Rendezvous> rendezvous_;
};

// Announces that it started, then works for `delay` before answering.
class LingeringHandler final : public Handler {
 public:
  LingeringHandler(std::shared_ptr<Rendezvous> started, std::chrono::milliseconds delay) : started_(std::move(started)), delay_(delay) {
  }

  HandlerResult Handle(const HandlerRequest&) override {
    started_->Signal();
    std::this_thread::sleep_for(delay_);
    returned_ = true;
    return {true, "done after a while"};
  }

  bool returned() const {
    return returned_;
  }

 private:
  std::shared_ptr<Rendezvous> started_;
  std::chrono::milliseconds   delay_;
  std::atomic<bool>           returned_{false};
};

class FixedClassifier final : public IntentClassifier {
 public:
  explicit FixedClassifier(std::string answer) : answer_(std::move(answer)) {
  }

  std::string Classify(const std::string&) override {
    if (answer_ == "throw") throw std::runtime_error("classifier offline");
    return answer_;
  }

 private:
  std::string answer_;
};

class FixedDecomposer final : public GoalDecomposer {
 public:
  explicit FixedDecomposer(std::size_t count, bool fail = false) : count_(count), fail_(fail) {
  }

  std::vector<SubtaskSpec> Decompose(const std::string& goal) override {
    if (fail_) throw std::runtime_error("planner offline");
    std::vector<SubtaskSpec> specs;
    for (std::size_t i = 0; i < count_; ++i) {
      specs.push_back({"Step " + std::to_string(i + 1) + " of " + goal, ""});
    }
    return specs;
  }

 private:
  std::size_t count_;
  bool        fail_;
};

struct Fixture {
  std::shared_ptr<TaskStore>       store;
  std::shared_ptr<HandlerRegistry> registry;
  std::shared_ptr<WorkQueue>       queue;
  std::unique_ptr<Supervisor>      supervisor;

  Fixture(Supervisor::HandlerMap handlers, SupervisorOptions options, std::shared_ptr<IntentClassifier> classifier = nullptr,
          std::shared_ptr<GoalDecomposer> decomposer = nullptr) {
    std::vector<std::string> names;
    for (const auto& [name, handler] : handlers) names.push_back(name);

    store      = std::make_shared<TaskStore>(std::make_shared<taskpilot::db::memory::MemoryRepository>());
    registry   = std::make_shared<HandlerRegistry>(names);
    queue      = std::make_shared<WorkQueue>();
    supervisor = std::make_unique<Supervisor>(store, registry, queue, std::move(handlers), std::move(classifier), std::move(decomposer),
                                              std::move(options));
    supervisor->Start();
  }

  std::string CreateTask(const std::string& title, const std::string& handler) {
    Task task;
    task.title            = title;
    task.assigned_handler = handler;
    return store->Create(task);
  }

  bool HasNotification(const std::string& id, const std::string& kind) {
    const auto task = store->Get(id);
    assert(task);
    for (const auto& notification : task->notifications) {
      if (notification.kind == kind) return true;
    }
    return false;
  }
};

SupervisorOptions FastOptions() {
  SupervisorOptions options;
  options.default_handler      = "general_chat";
  options.max_acquire_attempts = 2;
  options.acquire_backoff      = 5ms;
  return options;
}

void TestBusyHandlerBlocksThenResubmitCompletes() {
  Fixture fixture({{"general_chat", std::make_shared<EchoHandler>("general_chat")},
                   {"email_triage", std::make_shared<EchoHandler>("email_triage")}},
                  FastOptions());

  std::vector<std::string> ids;
  for (int i = 0; i < 3; ++i) ids.push_back(fixture.CreateTask("Reply to thread " + std::to_string(i), "email_triage"));

  // Someone else holds the handler for the whole first round.
  assert(fixture.registry->TryAcquire("email_triage"));
  for (const auto& id : ids) assert(fixture.supervisor->SubmitTask(id));
  assert(fixture.supervisor->WaitIdle(5s));

  for (const auto& id : ids) {
    const auto task = fixture.store->Get(id);
    assert(task->status == TaskStatus::kBlocked);
    assert(fixture.HasNotification(id, "dispatch.blocked"));
  }
  assert(fixture.supervisor->HandlerStates().at("email_triage") == HandlerState::kBusy);

  fixture.registry->Release("email_triage");
  for (const auto& id : ids) {
    assert(fixture.supervisor->SubmitTask(id));
    assert(fixture.supervisor->WaitIdle(5s));
  }

  for (const auto& id : ids) {
    const auto task = fixture.store->Get(id);
    assert(task->status == TaskStatus::kCompleted);
    assert(task->progress == 100);
  }
  assert(!fixture.supervisor->SubmitTask(ids[0]));
  assert(!fixture.supervisor->SubmitTask("missing"));

  const auto recent = fixture.supervisor->RecentInteractions(10);
  assert(recent.size() == 6);
  assert(recent[0].ok);
  assert(!recent[5].ok);
  assert(recent[5].response == "handler busy");
}

void TestStopJoinsInFlightAndRestoresWaitingTask() {
  auto started   = std::make_shared<Rendezvous>();
  auto lingering = std::make_shared<LingeringHandler>(started, 300ms);

  auto options                 = FastOptions();
  options.max_acquire_attempts = 3;
  options.acquire_backoff      = 5s;
  Fixture fixture({{"general_chat", std::make_shared<EchoHandler>("general_chat")}, {"email_triage", lingering}}, options);

  const auto running = fixture.CreateTask("Answer the landlord", "email_triage");
  const auto waiting = fixture.CreateTask("Answer the accountant", "email_triage");
  const auto queued  = fixture.CreateTask("Answer the school", "email_triage");

  assert(fixture.supervisor->SubmitTask(running));
  assert(started->Wait(2s));

  // The second item takes the dispatcher into the retry wait.
  assert(fixture.supervisor->SubmitTask(waiting));
  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (fixture.store->Get(waiting)->status != TaskStatus::kInProgress) {
    assert(std::chrono::steady_clock::now() < deadline);
    std::this_thread::sleep_for(1ms);
  }
  assert(fixture.supervisor->SubmitTask(queued));

  const auto stop_started = std::chrono::steady_clock::now();
  fixture.supervisor->Stop();
  const auto stop_took = std::chrono::steady_clock::now() - stop_started;

  // The call in flight ran to completion before Stop returned.
  assert(lingering->returned());
  assert(fixture.store->Get(running)->status == TaskStatus::kCompleted);

  // The retry wait was cut short and the waiting task put back.
  assert(stop_took < options.acquire_backoff);
  assert(fixture.store->Get(waiting)->status == TaskStatus::kPending);
  assert(!fixture.HasNotification(waiting, "dispatch.blocked"));

  // Never dispatched.
  const auto untouched = *fixture.store->Get(queued);
  assert(untouched.status == TaskStatus::kPending);
  assert(untouched.notifications.empty());

  assert(fixture.supervisor->HandlerStates().at("email_triage") == HandlerState::kIdle);
}

void TestDifferentHandlersRunConcurrently() {
  auto rendezvous = std::make_shared<Rendezvous>();
  Fixture fixture({{"general_chat", std::make_shared<EchoHandler>("general_chat")},
                   {"calendar_orchestrator", std::make_shared<WaitingHandler>(rendezvous)},
                   {"focus_support", std::make_shared<SignallingHandler>(rendezvous)}},
                  FastOptions());

  fixture.supervisor->Submit(WorkItem{.query = "block my afternoon", .assigned_handler = "calendar_orchestrator"});
  fixture.supervisor->Submit(WorkItem{.query = "start a focus session", .assigned_handler = "focus_support"});
  assert(fixture.supervisor->WaitIdle(5s));

  const auto recent = fixture.supervisor->RecentInteractions(2);
  assert(recent.size() == 2);
  for (const auto& interaction : recent) assert(interaction.ok);

  const auto states = fixture.supervisor->HandlerStates();
  assert(states.at("calendar_orchestrator") == HandlerState::kIdle);
  assert(states.at("focus_support") == HandlerState::kIdle);
}

void TestHandlerFailureRestoresPreviousStatus() {
  Fixture fixture({{"general_chat", std::make_shared<EchoHandler>("general_chat")},
                   {"smart_reminders", std::make_shared<ThrowingHandler>()}},
                  FastOptions());

  const auto id = fixture.CreateTask("Remind me about the dentist", "smart_reminders");
  TaskPatch  hold;
  hold.status = TaskStatus::kOnHold;
  assert(fixture.store->Update(id, hold));

  assert(fixture.supervisor->SubmitTask(id));
  assert(fixture.supervisor->WaitIdle(5s));

  const auto task = fixture.store->Get(id);
  assert(task->status == TaskStatus::kOnHold);
  assert(fixture.HasNotification(id, "dispatch.failed"));

  const auto recent = fixture.supervisor->RecentInteractions(1);
  assert(recent.size() == 1);
  assert(!recent[0].ok);
  assert(recent[0].response == "upstream unavailable");
  assert(recent[0].task_id == std::optional<std::string>(id));
  assert(fixture.supervisor->HandlerStates().at("smart_reminders") == HandlerState::kIdle);
}

void TestSlowHandlerIsReportedAsTimedOut() {
  auto options            = FastOptions();
  options.handler_timeout = 10ms;
  Fixture fixture({{"general_chat", std::make_shared<EchoHandler>("general_chat")},
                   {"analytics_dashboard", std::make_shared<SlowHandler>(60ms)}},
                  options);

  const auto id = fixture.CreateTask("Weekly report", "analytics_dashboard");
  assert(fixture.supervisor->SubmitTask(id));
  assert(fixture.supervisor->WaitIdle(5s));

  assert(fixture.store->Get(id)->status == TaskStatus::kPending);
  assert(fixture.HasNotification(id, "dispatch.failed"));
  assert(!fixture.supervisor->RecentInteractions(1)[0].ok);
}

void TestClassifierFallsBackToDefault() {
  auto echo = std::make_shared<EchoHandler>("general_chat");

  {
    Fixture fixture({{"general_chat", echo}, {"task_manager", std::make_shared<EchoHandler>("task_manager")}}, FastOptions(),
                    std::make_shared<FixedClassifier>("no_such_handler"));
    fixture.supervisor->Submit(WorkItem{.query = "hello there"});
    assert(fixture.supervisor->WaitIdle(5s));
    assert(fixture.supervisor->RecentInteractions(1)[0].handler == "general_chat");
  }

  {
    Fixture fixture({{"general_chat", echo}, {"task_manager", std::make_shared<EchoHandler>("task_manager")}}, FastOptions(),
                    std::make_shared<FixedClassifier>("throw"));
    fixture.supervisor->Submit(WorkItem{.query = "hello again"});
    assert(fixture.supervisor->WaitIdle(5s));
    assert(fixture.supervisor->RecentInteractions(1)[0].handler == "general_chat");
  }

  {
    Fixture fixture({{"general_chat", echo}, {"task_manager", std::make_shared<EchoHandler>("task_manager")}}, FastOptions(),
                    std::make_shared<FixedClassifier>("task_manager"));
    fixture.supervisor->Submit(WorkItem{.query = "list my tasks"});
    // An unknown assigned handler also falls back to the default.
    fixture.supervisor->Submit(WorkItem{.query = "misrouted", .assigned_handler = "retired_handler"});
    assert(fixture.supervisor->WaitIdle(5s));

    const auto recent = fixture.supervisor->RecentInteractions(2);
    assert(recent.size() == 2);
    bool saw_task_manager = false;
    bool saw_default      = false;
    for (const auto& interaction : recent) {
      if (interaction.query == "list my tasks") saw_task_manager = interaction.handler == "task_manager";
      if (interaction.query == "misrouted") saw_default = interaction.handler == "general_chat";
    }
    assert(saw_task_manager && saw_default);
  }
}

void TestHandlersSeeRecentContext() {
  auto echo = std::make_shared<EchoHandler>("general_chat");
  Fixture fixture({{"general_chat", echo}}, FastOptions());

  for (int i = 0; i < 7; ++i) {
    fixture.supervisor->Submit(WorkItem{.query = "message " + std::to_string(i)});
    assert(fixture.supervisor->WaitIdle(5s));
  }

  assert(echo->calls() == 7);
  assert(echo->last_context_size() == 5);
  assert(echo->last_context_head() == "message 5");
}

void TestComplexGoalPlansSubtasks() {
  const auto count_children = [](TaskStore& store, const std::string& parent_id) {
    TaskFilter filter;
    filter.parent_id = parent_id;
    return store.List(filter);
  };

  {
    Fixture fixture({{"general_chat", std::make_shared<EchoHandler>("general_chat")}}, FastOptions(), nullptr,
                    std::make_shared<FixedDecomposer>(9));
    const auto parent_id = fixture.supervisor->EnqueueComplexGoal("ship the release");
    const auto parent    = fixture.store->Get(parent_id);
    assert(parent->status == TaskStatus::kInProgress);
    assert(parent->subtasks.size() == 7);
    assert(count_children(*fixture.store, parent_id).size() == 7);
    for (const auto& child : count_children(*fixture.store, parent_id)) assert(child.status == TaskStatus::kPending);
  }

  {
    Fixture fixture({{"general_chat", std::make_shared<EchoHandler>("general_chat")}}, FastOptions(), nullptr,
                    std::make_shared<FixedDecomposer>(2));
    const auto parent_id = fixture.supervisor->EnqueueComplexGoal("learn piano");
    const auto children  = count_children(*fixture.store, parent_id);
    assert(children.size() == 3);

    std::set<std::string> titles;
    for (const auto& child : children) titles.insert(child.title);
    assert(titles.contains("Research learn piano"));
    assert(titles.contains("Plan learn piano"));
    assert(titles.contains("Execute learn piano"));
  }

  {
    Fixture fixture({{"general_chat", std::make_shared<EchoHandler>("general_chat")}}, FastOptions(), nullptr,
                    std::make_shared<FixedDecomposer>(4, true));
    const auto parent_id = fixture.supervisor->EnqueueComplexGoal("move abroad");
    assert(count_children(*fixture.store, parent_id).size() == 3);
  }

  {
    Fixture fixture({{"general_chat", std::make_shared<EchoHandler>("general_chat")}}, FastOptions());
    const auto parent_id = fixture.supervisor->EnqueueComplexGoal("plan wedding");
    assert(fixture.store->Get(parent_id)->subtasks.size() == 3);
    assert(fixture.queue->Size() == 0);
  }
}

void TestUnknownDefaultHandlerIsRejected() {
  auto options            = FastOptions();
  options.default_handler = "missing";

  bool threw = false;
  try {
    auto store    = std::make_shared<TaskStore>(std::make_shared<taskpilot::db::memory::MemoryRepository>());
    auto registry = std::make_shared<HandlerRegistry>(std::vector<std::string>{"general_chat"});
    Supervisor supervisor(store, registry, std::make_shared<WorkQueue>(), {}, nullptr, nullptr, options);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestBusyHandlerBlocksThenResubmitCompletes();
  TestStopJoinsInFlightAndRestoresWaitingTask();
  TestDifferentHandlersRunConcurrently();
  TestHandlerFailureRestoresPreviousStatus();
  TestSlowHandlerIsReportedAsTimedOut();
  TestClassifierFallsBackToDefault();
  TestHandlersSeeRecentContext();
  TestComplexGoalPlansSubtasks();
  TestUnknownDefaultHandlerIsRejected();

  std::cout << "taskpilot_unit_supervisor: pass\n";
  return 0;
}
