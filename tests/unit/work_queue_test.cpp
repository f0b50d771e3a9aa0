#include "internal/queue/work_queue.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

using taskpilot::queue::WorkItem;
using taskpilot::queue::WorkQueue;

void TestFifoOrder() {
  WorkQueue queue;
  queue.Enqueue(WorkItem{.task_id = std::nullopt, .query = "first", .assigned_handler = std::nullopt});
  queue.Enqueue(WorkItem{.task_id = "t-1", .query = "second", .assigned_handler = "task_manager"});
  assert(queue.Size() == 2);

  auto first = queue.Dequeue();
  assert(first.has_value() && first->query == "first");
  auto second = queue.Dequeue();
  assert(second.has_value() && second->task_id == std::optional<std::string>("t-1"));
  assert(second->assigned_handler == std::optional<std::string>("task_manager"));
  assert(queue.Size() == 0);
}

void TestShutdownDrainsThenStops() {
  WorkQueue queue;
  queue.Enqueue(WorkItem{.query = "left over"});
  queue.Shutdown();

  auto item = queue.Dequeue();
  assert(item.has_value() && item->query == "left over");
  assert(!queue.Dequeue().has_value());
}

void TestShutdownWakesBlockedConsumer() {
  WorkQueue         queue;
  std::atomic<bool> returned{false};

  std::thread consumer([&] {
    auto item = queue.Dequeue();
    assert(!item.has_value());
    returned = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  assert(!returned);
  queue.Shutdown();
  consumer.join();
  assert(returned);
}

void TestManyProducersOneConsumer() {
  WorkQueue    queue;
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 250;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&queue, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        queue.Enqueue(WorkItem{.query = std::to_string(p) + ":" + std::to_string(i)});
      }
    });
  }

  int consumed = 0;
  while (consumed < kProducers * kPerProducer) {
    auto item = queue.Dequeue();
    assert(item.has_value());
    ++consumed;
  }

  for (auto& producer : producers) producer.join();
  assert(queue.Size() == 0);
}

} // namespace

int main() {
  TestFifoOrder();
  TestShutdownDrainsThenStops();
  TestShutdownWakesBlockedConsumer();
  TestManyProducersOneConsumer();

  std::cout << "taskpilot_unit_work_queue: pass\n";
  return 0;
}
