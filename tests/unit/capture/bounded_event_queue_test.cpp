#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

#include "internal/capture/bounded_event_queue.hpp"

namespace {

using vigil::capture::BoundedEventQueue;
using vigil::capture::OverflowPolicy;

void TestDropNewestRejectsIncoming() {
  BoundedEventQueue<int> queue(3, OverflowPolicy::kDropNewest);
  assert(queue.TryEnqueue(1));
  assert(queue.TryEnqueue(2));
  assert(queue.TryEnqueue(3));
  assert(!queue.TryEnqueue(4));
  assert(queue.Size() == 3);
  assert(queue.Dropped() == 1);

  auto out = queue.DrainBatch(10, std::chrono::milliseconds(0));
  assert((out == std::vector<int>{1, 2, 3}));
}

void TestDropOldestEvictsHead() {
  BoundedEventQueue<int> queue(3, OverflowPolicy::kDropOldest);
  for (int i = 1; i <= 5; ++i) {
    assert(queue.TryEnqueue(int{i}));
  }
  assert(queue.Size() == 3);
  assert(queue.Dropped() == 2);

  auto out = queue.DrainBatch(10, std::chrono::milliseconds(0));
  assert((out == std::vector<int>{3, 4, 5}));
}

void TestDrainHonorsMaxItems() {
  BoundedEventQueue<int> queue(10);
  for (int i = 0; i < 7; ++i) queue.TryEnqueue(int{i});

  auto first = queue.DrainBatch(5, std::chrono::milliseconds(0));
  assert(first.size() == 5);
  assert(first.front() == 0);

  auto second = queue.DrainBatch(5, std::chrono::milliseconds(10));
  assert(second.size() == 2);
  assert(second.front() == 5);
}

void TestDrainReturnsOnTimeoutWhenEmpty() {
  BoundedEventQueue<int> queue(4);
  const auto             start = std::chrono::steady_clock::now();
  auto                   out   = queue.DrainBatch(4, std::chrono::milliseconds(30));
  assert(out.empty());
  assert(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(25));
}

void TestShutdownWakesConsumerAndKeepsItems() {
  BoundedEventQueue<int> queue(8);
  queue.TryEnqueue(42);

  std::vector<int> drained;
  std::thread      consumer([&] { drained = queue.DrainBatch(8, std::chrono::seconds(10)); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.Shutdown();
  consumer.join();

  assert(drained.size() == 1);
  assert(drained[0] == 42);
  assert(queue.IsShutdown());
  assert(!queue.TryEnqueue(7));
  assert(queue.Dropped() == 1);
}

void TestConcurrentProducersNeverExceedCapacity() {
  BoundedEventQueue<int> queue(100, OverflowPolicy::kDropOldest);
  std::atomic<int>       accepted{0};

  std::vector<std::thread> producers;
  for (int t = 0; t < 4; ++t) {
    producers.emplace_back([&] {
      for (int i = 0; i < 1000; ++i) {
        if (queue.TryEnqueue(int{i})) accepted.fetch_add(1);
        assert(queue.Size() <= queue.Capacity());
      }
    });
  }
  for (auto& p : producers) p.join();

  assert(accepted.load() == 4000);
  assert(queue.Size() == 100);
  assert(queue.Dropped() == 3900);
}

} // namespace

int main() {
  TestDropNewestRejectsIncoming();
  TestDropOldestEvictsHead();
  TestDrainHonorsMaxItems();
  TestDrainReturnsOnTimeoutWhenEmpty();
  TestShutdownWakesConsumerAndKeepsItems();
  TestConcurrentProducersNeverExceedCapacity();
  std::cout << "vigil_bounded_event_queue_test: pass\n";
  return 0;
}
