#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

namespace vigil::capture {

enum class OverflowPolicy {
  kDropNewest,
  kDropOldest,
};

/*
  Lossy fixed-capacity handoff between capture threads and the single
  batching consumer.

  TryEnqueue never waits for the consumer; it only takes the queue lock
  for a push. Occupancy never exceeds capacity under either policy:

    kDropNewest  full queue rejects the incoming item
    kDropOldest  full queue evicts its head to make room

  Every rejected or evicted item is counted in Dropped().
*/

template <typename T>
class BoundedEventQueue {
 public:
  explicit BoundedEventQueue(std::size_t capacity, OverflowPolicy policy = OverflowPolicy::kDropNewest)
      : capacity_(capacity == 0 ? 1 : capacity), policy_(policy) {
  }

  BoundedEventQueue(const BoundedEventQueue&)            = delete;
  BoundedEventQueue& operator=(const BoundedEventQueue&) = delete;

  // false when the item itself was not queued (full under kDropNewest, or shut down)
  bool TryEnqueue(T&& item) {
    bool notify = false;
    {
      std::lock_guard lock(mutex_);
      if (shutdown_) {
        ++dropped_;
        return false;
      }
      if (items_.size() >= capacity_) {
        ++dropped_;
        if (policy_ == OverflowPolicy::kDropNewest) {
          return false;
        }
        items_.pop_front();
      }
      items_.push_back(std::move(item));
      notify = waiting_ && items_.size() >= wanted_;
    }
    if (notify) {
      cv_.notify_one();
    }
    return true;
  }

  /*
    Single consumer only. Returns once max_items are available, max_wait
    has elapsed or the queue is shut down, whichever comes first. Items
    left after Shutdown() are still returned.
  */
  std::vector<T> DrainBatch(std::size_t max_items, std::chrono::milliseconds max_wait) {
    if (max_items == 0) max_items = 1;

    std::unique_lock lock(mutex_);
    waiting_ = true;
    wanted_  = max_items;
    cv_.wait_for(lock, max_wait, [&] { return shutdown_ || items_.size() >= max_items; });
    waiting_ = false;

    std::vector<T> out;
    const auto     n = items_.size() < max_items ? items_.size() : max_items;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
      out.push_back(std::move(items_.front()));
      items_.pop_front();
    }
    return out;
  }

  void Shutdown() {
    {
      std::lock_guard lock(mutex_);
      shutdown_ = true;
    }
    cv_.notify_all();
  }

  bool IsShutdown() const {
    std::lock_guard lock(mutex_);
    return shutdown_;
  }

  std::size_t Size() const {
    std::lock_guard lock(mutex_);
    return items_.size();
  }

  std::size_t Capacity() const {
    return capacity_;
  }

  uint64_t Dropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
  }

 private:
  const std::size_t       capacity_;
  const OverflowPolicy    policy_;
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<T>           items_;
  uint64_t                dropped_  = 0;
  bool                    shutdown_ = false;
  bool                    waiting_  = false;
  std::size_t             wanted_   = 1;
};

} // namespace vigil::capture
