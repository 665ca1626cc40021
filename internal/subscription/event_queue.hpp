#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "internal/discovery/router_record.hpp"

namespace threadnet::subscription {

/*
  Bounded blocking queue of router events for one subscriber.

  Push never blocks: once the queue is full it is closed with an overflow
  error and later pushes are discarded. Pop drains remaining events before
  reporting closure.
*/
class EventQueue {
 public:
  explicit EventQueue(std::size_t capacity);

  // false when the event was not queued (closed or overflowed)
  bool Push(const discovery::RouterEvent& event);

  enum class PopStatus {
    kEvent,
    kTimeout,
    kClosed,
  };

  PopStatus Pop(discovery::RouterEvent* event, std::chrono::milliseconds timeout);

  void Close();

  bool Closed() const;
  bool Overflowed() const;
  std::size_t Size() const;

 private:
  const std::size_t                  capacity_;
  mutable std::mutex                 mutex_;
  std::condition_variable            cv_;
  std::deque<discovery::RouterEvent> queue_;
  bool                               closed_     = false;
  bool                               overflowed_ = false;
};

} // namespace threadnet::subscription
