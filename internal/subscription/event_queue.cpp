#include "event_queue.hpp"

namespace threadnet::subscription {

EventQueue::EventQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

bool EventQueue::Push(const discovery::RouterEvent& event) {
  bool queued = false;
  {
    std::lock_guard lock(mutex_);
    if (closed_) return false;
    if (queue_.size() >= capacity_) {
      overflowed_ = true;
      closed_     = true;
    } else {
      queue_.push_back(event);
      queued = true;
    }
  }
  cv_.notify_all();
  return queued;
}

EventQueue::PopStatus EventQueue::Pop(discovery::RouterEvent* event, std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);

  if (!cv_.wait_for(lock, timeout, [&] { return closed_ || !queue_.empty(); })) {
    return PopStatus::kTimeout;
  }

  if (queue_.empty()) return PopStatus::kClosed;

  *event = std::move(queue_.front());
  queue_.pop_front();
  return PopStatus::kEvent;
}

void EventQueue::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool EventQueue::Closed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

bool EventQueue::Overflowed() const {
  std::lock_guard lock(mutex_);
  return overflowed_;
}

std::size_t EventQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace threadnet::subscription
