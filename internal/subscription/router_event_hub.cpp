#include "router_event_hub.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"

namespace threadnet::subscription {

using discovery::RouterEvent;
using discovery::RouterRecord;

std::shared_ptr<RouterEventHub> RouterEventHub::Create(std::shared_ptr<discovery::ServiceBrowser> browser, discovery::DiscoveryOptions options,
                                                       std::size_t queue_depth) {
  std::shared_ptr<RouterEventHub> hub(new RouterEventHub(queue_depth));

  std::weak_ptr<RouterEventHub> weak = hub;
  hub->controller_                   = discovery::DiscoveryController::Create(std::move(browser), std::move(options), [weak](const RouterEvent& event) {
    if (auto target = weak.lock()) {
      target->Publish(event);
    }
  });
  return hub;
}

RouterEventHub::RouterEventHub(std::size_t queue_depth) : queue_depth_(queue_depth) {
}

Subscription RouterEventHub::Subscribe() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

  Subscription subscription;
  bool         first = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    subscription.id    = next_id_++;
    subscription.queue = std::make_shared<EventQueue>(std::max(queue_depth_, known_.size() + 1));
    for (const auto& record : known_) {
      subscription.queue->Push(RouterEvent::Discovered(record));
    }
    subscribers_.emplace(subscription.id, subscription.queue);
    first = subscribers_.size() == 1;
  }

  if (first) {
    try {
      controller_->Start();
    } catch (const std::exception&) {
      std::lock_guard<std::mutex> lock(mutex_);
      subscribers_.erase(subscription.id);
      subscription.queue->Close();
      throw;
    }
  }

  THREADNET_LOG_INFO("router subscription opened", {observability::IntField("subscription_id", static_cast<int64_t>(subscription.id))});
  return subscription;
}

void RouterEventHub::Unsubscribe(uint64_t id) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

  bool last = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = subscribers_.find(id);
    if (it == subscribers_.end()) {
      return;
    }
    it->second->Close();
    subscribers_.erase(it);
    last = subscribers_.empty();
  }

  THREADNET_LOG_INFO("router subscription closed", {observability::IntField("subscription_id", static_cast<int64_t>(id))});

  if (last) {
    controller_->Stop();
    std::lock_guard<std::mutex> lock(mutex_);
    known_.clear();
  }
}

void RouterEventHub::Shutdown() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [_, queue] : subscribers_) {
      queue->Close();
    }
    subscribers_.clear();
  }

  controller_->Stop();
  std::lock_guard<std::mutex> lock(mutex_);
  known_.clear();
}

std::size_t RouterEventHub::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

std::vector<RouterRecord> RouterEventHub::KnownRouters() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return known_;
}

void RouterEventHub::Publish(const RouterEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (event.kind == RouterEvent::Kind::kDiscovered) {
    auto it = std::find_if(known_.begin(), known_.end(), [&](const RouterRecord& r) { return r.key == event.key; });
    if (it == known_.end()) {
      known_.push_back(RouterRecord{event.key, event.data});
    } else {
      it->data = event.data;
    }
  } else {
    std::erase_if(known_, [&](const RouterRecord& r) { return r.key == event.key; });
  }

  for (const auto& [id, queue] : subscribers_) {
    const bool was_closed = queue->Closed();
    if (!queue->Push(event) && !was_closed) {
      THREADNET_LOG_WARN("router subscription overflowed", {observability::IntField("subscription_id", static_cast<int64_t>(id))});
    }
  }
}

} // namespace threadnet::subscription
