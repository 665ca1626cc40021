#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "internal/discovery/discovery_controller.hpp"
#include "internal/subscription/event_queue.hpp"

namespace threadnet::subscription {

struct Subscription {
  uint64_t                    id = 0;
  std::shared_ptr<EventQueue> queue;
};

/*
  RouterEventHub

  Fans DiscoveryController events out to every active discover-routers
  subscription.

  - the first Subscribe() starts the controller, the last Unsubscribe()
    stops it
  - a new subscriber first receives router_discovered for every router
    currently known
  - a subscriber whose queue overflows is closed; its owner is expected to
    report ResourceExhausted and Unsubscribe()

  Lock order: lifecycle_mutex_ -> controller. mutex_ is never held while
  calling into the controller; the controller calls Publish() under its own
  lock.
*/
class RouterEventHub : public std::enable_shared_from_this<RouterEventHub> {
 public:
  static std::shared_ptr<RouterEventHub> Create(std::shared_ptr<discovery::ServiceBrowser> browser, discovery::DiscoveryOptions options,
                                                std::size_t queue_depth);

  RouterEventHub(const RouterEventHub&)            = delete;
  RouterEventHub& operator=(const RouterEventHub&) = delete;

  Subscription Subscribe();
  // Unknown ids are ignored.
  void Unsubscribe(uint64_t id);

  // Closes every subscription and stops discovery.
  void Shutdown();

  std::size_t                            SubscriberCount() const;
  std::vector<discovery::RouterRecord>   KnownRouters() const;

  const std::shared_ptr<discovery::DiscoveryController>& controller() const {
    return controller_;
  }

 private:
  explicit RouterEventHub(std::size_t queue_depth);

  void Publish(const discovery::RouterEvent& event);

  const std::size_t queue_depth_;

  std::shared_ptr<discovery::DiscoveryController> controller_;

  std::mutex lifecycle_mutex_;

  mutable std::mutex                               mutex_;
  uint64_t                                         next_id_ = 1;
  std::map<uint64_t, std::shared_ptr<EventQueue>>  subscribers_;
  std::vector<discovery::RouterRecord>             known_;
};

} // namespace threadnet::subscription
