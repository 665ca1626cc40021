#pragma once

#include <cstdint>

#include "internal/discovery/router_record.hpp"
#include "internal/subscription/router_event_hub.hpp"
#include "service_context.hpp"
#include "threadnet/manager/v1.hpp"

namespace threadnet::service {

threadnet::manager::v1::RouterEvent ToProto(const discovery::RouterEvent& event);

/*
  Router discovery subscriptions. The transport drains the returned queue
  and must call Unsubscribe() when the stream ends.
*/
class DiscoveryService {
public:
  explicit DiscoveryService(ServiceContext ctx);

  // Throws util::InvalidState when no mDNS backend is available.
  subscription::Subscription Subscribe(const threadnet::manager::v1::DiscoverRoutersRequest& req);

  void Unsubscribe(uint64_t subscription_id);

private:
  ServiceContext ctx_;
};

}
