#include "discovery_service.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/util/errors.hpp"

namespace threadnet::service {

using namespace threadnet::manager::v1;

threadnet::manager::v1::RouterEvent ToProto(const discovery::RouterEvent& event) {
  threadnet::manager::v1::RouterEvent out;
  if (event.kind == discovery::RouterEvent::Kind::kRemoved) {
    out.mutable_router_removed()->set_key(event.key);
    return out;
  }

  auto* discovered = out.mutable_router_discovered();
  discovered->set_key(event.key);

  const auto& data = event.data;
  auto*       pb   = discovered->mutable_data();
  if (data.brand) pb->set_brand(*data.brand);
  if (data.extended_pan_id) pb->set_extended_pan_id(*data.extended_pan_id);
  if (data.model_name) pb->set_model_name(*data.model_name);
  if (data.network_name) pb->set_network_name(*data.network_name);
  if (data.server) pb->set_server(*data.server);
  if (data.vendor_name) pb->set_vendor_name(*data.vendor_name);
  if (data.extended_address) pb->set_extended_address(*data.extended_address);
  if (data.thread_version) pb->set_thread_version(*data.thread_version);
  for (const auto& address : data.addresses) {
    pb->add_addresses(address);
  }
  pb->set_port(data.port);
  return out;
}

DiscoveryService::DiscoveryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

subscription::Subscription DiscoveryService::Subscribe(const DiscoverRoutersRequest&) {
  return ObserveRpc("thread/discovery/subscribe", "", [&] {
    if (!ctx_.routers) {
      throw util::InvalidState("mdns backend not enabled at build time");
    }
    return ctx_.routers->Subscribe();
  });
}

void DiscoveryService::Unsubscribe(uint64_t subscription_id) {
  if (!ctx_.routers) {
    return;
  }
  ctx_.routers->Unsubscribe(subscription_id);
}

} // namespace threadnet::service
