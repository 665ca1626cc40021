#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

#include "internal/core/dataset_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/discovery/service_browser.hpp"
#include "internal/subscription/router_event_hub.hpp"

namespace threadnet::factory {

/*
  Application

  Everything the server needs for the lifetime of the process. routers is
  null when no mDNS backend is available.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<core::DatasetStore>             datasets;
  std::shared_ptr<subscription::RouterEventHub>   routers;
};

/*
  Composition root. The only place that knows concrete repository and
  browser types.
*/
std::shared_ptr<db::Repository> BuildRepository(const threadnet::runtime::config::RuntimeConfig& config);

discovery::DiscoveryOptions BuildDiscoveryOptions(const threadnet::runtime::config::RuntimeConfig& config);

// browser overrides the build-time mDNS backend; used by tests.
Application Build(const threadnet::runtime::config::RuntimeConfig& config,
                  std::shared_ptr<discovery::ServiceBrowser> browser = nullptr);

} // namespace threadnet::factory
