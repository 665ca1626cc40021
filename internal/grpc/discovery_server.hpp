#pragma once

#include <chrono>
#include <memory>
#include <grpcpp/grpcpp.h>

#include "threadnet/manager/v1.hpp"
#include "internal/service/discovery_service.hpp"

namespace threadnet::grpc {

/*
  Streams router events until the client cancels, the subscription
  overflows (RESOURCE_EXHAUSTED) or the hub shuts down (OK). The queue is
  polled so cancellation is noticed within poll_interval.
*/
class DiscoveryServer final : public threadnet::manager::v1::ThreadDiscoveryService::Service {
public:
  DiscoveryServer(std::shared_ptr<threadnet::service::DiscoveryService> svc,
                  std::chrono::milliseconds poll_interval);

  ::grpc::Status DiscoverRouters(::grpc::ServerContext*,
                                 const threadnet::manager::v1::DiscoverRoutersRequest*,
                                 ::grpc::ServerWriter<threadnet::manager::v1::DiscoverRoutersEvent>*) override;

private:
  std::shared_ptr<threadnet::service::DiscoveryService> service_;
  std::chrono::milliseconds poll_interval_;
};

}
