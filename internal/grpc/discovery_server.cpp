#include "discovery_server.hpp"

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace threadnet::grpc {

using namespace threadnet::manager::v1;

namespace {

class SubscriptionGuard {
 public:
  SubscriptionGuard(threadnet::service::DiscoveryService& service, uint64_t id) : service_(service), id_(id) {
  }
  ~SubscriptionGuard() {
    service_.Unsubscribe(id_);
  }

  SubscriptionGuard(const SubscriptionGuard&)            = delete;
  SubscriptionGuard& operator=(const SubscriptionGuard&) = delete;

 private:
  threadnet::service::DiscoveryService& service_;
  uint64_t                              id_;
};

} // namespace

DiscoveryServer::DiscoveryServer(std::shared_ptr<threadnet::service::DiscoveryService> svc, std::chrono::milliseconds poll_interval)
    : service_(std::move(svc)), poll_interval_(poll_interval) {
}

::grpc::Status DiscoveryServer::DiscoverRouters(::grpc::ServerContext* ctx, const DiscoverRoutersRequest* req,
                                                ::grpc::ServerWriter<DiscoverRoutersEvent>* writer) {
  threadnet::subscription::Subscription subscription;
  try {
    subscription = service_->Subscribe(*req);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }

  SubscriptionGuard guard(*service_, subscription.id);

  try {
    threadnet::discovery::RouterEvent event;
    for (;;) {
      if (ctx->IsCancelled()) {
        return ::grpc::Status::CANCELLED;
      }

      const auto status = subscription.queue->Pop(&event, poll_interval_);
      if (status == threadnet::subscription::EventQueue::PopStatus::kTimeout) {
        continue;
      }
      if (status == threadnet::subscription::EventQueue::PopStatus::kClosed) {
        if (subscription.queue->Overflowed()) {
          return ToStatus(threadnet::util::ResourceExhausted("router event queue overflowed"));
        }
        return ::grpc::Status::OK;
      }

      DiscoverRoutersEvent message;
      message.set_subscription_id(subscription.id);
      *message.mutable_event() = threadnet::service::ToProto(event);
      if (!writer->Write(message)) {
        THREADNET_LOG_DEBUG("router stream write failed", {observability::IntField("subscription_id", static_cast<int64_t>(subscription.id))});
        return ::grpc::Status::CANCELLED;
      }
    }
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace threadnet::grpc
