#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include "threadnet/manager/v1.hpp"

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/runtime/server.hpp"
#include "support/fake_service_browser.hpp"
#include "support/test_vectors.hpp"

namespace {

using namespace threadnet::manager::v1;
using threadnet::testing::FakeServiceBrowser;
using threadnet::testing::HassRouter;

const std::string kHassName = "HomeAssistant OpenThreadBorderRouter #0BBF._meshcop._udp.local.";

bool WaitFor(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

threadnet::runtime::config::RuntimeConfig TestConfig() {
  threadnet::runtime::config::RuntimeConfig config;
  config.mutable_server()->set_bind_address("127.0.0.1:0");
  config.mutable_discovery()->set_stream_poll_interval_ms(20);
  threadnet::config::ConfigLoader::ApplyDefaults(&config);
  return config;
}

/*
  Server plus client stubs on a loopback port.
*/
struct Harness {
  threadnet::factory::Application              app;
  std::unique_ptr<threadnet::runtime::Server>  server;
  std::shared_ptr<::grpc::Channel>             channel;
  std::unique_ptr<ThreadDatasetService::Stub>  datasets;
  std::unique_ptr<ThreadDiscoveryService::Stub> discovery;

  explicit Harness(std::shared_ptr<threadnet::discovery::ServiceBrowser> browser) {
    const auto config = TestConfig();
    app               = threadnet::factory::Build(config, std::move(browser));
    server = std::make_unique<threadnet::runtime::Server>(config.server().bind_address(), std::move(app.grpc_services));
    server->Start();

    channel   = ::grpc::CreateChannel("127.0.0.1:" + std::to_string(server->BoundPort()), ::grpc::InsecureChannelCredentials());
    datasets  = ThreadDatasetService::NewStub(channel);
    discovery = ThreadDiscoveryService::NewStub(channel);
  }

  ~Harness() {
    if (app.routers) {
      app.routers->Shutdown();
    }
    server->Stop(std::chrono::milliseconds(500));
  }
};

::grpc::Status AddDataset(Harness& h, const std::string& source, const std::string& tlv) {
  ::grpc::ClientContext     ctx;
  AddDatasetTlvRequest      req;
  google::protobuf::Empty   resp;
  req.set_source(source);
  req.set_tlv(tlv);
  return h.datasets->AddDatasetTlv(&ctx, req, &resp);
}

ListDatasetsResponse ListDatasets(Harness& h) {
  ::grpc::ClientContext ctx;
  ListDatasetsRequest   req;
  ListDatasetsResponse  resp;
  const auto            status = h.datasets->ListDatasets(&ctx, req, &resp);
  assert(status.ok());
  return resp;
}

void TestDatasetLifecycleOverGrpc() {
  Harness h(std::make_shared<FakeServiceBrowser>());

  {
    ::grpc::ClientContext          ctx;
    GetPreferredDatasetTlvRequest  req;
    GetPreferredDatasetTlvResponse resp;
    assert(h.datasets->GetPreferredDatasetTlv(&ctx, req, &resp).ok());
    assert(!resp.has_dataset_id());
    assert(!resp.has_tlv());
  }

  assert(AddDataset(h, "hass", threadnet::testing::kDataset1).ok());
  assert(AddDataset(h, "Google", threadnet::testing::kDataset2).ok());
  // identical TLV is not stored twice
  assert(AddDataset(h, "hass", threadnet::testing::kDataset1).ok());

  auto bad = AddDataset(h, "hass", "DEADBEEF");
  assert(bad.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  auto list = ListDatasets(h);
  assert(list.datasets_size() == 2);
  const auto first  = list.datasets(0);
  const auto second = list.datasets(1);
  assert(first.source() == "hass");
  assert(first.preferred());
  assert(first.network_name() == "OpenThreadDemo");
  assert(first.pan_id() == "1234");
  assert(first.extended_pan_id() == "1111111122222222");
  assert(first.channel() == 15);
  assert(first.created().size() > 20);
  assert(second.source() == "Google");
  assert(!second.preferred());
  assert(second.network_name() == "HomeAssistant!");

  {
    ::grpc::ClientContext ctx;
    GetDatasetTlvRequest  req;
    GetDatasetTlvResponse resp;
    req.set_dataset_id(second.dataset_id());
    assert(h.datasets->GetDatasetTlv(&ctx, req, &resp).ok());
    assert(resp.tlv() == threadnet::testing::kDataset2);
  }

  {
    ::grpc::ClientContext ctx;
    GetDatasetTlvRequest  req;
    GetDatasetTlvResponse resp;
    req.set_dataset_id("01GZZZZZZZZZZZZZZZZZZZZZZZ");
    assert(h.datasets->GetDatasetTlv(&ctx, req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }

  {
    ::grpc::ClientContext   ctx;
    DeleteDatasetRequest    req;
    google::protobuf::Empty resp;
    req.set_dataset_id(first.dataset_id());
    assert(h.datasets->DeleteDataset(&ctx, req, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  }

  {
    ::grpc::ClientContext      ctx;
    SetPreferredDatasetRequest req;
    google::protobuf::Empty    resp;
    req.set_dataset_id(second.dataset_id());
    assert(h.datasets->SetPreferredDataset(&ctx, req, &resp).ok());
  }

  {
    ::grpc::ClientContext          ctx;
    GetPreferredDatasetTlvRequest  req;
    GetPreferredDatasetTlvResponse resp;
    assert(h.datasets->GetPreferredDatasetTlv(&ctx, req, &resp).ok());
    assert(resp.dataset_id() == second.dataset_id());
    assert(resp.tlv() == threadnet::testing::kDataset2);
  }

  {
    ::grpc::ClientContext   ctx;
    DeleteDatasetRequest    req;
    google::protobuf::Empty resp;
    req.set_dataset_id(first.dataset_id());
    assert(h.datasets->DeleteDataset(&ctx, req, &resp).ok());
  }

  list = ListDatasets(h);
  assert(list.datasets_size() == 1);
  assert(list.datasets(0).dataset_id() == second.dataset_id());
  assert(list.datasets(0).preferred());
}

void TestDiscoverRoutersStreamsEvents() {
  auto browser = std::make_shared<FakeServiceBrowser>();
  Harness h(browser);

  ::grpc::ClientContext  ctx;
  DiscoverRoutersRequest req;
  auto                   reader = h.discovery->DiscoverRouters(&ctx, req);

  assert(WaitFor([&] { return browser->ListenerCount() == 1; }));
  assert(h.app.routers->SubscriberCount() == 1);

  browser->Add(kHassName);
  assert(WaitFor([&] { return browser->PendingCount() == 1; }));
  browser->CompleteFor(kHassName, HassRouter());

  DiscoverRoutersEvent message;
  assert(reader->Read(&message));
  assert(message.subscription_id() != 0);
  assert(message.event().has_router_discovered());
  const auto& discovered = message.event().router_discovered();
  assert(discovered.key() == "e60fc7c186212ce5");
  assert(discovered.data().network_name() == "OpenThread HC");
  assert(discovered.data().server() == "core-silabs-multiprotocol.local.");
  assert(discovered.data().port() == 49153);
  assert(discovered.data().addresses_size() == 1);

  const auto subscription_id = message.subscription_id();

  browser->Remove(kHassName);
  assert(reader->Read(&message));
  assert(message.subscription_id() == subscription_id);
  assert(message.event().has_router_removed());
  assert(message.event().router_removed().key() == "e60fc7c186212ce5");

  h.app.routers->Shutdown();
  assert(!reader->Read(&message));
  assert(reader->Finish().ok());
  assert(browser->ListenerCount() == 0);
}

void TestCancelledStreamReleasesSubscription() {
  auto browser = std::make_shared<FakeServiceBrowser>();
  Harness h(browser);

  {
    ::grpc::ClientContext  ctx;
    DiscoverRoutersRequest req;
    auto                   reader = h.discovery->DiscoverRouters(&ctx, req);

    assert(WaitFor([&] { return h.app.routers->SubscriberCount() == 1; }));
    ctx.TryCancel();
    assert(reader->Finish().error_code() == ::grpc::StatusCode::CANCELLED);
  }

  // the server notices on its next poll
  assert(WaitFor([&] { return h.app.routers->SubscriberCount() == 0; }));
  assert(WaitFor([&] { return browser->ListenerCount() == 0; }));
}

void TestDiscoveryWithoutBackendFailsPrecondition() {
  Harness h(nullptr);
  if (h.app.routers) {
    // built with a real mDNS backend
    return;
  }

  ::grpc::ClientContext  ctx;
  DiscoverRoutersRequest req;
  auto                   reader = h.discovery->DiscoverRouters(&ctx, req);

  DiscoverRoutersEvent message;
  assert(!reader->Read(&message));
  const auto status = reader->Finish();
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  // dataset RPCs are unaffected
  assert(AddDataset(h, "hass", threadnet::testing::kDataset1).ok());
  assert(ListDatasets(h).datasets_size() == 1);
}

} // namespace

int main() {
  TestDatasetLifecycleOverGrpc();
  TestDiscoverRoutersStreamsEvents();
  TestCancelledStreamReleasesSubscription();
  TestDiscoveryWithoutBackendFailsPrecondition();

  std::cout << "threadnet_manager_integration_grpc_api: pass\n";
  return 0;
}
