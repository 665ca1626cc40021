#include <grpcpp/grpcpp.h>

#include <iostream>
#include <memory>
#include <string>

#include "threadnet/manager/v1.hpp"

using namespace threadnet::manager::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  threadnetctl <addr> add <source> <tlv_hex>\n"
            << "  threadnetctl <addr> delete <dataset_id>\n"
            << "  threadnetctl <addr> list\n"
            << "  threadnetctl <addr> get <dataset_id>\n"
            << "  threadnetctl <addr> set-preferred <dataset_id>\n"
            << "  threadnetctl <addr> preferred\n"
            << "  threadnetctl <addr> discover\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

static void PrintRouter(const RouterEvent& event) {
  if (event.has_router_removed()) {
    std::cout << "removed key=" << event.router_removed().key() << "\n";
    return;
  }
  const auto& found = event.router_discovered();
  const auto& data  = found.data();
  std::cout << "discovered key=" << found.key();
  if (data.has_network_name()) std::cout << " network_name=" << data.network_name();
  if (data.has_vendor_name()) std::cout << " vendor=" << data.vendor_name();
  if (data.has_model_name()) std::cout << " model=" << data.model_name();
  if (data.has_server()) std::cout << " server=" << data.server() << ":" << data.port();
  for (const auto& address : data.addresses()) std::cout << " addr=" << address;
  std::cout << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto dataset_stub   = ThreadDatasetService::NewStub(channel);
  auto discovery_stub = ThreadDiscoveryService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "add") {
    if (argc < 5) return 1;

    AddDatasetTlvRequest req;
    req.set_source(argv[3]);
    req.set_tlv(argv[4]);

    google::protobuf::Empty resp;
    auto status = dataset_stub->AddDatasetTlv(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "added\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (argc < 4) return 1;

    DeleteDatasetRequest req;
    req.set_dataset_id(argv[3]);

    google::protobuf::Empty resp;
    auto status = dataset_stub->DeleteDataset(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListDatasetsRequest  req;
    ListDatasetsResponse resp;
    auto status = dataset_stub->ListDatasets(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& dataset : resp.datasets()) {
      std::cout << dataset.dataset_id() << (dataset.preferred() ? " *" : "  ") << " source=" << dataset.source()
                << " created=" << dataset.created();
      if (dataset.has_network_name()) std::cout << " network_name=" << dataset.network_name();
      if (dataset.has_extended_pan_id()) std::cout << " extended_pan_id=" << dataset.extended_pan_id();
      if (dataset.has_pan_id()) std::cout << " pan_id=" << dataset.pan_id();
      if (dataset.has_channel()) std::cout << " channel=" << dataset.channel();
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetDatasetTlvRequest req;
    req.set_dataset_id(argv[3]);

    GetDatasetTlvResponse resp;
    auto status = dataset_stub->GetDatasetTlv(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.tlv() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "set-preferred") {
    if (argc < 4) return 1;

    SetPreferredDatasetRequest req;
    req.set_dataset_id(argv[3]);

    google::protobuf::Empty resp;
    auto status = dataset_stub->SetPreferredDataset(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "preferred\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "preferred") {
    GetPreferredDatasetTlvRequest  req;
    GetPreferredDatasetTlvResponse resp;
    auto status = dataset_stub->GetPreferredDatasetTlv(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (!resp.has_tlv()) {
      std::cout << "none\n";
      return 0;
    }
    std::cout << resp.dataset_id() << " " << resp.tlv() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "discover") {
    DiscoverRoutersRequest req;
    auto reader = discovery_stub->DiscoverRouters(&ctx, req);

    DiscoverRoutersEvent msg;
    while (reader->Read(&msg)) {
      PrintRouter(msg.event());
    }

    auto status = reader->Finish();
    if (!status.ok()) return Fail(status);
    return 0;
  }

  Usage();
  return 1;
}
