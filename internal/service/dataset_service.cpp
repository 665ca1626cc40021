#include "dataset_service.hpp"

#include <stdexcept>

#include "internal/core/dataset_store.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/util/time.hpp"

namespace threadnet::service {

using namespace threadnet::manager::v1;

namespace {

DatasetInfo ToDatasetInfo(const core::Dataset& dataset) {
  DatasetInfo info;
  info.set_dataset_id(dataset.id);
  info.set_source(dataset.source);
  info.set_created(util::ToIsoString(dataset.created));
  info.set_preferred(dataset.preferred);

  if (auto value = dataset.ExtendedPanId()) info.set_extended_pan_id(*value);
  if (auto value = dataset.NetworkName()) info.set_network_name(*value);
  if (auto value = dataset.PanId()) info.set_pan_id(*value);
  if (auto value = dataset.Channel()) info.set_channel(*value);
  return info;
}

} // namespace

DatasetService::DatasetService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.datasets) {
    throw std::invalid_argument("dataset service requires a dataset store");
  }
}

void DatasetService::AddDatasetTlv(const AddDatasetTlvRequest& req) {
  ObserveRpc("thread/dataset/add", "", [&] { ctx_.datasets->Add(req.source(), req.tlv()); });
}

void DatasetService::DeleteDataset(const DeleteDatasetRequest& req) {
  ObserveRpc("thread/dataset/delete", req.dataset_id(), [&] { ctx_.datasets->Delete(req.dataset_id()); });
}

ListDatasetsResponse DatasetService::ListDatasets(const ListDatasetsRequest&) {
  return ObserveRpc("thread/dataset/list", "", [&] {
    ListDatasetsResponse resp;
    for (const auto& dataset : ctx_.datasets->List()) {
      *resp.add_datasets() = ToDatasetInfo(dataset);
    }
    return resp;
  });
}

GetDatasetTlvResponse DatasetService::GetDatasetTlv(const GetDatasetTlvRequest& req) {
  return ObserveRpc("thread/dataset/get_tlv", req.dataset_id(), [&] {
    GetDatasetTlvResponse resp;
    resp.set_tlv(ctx_.datasets->Get(req.dataset_id()).tlv);
    return resp;
  });
}

void DatasetService::SetPreferredDataset(const SetPreferredDatasetRequest& req) {
  ObserveRpc("thread/dataset/set_preferred", req.dataset_id(), [&] { ctx_.datasets->SetPreferred(req.dataset_id()); });
}

GetPreferredDatasetTlvResponse DatasetService::GetPreferredDatasetTlv(const GetPreferredDatasetTlvRequest&) {
  return ObserveRpc("thread/dataset/get_preferred_tlv", "", [&] {
    GetPreferredDatasetTlvResponse resp;
    if (auto preferred = ctx_.datasets->Preferred()) {
      resp.set_dataset_id(preferred->id);
      resp.set_tlv(preferred->tlv);
    }
    return resp;
  });
}

} // namespace threadnet::service
