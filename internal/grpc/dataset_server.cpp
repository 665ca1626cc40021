#include "dataset_server.hpp"

#include "grpc_error.hpp"

namespace threadnet::grpc {

using namespace threadnet::manager::v1;

DatasetServer::DatasetServer(std::shared_ptr<threadnet::service::DatasetService> svc) : service_(std::move(svc)) {
}

::grpc::Status DatasetServer::AddDatasetTlv(::grpc::ServerContext*, const AddDatasetTlvRequest* req, google::protobuf::Empty*) {
  try {
    service_->AddDatasetTlv(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DatasetServer::DeleteDataset(::grpc::ServerContext*, const DeleteDatasetRequest* req, google::protobuf::Empty*) {
  try {
    service_->DeleteDataset(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DatasetServer::ListDatasets(::grpc::ServerContext*, const ListDatasetsRequest* req, ListDatasetsResponse* resp) {
  try {
    *resp = service_->ListDatasets(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DatasetServer::GetDatasetTlv(::grpc::ServerContext*, const GetDatasetTlvRequest* req, GetDatasetTlvResponse* resp) {
  try {
    *resp = service_->GetDatasetTlv(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DatasetServer::SetPreferredDataset(::grpc::ServerContext*, const SetPreferredDatasetRequest* req, google::protobuf::Empty*) {
  try {
    service_->SetPreferredDataset(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DatasetServer::GetPreferredDatasetTlv(::grpc::ServerContext*, const GetPreferredDatasetTlvRequest* req,
                                                     GetPreferredDatasetTlvResponse* resp) {
  try {
    *resp = service_->GetPreferredDatasetTlv(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace threadnet::grpc
