#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "threadnet/manager/v1.hpp"
#include "internal/service/dataset_service.hpp"

namespace threadnet::grpc {

class DatasetServer final : public threadnet::manager::v1::ThreadDatasetService::Service {
public:
  explicit DatasetServer(std::shared_ptr<threadnet::service::DatasetService> svc);

  ::grpc::Status AddDatasetTlv(::grpc::ServerContext*,
                               const threadnet::manager::v1::AddDatasetTlvRequest*,
                               google::protobuf::Empty*) override;

  ::grpc::Status DeleteDataset(::grpc::ServerContext*,
                               const threadnet::manager::v1::DeleteDatasetRequest*,
                               google::protobuf::Empty*) override;

  ::grpc::Status ListDatasets(::grpc::ServerContext*,
                              const threadnet::manager::v1::ListDatasetsRequest*,
                              threadnet::manager::v1::ListDatasetsResponse*) override;

  ::grpc::Status GetDatasetTlv(::grpc::ServerContext*,
                               const threadnet::manager::v1::GetDatasetTlvRequest*,
                               threadnet::manager::v1::GetDatasetTlvResponse*) override;

  ::grpc::Status SetPreferredDataset(::grpc::ServerContext*,
                                     const threadnet::manager::v1::SetPreferredDatasetRequest*,
                                     google::protobuf::Empty*) override;

  ::grpc::Status GetPreferredDatasetTlv(::grpc::ServerContext*,
                                        const threadnet::manager::v1::GetPreferredDatasetTlvRequest*,
                                        threadnet::manager::v1::GetPreferredDatasetTlvResponse*) override;

private:
  std::shared_ptr<threadnet::service::DatasetService> service_;
};

}
