#pragma once

#include "service_context.hpp"
#include "threadnet/manager/v1.hpp"

namespace threadnet::service {

/*
  Request handlers for the thread dataset API. Errors are thrown as
  util:: exceptions and mapped to gRPC status by the transport.
*/
class DatasetService {
public:
  explicit DatasetService(ServiceContext ctx);

  void AddDatasetTlv(const threadnet::manager::v1::AddDatasetTlvRequest& req);

  void DeleteDataset(const threadnet::manager::v1::DeleteDatasetRequest& req);

  threadnet::manager::v1::ListDatasetsResponse
  ListDatasets(const threadnet::manager::v1::ListDatasetsRequest& req);

  threadnet::manager::v1::GetDatasetTlvResponse
  GetDatasetTlv(const threadnet::manager::v1::GetDatasetTlvRequest& req);

  void SetPreferredDataset(const threadnet::manager::v1::SetPreferredDatasetRequest& req);

  threadnet::manager::v1::GetPreferredDatasetTlvResponse
  GetPreferredDatasetTlv(const threadnet::manager::v1::GetPreferredDatasetTlvRequest& req);

private:
  ServiceContext ctx_;
};

}
