#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace threadnet::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertDataset(Transaction&, const model::DatasetRecord&) override;
  std::optional<model::DatasetRecord> GetDataset(Transaction&, const std::string&) override;
  std::vector<model::DatasetRecord> ListDatasets(Transaction&) override;
  Result DeleteDataset(Transaction&, const std::string&) override;

  std::optional<std::string> GetPreferredDatasetId(Transaction&) override;
  Result SetPreferredDatasetId(Transaction&, const std::optional<std::string>&) override;

private:
  friend class MemoryTransaction;

  struct State {
    // insertion order
    std::vector<model::DatasetRecord> datasets;
    std::optional<std::string> preferred_dataset_id;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
