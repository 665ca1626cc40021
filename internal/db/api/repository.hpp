#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/dataset_record.hpp"

namespace threadnet::db {

/*
  Repository abstraction.

  GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - ListDatasets returns rows in insertion order
  - At most one preferred dataset id is stored

  The DB is the source of truth for the dataset store; the in-memory copy
  held by core::DatasetStore is rebuilt from it on start.

  Reads throw std::runtime_error when the backend fails; writes report a
  Result.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Datasets
  // ---------------------------------------------------------------------

  virtual Result InsertDataset(Transaction&, const model::DatasetRecord&) = 0;

  virtual std::optional<model::DatasetRecord> GetDataset(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::DatasetRecord> ListDatasets(Transaction&) = 0;

  virtual Result DeleteDataset(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Store-level settings
  // ---------------------------------------------------------------------

  virtual std::optional<std::string> GetPreferredDatasetId(Transaction&) = 0;

  // nullopt clears the preferred reference
  virtual Result SetPreferredDatasetId(Transaction&, const std::optional<std::string>& id) = 0;
};

} // namespace threadnet::db
