#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace threadnet::db::sqlite {

/*
  Tables (see sqlite_schema.cpp):
    thread_dataset(seq, id, source, tlv, created_at_us)  ordered by seq
    thread_dataset_store(key, value)                     key "preferred_dataset"
*/
class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertDataset(Transaction&, const model::DatasetRecord&) override;
  std::optional<model::DatasetRecord> GetDataset(Transaction&, const std::string&) override;
  std::vector<model::DatasetRecord> ListDatasets(Transaction&) override;
  Result DeleteDataset(Transaction&, const std::string&) override;

  std::optional<std::string> GetPreferredDatasetId(Transaction&) override;
  Result SetPreferredDatasetId(Transaction&, const std::optional<std::string>&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
