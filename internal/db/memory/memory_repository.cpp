#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace threadnet::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertDataset(Transaction& t, const model::DatasetRecord& r) {
  auto& s = TX(t).Mutable();
  auto  it = std::find_if(s.datasets.begin(), s.datasets.end(), [&](const auto& d) { return d.id == r.id; });
  if (it != s.datasets.end()) return Result::Err(ErrorCode::AlreadyExists, r.id);
  s.datasets.push_back(r);
  return Result::Ok();
}

std::optional<model::DatasetRecord> MemoryRepository::GetDataset(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = std::find_if(s.datasets.begin(), s.datasets.end(), [&](const auto& d) { return d.id == id; });
  if (it == s.datasets.end()) return std::nullopt;
  return *it;
}

std::vector<model::DatasetRecord> MemoryRepository::ListDatasets(Transaction& t) {
  return TX(t).View().datasets;
}

Result MemoryRepository::DeleteDataset(Transaction& t, const std::string& id) {
  auto& s  = TX(t).Mutable();
  auto  it = std::find_if(s.datasets.begin(), s.datasets.end(), [&](const auto& d) { return d.id == id; });
  if (it == s.datasets.end()) return Result::Err(ErrorCode::NotFound, id);
  s.datasets.erase(it);
  return Result::Ok();
}

std::optional<std::string> MemoryRepository::GetPreferredDatasetId(Transaction& t) {
  return TX(t).View().preferred_dataset_id;
}

Result MemoryRepository::SetPreferredDatasetId(Transaction& t, const std::optional<std::string>& id) {
  TX(t).Mutable().preferred_dataset_id = id;
  return Result::Ok();
}

} // namespace threadnet::db::memory
