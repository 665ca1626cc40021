#include "dataset_store.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ulid.hpp"

namespace threadnet::core {

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  std::string message = context + ": " + db::ErrorCodeName(result.code);
  if (!result.message.empty()) {
    message += ": " + result.message;
  }
  throw util::PersistenceError(message);
}

} // namespace

DatasetStore::DatasetStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("dataset store requires a repository");
  }
}

template <typename Fn>
void DatasetStore::RunInTransaction(const std::string& context, Fn&& fn) {
  try {
    auto tx = repository_->Begin();
    fn(*tx);
    tx->Commit();
  } catch (const util::PersistenceError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::PersistenceError(context + ": " + e.what());
  }
}

void DatasetStore::Load() {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<db::model::DatasetRecord> records;
  std::optional<std::string>            preferred;

  RunInTransaction("load datasets", [&](db::Transaction& tx) {
    records   = repository_->ListDatasets(tx);
    preferred = repository_->GetPreferredDatasetId(tx);
  });

  std::vector<Entry>       entries;
  std::vector<std::string> undecodable;
  entries.reserve(records.size());
  for (auto& record : records) {
    try {
      auto decoded = tlv::OperationalDataset::Parse(record.tlv);
      entries.push_back(Entry{std::move(record), std::move(decoded)});
    } catch (const util::InvalidFormat& e) {
      THREADNET_LOG_WARN("dropping stored dataset with undecodable tlv",
                         {observability::StringField("dataset_id", record.id), observability::StringField("error", e.what())});
      undecodable.push_back(record.id);
    }
  }

  const bool dangling = preferred && std::none_of(entries.begin(), entries.end(), [&](const Entry& e) { return e.record.id == *preferred; });
  std::optional<std::string> repaired = preferred;
  if (entries.empty()) {
    repaired.reset();
  } else if (!preferred || dangling) {
    repaired = entries.front().record.id;
  }

  // Undecodable rows can never be read or deleted through the store, so
  // they go in the same transaction that repairs the preferred reference.
  if (repaired != preferred || !undecodable.empty()) {
    RunInTransaction("repair dataset store", [&](db::Transaction& tx) {
      for (const auto& id : undecodable) {
        ThrowIfDbError(repository_->DeleteDataset(tx, id), "drop undecodable dataset");
      }
      if (repaired != preferred) {
        ThrowIfDbError(repository_->SetPreferredDatasetId(tx, repaired), "repair preferred dataset");
      }
    });
  }
  if (repaired != preferred) {
    THREADNET_LOG_WARN("repaired preferred dataset reference",
                       {observability::StringField("previous", preferred.value_or("")), observability::StringField("preferred", repaired.value_or(""))});
  }

  entries_      = std::move(entries);
  preferred_id_ = std::move(repaired);
  observability::Metrics::Instance().SetDatasetCount(entries_.size());

  THREADNET_LOG_INFO("dataset store loaded", {observability::IntField("datasets", static_cast<int64_t>(entries_.size()))});
}

Dataset DatasetStore::Add(const std::string& source, const std::string& tlv) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto decoded = tlv::OperationalDataset::Parse(tlv);

  for (const auto& entry : entries_) {
    if (entry.decoded == decoded) {
      THREADNET_LOG_DEBUG("dataset already stored", {observability::StringField("dataset_id", entry.record.id)});
      return ToDataset(entry);
    }
  }

  Entry entry;
  entry.record.id            = NewIdLocked();
  entry.record.source        = source;
  entry.record.tlv           = tlv;
  entry.record.created_at_us = util::ToUnixMicros(util::Now());
  entry.decoded              = std::move(decoded);

  const bool becomes_preferred = entries_.empty();

  RunInTransaction("add dataset", [&](db::Transaction& tx) {
    ThrowIfDbError(repository_->InsertDataset(tx, entry.record), "add dataset");
    if (becomes_preferred) {
      ThrowIfDbError(repository_->SetPreferredDatasetId(tx, entry.record.id), "add dataset");
    }
  });

  entries_.push_back(std::move(entry));
  if (becomes_preferred) {
    preferred_id_ = entries_.back().record.id;
  }
  observability::Metrics::Instance().SetDatasetCount(entries_.size());

  THREADNET_LOG_INFO("dataset added", {observability::StringField("dataset_id", entries_.back().record.id),
                                       observability::StringField("source", source), observability::BoolField("preferred", becomes_preferred)});
  return ToDataset(entries_.back());
}

Dataset DatasetStore::Get(const std::string& id) const {
  auto dataset = Find(id);
  if (!dataset) {
    throw util::NotFound("unknown dataset");
  }
  return *dataset;
}

std::optional<Dataset> DatasetStore::Find(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = FindEntry(id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return ToDataset(*it);
}

std::vector<Dataset> DatasetStore::List() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Dataset>        out;
  out.reserve(entries_.size());
  for (const auto& entry : entries_) {
    out.push_back(ToDataset(entry));
  }
  return out;
}

void DatasetStore::Delete(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = FindEntry(id);
  if (it == entries_.end()) {
    throw util::NotFound("'" + id + "'");
  }

  const bool is_preferred = preferred_id_ && *preferred_id_ == id;
  if (is_preferred && entries_.size() > 1) {
    throw util::NotAllowed("attempt to remove preferred dataset");
  }

  RunInTransaction("delete dataset", [&](db::Transaction& tx) {
    ThrowIfDbError(repository_->DeleteDataset(tx, id), "delete dataset");
    if (is_preferred) {
      ThrowIfDbError(repository_->SetPreferredDatasetId(tx, std::nullopt), "delete dataset");
    }
  });

  entries_.erase(it);
  if (is_preferred) {
    preferred_id_.reset();
  }
  observability::Metrics::Instance().SetDatasetCount(entries_.size());

  THREADNET_LOG_INFO("dataset deleted", {observability::StringField("dataset_id", id)});
}

void DatasetStore::SetPreferred(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (FindEntry(id) == entries_.end()) {
    throw util::NotFound("unknown dataset");
  }
  if (preferred_id_ && *preferred_id_ == id) {
    return;
  }

  RunInTransaction("set preferred dataset",
                   [&](db::Transaction& tx) { ThrowIfDbError(repository_->SetPreferredDatasetId(tx, id), "set preferred dataset"); });

  preferred_id_ = id;
  THREADNET_LOG_INFO("preferred dataset changed", {observability::StringField("dataset_id", id)});
}

std::optional<Dataset> DatasetStore::Preferred() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!preferred_id_) {
    return std::nullopt;
  }
  auto it = FindEntry(*preferred_id_);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return ToDataset(*it);
}

std::optional<std::string> DatasetStore::PreferredId() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return preferred_id_;
}

std::size_t DatasetStore::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

Dataset DatasetStore::ToDataset(const Entry& entry) const {
  Dataset dataset;
  dataset.id        = entry.record.id;
  dataset.source    = entry.record.source;
  dataset.tlv       = entry.record.tlv;
  dataset.created   = util::FromUnixMicros(entry.record.created_at_us);
  dataset.preferred = preferred_id_ && *preferred_id_ == entry.record.id;
  dataset.decoded   = entry.decoded;
  return dataset;
}

std::vector<DatasetStore::Entry>::const_iterator DatasetStore::FindEntry(const std::string& id) const {
  return std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return e.record.id == id; });
}

std::string DatasetStore::NewIdLocked() const {
  for (;;) {
    auto id = util::ToString(util::GenerateULID());
    if (FindEntry(id) == entries_.end()) {
      return id;
    }
  }
}

} // namespace threadnet::core
