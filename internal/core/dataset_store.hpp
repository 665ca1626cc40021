#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/tlv/meshcop_tlv.hpp"
#include "internal/util/time.hpp"

namespace threadnet::core {

/*
  A stored operational dataset as seen by callers.

  network name, pan id, extended pan id and channel are derived from the TLV
  on demand and never persisted.
*/
struct Dataset {
  std::string     id;
  std::string     source;
  std::string     tlv;
  util::TimePoint created;
  bool            preferred = false;

  tlv::OperationalDataset decoded;

  std::optional<std::string> NetworkName() const {
    return decoded.NetworkName();
  }
  std::optional<std::string> PanId() const {
    return decoded.PanId();
  }
  std::optional<std::string> ExtendedPanId() const {
    return decoded.ExtendedPanId();
  }
  std::optional<uint32_t> Channel() const {
    return decoded.Channel();
  }
};

/*
  DatasetStore

  Owns the set of known Thread operational datasets.

  Invariants:
  - ids are unique
  - a non-empty store has exactly one preferred dataset
  - the preferred dataset cannot be deleted while others exist
  - List() preserves insertion order

  Every mutation commits a repository transaction before the in-memory state
  changes; a failed commit leaves the store untouched and throws
  util::PersistenceError. One lock covers decode, mutate and persist.
*/
class DatasetStore {
 public:
  explicit DatasetStore(std::shared_ptr<db::Repository> repository);

  // Rebuilds the in-memory collection from the repository. A missing or
  // dangling preferred reference on a non-empty store is repaired to the
  // first dataset.
  void Load();

  // Returns the existing entry when an identical dataset is already stored.
  // Throws util::InvalidFormat when the TLV does not decode.
  Dataset Add(const std::string& source, const std::string& tlv);

  Dataset                Get(const std::string& id) const;
  std::optional<Dataset> Find(const std::string& id) const;
  std::vector<Dataset>   List() const;

  void Delete(const std::string& id);

  void                       SetPreferred(const std::string& id);
  std::optional<Dataset>     Preferred() const;
  std::optional<std::string> PreferredId() const;

  std::size_t Size() const;

 private:
  struct Entry {
    db::model::DatasetRecord record;
    tlv::OperationalDataset  decoded;
  };

  Dataset ToDataset(const Entry& entry) const;

  std::vector<Entry>::const_iterator FindEntry(const std::string& id) const;

  template <typename Fn>
  void RunInTransaction(const std::string& context, Fn&& fn);

  std::string NewIdLocked() const;

  std::shared_ptr<db::Repository> repository_;

  mutable std::mutex         mutex_;
  std::vector<Entry>         entries_;
  std::optional<std::string> preferred_id_;
};

} // namespace threadnet::core
