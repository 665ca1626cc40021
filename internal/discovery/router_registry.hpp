#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/discovery/router_record.hpp"

namespace threadnet::discovery {

/*
  RouterRegistry

  In-memory table of currently known border routers keyed by a stable
  fingerprint, plus the service instance names that map to each key.
  Mutators return the events they caused, in order.

  Not thread-safe; the DiscoveryController serializes access.
*/
class RouterRegistry {
 public:
  // Always yields router_discovered for record.key, preceded by
  // router_removed when the name moved off a key nothing else references.
  std::vector<RouterEvent> Upsert(const std::string& service_name, const RouterRecord& record);

  // Removes the router the name maps to, together with every other name
  // sharing its key. Unknown names yield nothing.
  std::optional<RouterEvent> RemoveService(const std::string& service_name);

  std::optional<RouterEvent> Remove(const std::string& key);

  // Silent.
  void Clear();

  // first-discovery order
  const std::vector<RouterRecord>& Routers() const {
    return routers_;
  }

  std::optional<RouterRecord> Find(const std::string& key) const;

  std::size_t Size() const {
    return routers_.size();
  }

 private:
  bool KeyReferenced(const std::string& key) const;
  void EraseRouter(const std::string& key);

  std::vector<RouterRecord>                    routers_;
  std::unordered_map<std::string, std::string> service_keys_;
};

} // namespace threadnet::discovery
