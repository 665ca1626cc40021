#include "router_registry.hpp"

#include <algorithm>

namespace threadnet::discovery {

std::vector<RouterEvent> RouterRegistry::Upsert(const std::string& service_name, const RouterRecord& record) {
  std::vector<RouterEvent> events;

  auto mapped = service_keys_.find(service_name);
  if (mapped != service_keys_.end() && mapped->second != record.key) {
    const std::string old_key = mapped->second;
    service_keys_.erase(mapped);
    if (!KeyReferenced(old_key)) {
      EraseRouter(old_key);
      events.push_back(RouterEvent::Removed(old_key));
    }
  }
  service_keys_[service_name] = record.key;

  auto it = std::find_if(routers_.begin(), routers_.end(), [&](const RouterRecord& r) { return r.key == record.key; });
  if (it == routers_.end()) {
    routers_.push_back(record);
  } else {
    *it = record;
  }

  events.push_back(RouterEvent::Discovered(record));
  return events;
}

std::optional<RouterEvent> RouterRegistry::RemoveService(const std::string& service_name) {
  auto mapped = service_keys_.find(service_name);
  if (mapped == service_keys_.end()) {
    return std::nullopt;
  }

  const std::string key = mapped->second;
  return Remove(key);
}

std::optional<RouterEvent> RouterRegistry::Remove(const std::string& key) {
  auto it = std::find_if(routers_.begin(), routers_.end(), [&](const RouterRecord& r) { return r.key == key; });
  if (it == routers_.end()) {
    return std::nullopt;
  }

  routers_.erase(it);
  std::erase_if(service_keys_, [&](const auto& entry) { return entry.second == key; });
  return RouterEvent::Removed(key);
}

void RouterRegistry::Clear() {
  routers_.clear();
  service_keys_.clear();
}

std::optional<RouterRecord> RouterRegistry::Find(const std::string& key) const {
  auto it = std::find_if(routers_.begin(), routers_.end(), [&](const RouterRecord& r) { return r.key == key; });
  if (it == routers_.end()) {
    return std::nullopt;
  }
  return *it;
}

bool RouterRegistry::KeyReferenced(const std::string& key) const {
  return std::any_of(service_keys_.begin(), service_keys_.end(), [&](const auto& entry) { return entry.second == key; });
}

void RouterRegistry::EraseRouter(const std::string& key) {
  std::erase_if(routers_, [&](const RouterRecord& r) { return r.key == key; });
}

} // namespace threadnet::discovery
