#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/discovery/service_browser.hpp"

namespace threadnet::discovery {

enum class RouterKeySource {
  kExtendedPanId,    // TXT "xp"
  kExtendedAddress,  // TXT "xa"
};

/*
  Attributes published by a border router in its _meshcop._udp TXT record.
  Text values that are absent or not valid UTF-8 are nullopt.
*/
struct RouterData {
  std::optional<std::string> brand;
  std::optional<std::string> extended_pan_id;
  std::optional<std::string> model_name;
  std::optional<std::string> network_name;
  std::optional<std::string> server;
  std::optional<std::string> vendor_name;
  std::optional<std::string> extended_address;
  std::optional<std::string> thread_version;

  std::vector<std::string> addresses;
  uint16_t                 port = 0;

  bool operator==(const RouterData&) const = default;
};

struct RouterRecord {
  std::string key;
  RouterData  data;

  bool operator==(const RouterRecord&) const = default;
};

struct RouterEvent {
  enum class Kind {
    kDiscovered,
    kRemoved,
  };

  Kind        kind = Kind::kDiscovered;
  std::string key;
  RouterData  data;  // empty for kRemoved

  static RouterEvent Discovered(const RouterRecord& record) {
    return RouterEvent{Kind::kDiscovered, record.key, record.data};
  }
  static RouterEvent Removed(const std::string& key) {
    return RouterEvent{Kind::kRemoved, key, {}};
  }
};

const char* RouterEventKindName(RouterEvent::Kind kind);

// Brand slug for a vendor name, e.g. "Google Inc." -> "google".
std::optional<std::string> KnownBrand(const std::optional<std::string>& vendor_name);

// nullopt when the TXT record carries no usable key.
std::optional<RouterRecord> BuildRouterRecord(const ServiceInfo& info, RouterKeySource key_source);

} // namespace threadnet::discovery
