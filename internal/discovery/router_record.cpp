#include "router_record.hpp"

#include <array>
#include <utility>

#include "internal/util/hex.hpp"

namespace threadnet::discovery {

namespace {

constexpr std::array<std::pair<const char*, const char*>, 10> kKnownBrands = {{
    {"Amazon", "amazon"},
    {"Apple Inc.", "apple"},
    {"Aqara", "aqara_gateway"},
    {"eero", "eero"},
    {"Google Inc.", "google"},
    {"HomeAssistant", "homeassistant"},
    {"Home Assistant", "homeassistant"},
    {"Nanoleaf", "nanoleaf"},
    {"OpenThread", "openthread"},
    {"Samsung", "samsung"},
}};

const std::optional<std::string>* Property(const ServiceInfo& info, const char* key) {
  auto it = info.properties.find(key);
  if (it == info.properties.end()) {
    return nullptr;
  }
  return &it->second;
}

std::optional<std::string> TextProperty(const ServiceInfo& info, const char* key) {
  const auto* value = Property(info, key);
  if (!value || !*value || !util::IsValidUtf8(**value)) {
    return std::nullopt;
  }
  return **value;
}

std::optional<std::string> HexProperty(const ServiceInfo& info, const char* key) {
  const auto* value = Property(info, key);
  if (!value || !*value || (*value)->empty()) {
    return std::nullopt;
  }
  return util::ToHex(**value);
}

} // namespace

const char* RouterEventKindName(RouterEvent::Kind kind) {
  switch (kind) {
    case RouterEvent::Kind::kDiscovered:
      return "discovered";
    case RouterEvent::Kind::kRemoved:
      return "removed";
  }
  return "unknown";
}

std::optional<std::string> KnownBrand(const std::optional<std::string>& vendor_name) {
  if (!vendor_name) {
    return std::nullopt;
  }
  for (const auto& [vendor, brand] : kKnownBrands) {
    if (*vendor_name == vendor) {
      return std::string(brand);
    }
  }
  return std::nullopt;
}

std::optional<RouterRecord> BuildRouterRecord(const ServiceInfo& info, RouterKeySource key_source) {
  RouterRecord record;
  auto&        data = record.data;

  data.extended_pan_id  = HexProperty(info, "xp");
  data.extended_address = HexProperty(info, "xa");

  const auto& key = key_source == RouterKeySource::kExtendedAddress ? data.extended_address : data.extended_pan_id;
  if (!key) {
    return std::nullopt;
  }
  record.key = *key;

  data.network_name   = TextProperty(info, "nn");
  data.model_name     = TextProperty(info, "mn");
  data.vendor_name    = TextProperty(info, "vn");
  data.thread_version = TextProperty(info, "tv");
  data.brand          = KnownBrand(data.vendor_name);
  if (!info.server.empty()) {
    data.server = info.server;
  }
  data.addresses = info.addresses;
  data.port      = info.port;

  return record;
}

} // namespace threadnet::discovery
