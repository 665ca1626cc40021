#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace threadnet::tlv {

/*
  MeshCoP TLV types that may appear in a Thread operational dataset.
*/
enum class MeshcopTlvType : uint8_t {
  kChannel                 = 0,
  kPanId                   = 1,
  kExtendedPanId           = 2,
  kNetworkName             = 3,
  kPskc                    = 4,
  kNetworkKey              = 5,
  kNetworkKeySequence      = 6,
  kMeshLocalPrefix         = 7,
  kSteeringData            = 8,
  kBorderAgentRloc         = 9,
  kCommissionerId          = 10,
  kCommissionerSessionId   = 11,
  kSecurityPolicy          = 12,
  kGet                     = 13,
  kActiveTimestamp         = 14,
  kCommissionerUdpPort     = 15,
  kState                   = 16,
  kJoinerDtls              = 17,
  kJoinerUdpPort           = 18,
  kJoinerIid               = 19,
  kJoinerRloc              = 20,
  kJoinerRouterKek         = 21,
  kProvisioningUrl         = 32,
  kVendorName              = 33,
  kVendorModel             = 34,
  kVendorSwVersion         = 35,
  kVendorData              = 36,
  kVendorStackVersion      = 37,
  kUdpEncapsulation        = 48,
  kIpv6Address             = 49,
  kPendingTimestamp        = 51,
  kDelayTimer              = 52,
  kChannelMask             = 53,
  kCount                   = 54,
  kPeriod                  = 55,
  kScanDuration            = 56,
  kEnergyList              = 57,
  kDiscoveryRequest        = 128,
  kDiscoveryResponse       = 129,
  kJoinerAdvertisement     = 241,
};

std::optional<MeshcopTlvType> ToMeshcopTlvType(uint8_t tag);
const char*                   MeshcopTlvTypeName(MeshcopTlvType type);

/*
  Decoded operational dataset.

  Values are kept per type: the network name as UTF-8 text, everything else
  as lowercase hex. A repeated type keeps the last occurrence. Two datasets
  compare equal when they decode to the same entries, regardless of record
  order or hex case in the source string.
*/
class OperationalDataset {
 public:
  using Entries = std::map<MeshcopTlvType, std::string>;

  // Throws util::InvalidFormat.
  static OperationalDataset Parse(std::string_view hex);

  const Entries& entries() const {
    return entries_;
  }

  std::optional<std::string> Get(MeshcopTlvType type) const;

  std::optional<std::string> NetworkName() const;
  std::optional<std::string> PanId() const;
  std::optional<std::string> ExtendedPanId() const;
  // Channel TLV is page(1) + channel(2, big endian).
  std::optional<uint32_t> Channel() const;

  bool operator==(const OperationalDataset& other) const {
    return entries_ == other.entries_;
  }

 private:
  Entries entries_;
};

} // namespace threadnet::tlv
