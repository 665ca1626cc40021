#include "meshcop_tlv.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace threadnet::tlv {

std::optional<MeshcopTlvType> ToMeshcopTlvType(uint8_t tag) {
  if (tag <= 21) {
    return static_cast<MeshcopTlvType>(tag);
  }
  if ((tag >= 32 && tag <= 37) || tag == 48 || tag == 49 || (tag >= 51 && tag <= 57)) {
    return static_cast<MeshcopTlvType>(tag);
  }
  if (tag == 128 || tag == 129 || tag == 241) {
    return static_cast<MeshcopTlvType>(tag);
  }
  return std::nullopt;
}

const char* MeshcopTlvTypeName(MeshcopTlvType type) {
  switch (type) {
    case MeshcopTlvType::kChannel:
      return "CHANNEL";
    case MeshcopTlvType::kPanId:
      return "PANID";
    case MeshcopTlvType::kExtendedPanId:
      return "EXTPANID";
    case MeshcopTlvType::kNetworkName:
      return "NETWORKNAME";
    case MeshcopTlvType::kPskc:
      return "PSKC";
    case MeshcopTlvType::kNetworkKey:
      return "NETWORKKEY";
    case MeshcopTlvType::kNetworkKeySequence:
      return "NETWORK_KEY_SEQUENCE";
    case MeshcopTlvType::kMeshLocalPrefix:
      return "MESHLOCALPREFIX";
    case MeshcopTlvType::kSteeringData:
      return "STEERING_DATA";
    case MeshcopTlvType::kBorderAgentRloc:
      return "BORDER_AGENT_RLOC";
    case MeshcopTlvType::kCommissionerId:
      return "COMMISSIONER_ID";
    case MeshcopTlvType::kCommissionerSessionId:
      return "COMM_SESSION_ID";
    case MeshcopTlvType::kSecurityPolicy:
      return "SECURITYPOLICY";
    case MeshcopTlvType::kGet:
      return "GET";
    case MeshcopTlvType::kActiveTimestamp:
      return "ACTIVETIMESTAMP";
    case MeshcopTlvType::kCommissionerUdpPort:
      return "COMMISSIONER_UDP_PORT";
    case MeshcopTlvType::kState:
      return "STATE";
    case MeshcopTlvType::kJoinerDtls:
      return "JOINER_DTLS";
    case MeshcopTlvType::kJoinerUdpPort:
      return "JOINER_UDP_PORT";
    case MeshcopTlvType::kJoinerIid:
      return "JOINER_IID";
    case MeshcopTlvType::kJoinerRloc:
      return "JOINER_RLOC";
    case MeshcopTlvType::kJoinerRouterKek:
      return "JOINER_ROUTER_KEK";
    case MeshcopTlvType::kProvisioningUrl:
      return "PROVISIONING_URL";
    case MeshcopTlvType::kVendorName:
      return "VENDOR_NAME";
    case MeshcopTlvType::kVendorModel:
      return "VENDOR_MODEL";
    case MeshcopTlvType::kVendorSwVersion:
      return "VENDOR_SW_VERSION";
    case MeshcopTlvType::kVendorData:
      return "VENDOR_DATA";
    case MeshcopTlvType::kVendorStackVersion:
      return "VENDOR_STACK_VERSION";
    case MeshcopTlvType::kUdpEncapsulation:
      return "UDP_ENCAPSULATION";
    case MeshcopTlvType::kIpv6Address:
      return "IPV6_ADDRESS";
    case MeshcopTlvType::kPendingTimestamp:
      return "PENDINGTIMESTAMP";
    case MeshcopTlvType::kDelayTimer:
      return "DELAYTIMER";
    case MeshcopTlvType::kChannelMask:
      return "CHANNELMASK";
    case MeshcopTlvType::kCount:
      return "COUNT";
    case MeshcopTlvType::kPeriod:
      return "PERIOD";
    case MeshcopTlvType::kScanDuration:
      return "SCAN_DURATION";
    case MeshcopTlvType::kEnergyList:
      return "ENERGY_LIST";
    case MeshcopTlvType::kDiscoveryRequest:
      return "DISCOVERYREQUEST";
    case MeshcopTlvType::kDiscoveryResponse:
      return "DISCOVERYRESPONSE";
    case MeshcopTlvType::kJoinerAdvertisement:
      return "JOINERADVERTISEMENT";
  }
  return "UNKNOWN";
}

OperationalDataset OperationalDataset::Parse(std::string_view hex) {
  auto bytes = util::FromHex(hex);
  if (!bytes) {
    throw util::InvalidFormat("invalid hex string");
  }

  OperationalDataset dataset;
  const std::string& data   = *bytes;
  size_t             offset = 0;

  while (offset < data.size()) {
    const auto tag  = static_cast<uint8_t>(data[offset]);
    const auto type = ToMeshcopTlvType(tag);
    if (!type) {
      throw util::InvalidFormat("unknown type " + std::to_string(tag), offset);
    }

    if (offset + 1 >= data.size()) {
      throw util::InvalidFormat(std::string("missing length for ") + MeshcopTlvTypeName(*type), offset);
    }

    const size_t length    = static_cast<uint8_t>(data[offset + 1]);
    const size_t available = data.size() - (offset + 2);
    if (available < length) {
      throw util::InvalidFormat("expected " + std::to_string(length) + " bytes for " + MeshcopTlvTypeName(*type) + ", got " +
                                    std::to_string(available),
                                offset);
    }

    std::string_view value(data.data() + offset + 2, length);
    if (*type == MeshcopTlvType::kNetworkName) {
      if (!util::IsValidUtf8(value)) {
        throw util::InvalidFormat("invalid network name", offset);
      }
      dataset.entries_[*type] = std::string(value);
    } else {
      dataset.entries_[*type] = util::ToHex(value);
    }

    offset += 2 + length;
  }

  return dataset;
}

std::optional<std::string> OperationalDataset::Get(MeshcopTlvType type) const {
  auto it = entries_.find(type);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> OperationalDataset::NetworkName() const {
  return Get(MeshcopTlvType::kNetworkName);
}

std::optional<std::string> OperationalDataset::PanId() const {
  return Get(MeshcopTlvType::kPanId);
}

std::optional<std::string> OperationalDataset::ExtendedPanId() const {
  return Get(MeshcopTlvType::kExtendedPanId);
}

std::optional<uint32_t> OperationalDataset::Channel() const {
  auto value = Get(MeshcopTlvType::kChannel);
  if (!value || value->size() != 6) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(std::stoul(value->substr(2), nullptr, 16));
}

} // namespace threadnet::tlv
