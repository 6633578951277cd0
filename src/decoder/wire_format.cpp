#include "flowlog/wire_format.hpp"
#include <algorithm>

namespace fl {

namespace {

constexpr FieldId kV1Fields[] = {
  FieldId::RecvTime, FieldId::Protocol, FieldId::TcpFlags, FieldId::Tos,
  FieldId::AgentAddr, FieldId::SrcAddr, FieldId::DstAddr, FieldId::GatewayAddr,
  FieldId::SrcPort, FieldId::DstPort, FieldId::Packets, FieldId::Octets,
  FieldId::IfIndexIn, FieldId::IfIndexOut, FieldId::FlowTimes,
};

// v2 keeps v1's bits and appends AS/tag/exporter metadata.
constexpr FieldId kV2Fields[] = {
  FieldId::RecvTime, FieldId::Protocol, FieldId::TcpFlags, FieldId::Tos,
  FieldId::AgentAddr, FieldId::SrcAddr, FieldId::DstAddr, FieldId::GatewayAddr,
  FieldId::SrcPort, FieldId::DstPort, FieldId::Packets, FieldId::Octets,
  FieldId::IfIndexIn, FieldId::IfIndexOut, FieldId::FlowTimes,
  FieldId::SrcAs, FieldId::DstAs, FieldId::SrcMask, FieldId::DstMask,
  FieldId::Tag, FieldId::AgentInfo, FieldId::EngineInfo,
};

constexpr FormatVersion kFormats[] = {
  {1, 2, kV1Fields, sizeof(kV1Fields) / sizeof(kV1Fields[0])},
  {2, 4, kV2Fields, sizeof(kV2Fields) / sizeof(kV2Fields[0])},
};

}

const char* field_name(FieldId id) noexcept {
  switch (id) {
    case FieldId::RecvTime:    return "recv_time";
    case FieldId::Protocol:    return "protocol";
    case FieldId::TcpFlags:    return "tcp_flags";
    case FieldId::Tos:         return "tos";
    case FieldId::AgentAddr:   return "agent_addr";
    case FieldId::SrcAddr:     return "src_addr";
    case FieldId::DstAddr:     return "dst_addr";
    case FieldId::GatewayAddr: return "gateway_addr";
    case FieldId::SrcPort:     return "src_port";
    case FieldId::DstPort:     return "dst_port";
    case FieldId::Packets:     return "packets";
    case FieldId::Octets:      return "octets";
    case FieldId::IfIndexIn:   return "if_index_in";
    case FieldId::IfIndexOut:  return "if_index_out";
    case FieldId::FlowTimes:   return "flow_times";
    case FieldId::SrcAs:       return "src_as";
    case FieldId::DstAs:       return "dst_as";
    case FieldId::SrcMask:     return "src_mask";
    case FieldId::DstMask:     return "dst_mask";
    case FieldId::Tag:         return "tag";
    case FieldId::AgentInfo:   return "agent_info";
    case FieldId::EngineInfo:  return "engine_info";
  }
  return "unknown";
}

const FormatVersion* find_format(std::uint8_t version) noexcept {
  for (const auto& f : kFormats) if (f.version == version) return &f;
  return nullptr;
}

std::vector<std::uint8_t> builtin_versions() {
  std::vector<std::uint8_t> out;
  for (const auto& f : kFormats) out.push_back(f.version);
  return out;
}

std::size_t max_header_size() noexcept {
  std::size_t m = 0;
  for (const auto& f : kFormats) m = std::max(m, f.header_size());
  return m;
}

}
