#include "flowlog/flow_record.hpp"
#include <arpa/inet.h>
#include <algorithm>
#include <utility>

namespace fl {

std::string IpAddress::to_string() const {
  char buf[INET6_ADDRSTRLEN] = {0};
  const int af = (family == AddressFamily::IPv6) ? AF_INET6 : AF_INET;
  if (!inet_ntop(af, bytes.data(), buf, sizeof(buf))) return std::string();
  return std::string(buf);
}

bool IpAddress::operator==(const IpAddress& o) const noexcept {
  return family == o.family && std::equal(bytes.begin(), bytes.begin() + size(), o.bytes.begin());
}

bool FlowRecord::has(FieldId id) const noexcept {
  switch (id) {
    case FieldId::RecvTime:    return recv_time.has_value();
    case FieldId::Protocol:    return protocol.has_value();
    case FieldId::TcpFlags:    return tcp_flags.has_value();
    case FieldId::Tos:         return tos.has_value();
    case FieldId::AgentAddr:   return agent_addr.has_value();
    case FieldId::SrcAddr:     return src_addr.has_value();
    case FieldId::DstAddr:     return dst_addr.has_value();
    case FieldId::GatewayAddr: return gateway_addr.has_value();
    case FieldId::SrcPort:     return src_port.has_value();
    case FieldId::DstPort:     return dst_port.has_value();
    case FieldId::Packets:     return packets.has_value();
    case FieldId::Octets:      return octets.has_value();
    case FieldId::IfIndexIn:   return if_index_in.has_value();
    case FieldId::IfIndexOut:  return if_index_out.has_value();
    case FieldId::FlowTimes:   return flow_times.has_value();
    case FieldId::SrcAs:       return src_as.has_value();
    case FieldId::DstAs:       return dst_as.has_value();
    case FieldId::SrcMask:     return src_mask.has_value();
    case FieldId::DstMask:     return dst_mask.has_value();
    case FieldId::Tag:         return tag.has_value();
    case FieldId::AgentInfo:   return agent_info.has_value();
    case FieldId::EngineInfo:  return engine_info.has_value();
  }
  return false;
}

std::size_t FlowRecord::field_count() const noexcept {
  std::size_t n = 0;
  for (std::size_t i = 0; i < kFieldCount; ++i)
    if (has(static_cast<FieldId>(i))) ++n;
  return n;
}

std::vector<FieldId> FlowRecord::present_fields() const {
  std::vector<FieldId> out;
  for (std::size_t i = 0; i < kFieldCount; ++i) {
    auto id = static_cast<FieldId>(i);
    if (has(id)) out.push_back(id);
  }
  return out;
}

DecodeOutcome DecodeOutcome::make_record(FlowRecord r, RecordDiagnostics d, std::uint64_t offset) {
  DecodeOutcome o;
  o.kind = Kind::Record;
  o.offset = offset;
  o.record = std::move(r);
  o.diag = d;
  return o;
}

DecodeOutcome DecodeOutcome::make_error(DecodeError e) {
  DecodeOutcome o;
  o.kind = Kind::Error;
  o.offset = e.offset;
  o.error = std::move(e);
  return o;
}

}
