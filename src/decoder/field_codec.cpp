#include "flowlog/field_codec.hpp"

namespace fl::codec {

namespace {

constexpr std::uint32_t kMicrosPerSecond = 1000000;
constexpr std::uint8_t  kMaxPrefixLen    = 128;

// Restores the cursor unless commit() was called.
class Mark {
public:
  explicit Mark(ByteCursor& c) noexcept : c_(c), pos_(c.position()) {}
  ~Mark() { if (!done_) c_.rewind_to(pos_); }
  void commit() noexcept { done_ = true; }
private:
  ByteCursor& c_;
  std::size_t pos_;
  bool done_{false};
};

template <class T, class Fn>
DecodeErrorKind decode_into(ByteCursor& c, std::optional<T>& slot, Fn fn) noexcept {
  T v{};
  DecodeErrorKind k = fn(c, v);
  if (k == DecodeErrorKind::None) slot = v;
  return k;
}

template <class T>
DecodeErrorKind uint_into(ByteCursor& c, std::optional<T>& slot) noexcept {
  return decode_into(c, slot, [](ByteCursor& cc, T& v) { return decode_uint(cc, v); });
}

}

DecodeErrorKind decode_uint(ByteCursor& c, std::uint8_t& out) noexcept {
  return c.read_u8(out) ? DecodeErrorKind::None : DecodeErrorKind::Truncated;
}

DecodeErrorKind decode_uint(ByteCursor& c, std::uint16_t& out) noexcept {
  return c.read_u16(out) ? DecodeErrorKind::None : DecodeErrorKind::Truncated;
}

DecodeErrorKind decode_uint(ByteCursor& c, std::uint32_t& out) noexcept {
  return c.read_u32(out) ? DecodeErrorKind::None : DecodeErrorKind::Truncated;
}

DecodeErrorKind decode_uint(ByteCursor& c, std::uint64_t& out) noexcept {
  return c.read_u64(out) ? DecodeErrorKind::None : DecodeErrorKind::Truncated;
}

DecodeErrorKind decode_blob(ByteCursor& c, std::size_t n, std::uint8_t* out) noexcept {
  return c.read_exact(n, out) ? DecodeErrorKind::None : DecodeErrorKind::Truncated;
}

DecodeErrorKind decode_address(ByteCursor& c, IpAddress& out) noexcept {
  Mark m(c);
  std::uint8_t tag = 0;
  if (!c.read_u8(tag)) return DecodeErrorKind::Truncated;

  IpAddress a;
  switch (tag) {
    case static_cast<std::uint8_t>(AddressFamily::IPv4): a.family = AddressFamily::IPv4; break;
    case static_cast<std::uint8_t>(AddressFamily::IPv6): a.family = AddressFamily::IPv6; break;
    default: return DecodeErrorKind::UnknownAddressFamily;
  }
  if (auto k = decode_blob(c, a.size(), a.bytes.data()); k != DecodeErrorKind::None) return k;

  out = a;
  m.commit();
  return DecodeErrorKind::None;
}

DecodeErrorKind decode_timestamp(ByteCursor& c, Timestamp& out) noexcept {
  Mark m(c);
  Timestamp t;
  if (!c.read_u32(t.seconds) || !c.read_u32(t.micros)) return DecodeErrorKind::Truncated;
  if (t.micros >= kMicrosPerSecond) return DecodeErrorKind::Malformed;
  out = t;
  m.commit();
  return DecodeErrorKind::None;
}

DecodeErrorKind decode_flow_times(ByteCursor& c, FlowTimes& out) noexcept {
  Mark m(c);
  FlowTimes t;
  if (!c.read_u32(t.start_ms) || !c.read_u32(t.finish_ms)) return DecodeErrorKind::Truncated;
  if (t.finish_ms < t.start_ms) return DecodeErrorKind::Malformed;
  out = t;
  m.commit();
  return DecodeErrorKind::None;
}

DecodeErrorKind decode_prefix_len(ByteCursor& c, std::uint8_t& out) noexcept {
  Mark m(c);
  std::uint8_t v = 0;
  if (!c.read_u8(v)) return DecodeErrorKind::Truncated;
  if (v > kMaxPrefixLen) return DecodeErrorKind::Malformed;
  out = v;
  m.commit();
  return DecodeErrorKind::None;
}

DecodeErrorKind decode_agent_info(ByteCursor& c, AgentInfo& out) noexcept {
  Mark m(c);
  AgentInfo a;
  if (!c.read_u32(a.sys_uptime_ms) || !c.read_u32(a.export_secs) ||
      !c.read_u32(a.export_nsecs)  || !c.read_u16(a.netflow_version))
    return DecodeErrorKind::Truncated;
  if (a.export_nsecs >= 1000000000u) return DecodeErrorKind::Malformed;
  out = a;
  m.commit();
  return DecodeErrorKind::None;
}

DecodeErrorKind decode_engine_info(ByteCursor& c, EngineInfo& out) noexcept {
  Mark m(c);
  EngineInfo e;
  if (!c.read_u8(e.engine_type) || !c.read_u8(e.engine_id) || !c.read_u32(e.flow_sequence))
    return DecodeErrorKind::Truncated;
  out = e;
  m.commit();
  return DecodeErrorKind::None;
}

DecodeErrorKind decode_field(ByteCursor& c, FieldId id, FlowRecord& rec) noexcept {
  switch (id) {
    case FieldId::RecvTime:    return decode_into(c, rec.recv_time, decode_timestamp);
    case FieldId::Protocol:    return uint_into(c, rec.protocol);
    case FieldId::TcpFlags:    return uint_into(c, rec.tcp_flags);
    case FieldId::Tos:         return uint_into(c, rec.tos);
    case FieldId::AgentAddr:   return decode_into(c, rec.agent_addr, decode_address);
    case FieldId::SrcAddr:     return decode_into(c, rec.src_addr, decode_address);
    case FieldId::DstAddr:     return decode_into(c, rec.dst_addr, decode_address);
    case FieldId::GatewayAddr: return decode_into(c, rec.gateway_addr, decode_address);
    case FieldId::SrcPort:     return uint_into(c, rec.src_port);
    case FieldId::DstPort:     return uint_into(c, rec.dst_port);
    case FieldId::Packets:     return uint_into(c, rec.packets);
    case FieldId::Octets:      return uint_into(c, rec.octets);
    case FieldId::IfIndexIn:   return uint_into(c, rec.if_index_in);
    case FieldId::IfIndexOut:  return uint_into(c, rec.if_index_out);
    case FieldId::FlowTimes:   return decode_into(c, rec.flow_times, decode_flow_times);
    case FieldId::SrcAs:       return uint_into(c, rec.src_as);
    case FieldId::DstAs:       return uint_into(c, rec.dst_as);
    case FieldId::SrcMask:     return decode_into(c, rec.src_mask, decode_prefix_len);
    case FieldId::DstMask:     return decode_into(c, rec.dst_mask, decode_prefix_len);
    case FieldId::Tag:         return uint_into(c, rec.tag);
    case FieldId::AgentInfo:   return decode_into(c, rec.agent_info, decode_agent_info);
    case FieldId::EngineInfo:  return decode_into(c, rec.engine_info, decode_engine_info);
  }
  return DecodeErrorKind::Malformed;
}

}
