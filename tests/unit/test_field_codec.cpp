#include "flowlog/field_codec.hpp"
#include "../support/record_builder.hpp"

#include <iostream>

using namespace fltest;
namespace codec = fl::codec;
using fl::DecodeErrorKind;

static fl::ByteCursor cur(const Bytes& b) { return fl::ByteCursor(b.data(), b.size()); }

int main(){
  // IPv4 with explicit tag
  {
    Bytes b = addr4(192, 0, 2, 7);
    auto c = cur(b);
    fl::IpAddress a;
    check(codec::decode_address(c, a) == DecodeErrorKind::None, __LINE__);
    check(a.family == fl::AddressFamily::IPv4, __LINE__);
    check(a.to_string() == "192.0.2.7", __LINE__);
    check(c.remaining() == 0, __LINE__);
  }

  // IPv6 reads exactly 16 bytes, whatever follows
  {
    Bytes b = addr6({0x20, 0x01, 0x0d, 0xb8, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1});
    append(b, {0xAA, 0xBB});
    auto c = cur(b);
    fl::IpAddress a;
    check(codec::decode_address(c, a) == DecodeErrorKind::None, __LINE__);
    check(a.family == fl::AddressFamily::IPv6, __LINE__);
    check(a.to_string() == "2001:db8::1", __LINE__);
    check(c.remaining() == 2, __LINE__);
  }

  // Unknown family tag is rejected, not guessed from the remaining length
  {
    Bytes b = {5, 10, 0, 0, 1};
    auto c = cur(b);
    fl::IpAddress a;
    check(codec::decode_address(c, a) == DecodeErrorKind::UnknownAddressFamily, __LINE__);
    check(c.position() == 0, __LINE__);
  }

  // Short IPv6 body: truncated and nothing consumed (tag included)
  {
    Bytes b = {6, 0x20, 0x01, 0x0d, 0xb8};
    auto c = cur(b);
    fl::IpAddress a;
    check(codec::decode_address(c, a) == DecodeErrorKind::Truncated, __LINE__);
    check(c.position() == 0, __LINE__);
  }

  // Timestamps pass through verbatim
  {
    Bytes b = cat({be32(1700000000u), be32(250000u)});
    auto c = cur(b);
    fl::Timestamp t;
    check(codec::decode_timestamp(c, t) == DecodeErrorKind::None, __LINE__);
    check(t.seconds == 1700000000u && t.micros == 250000u, __LINE__);

    Bytes bad = cat({be32(1), be32(1000000u)});
    auto c2 = cur(bad);
    check(codec::decode_timestamp(c2, t) == DecodeErrorKind::Malformed, __LINE__);
    check(c2.position() == 0, __LINE__);
  }

  // Flow times may not run backwards
  {
    Bytes ok = cat({be32(1000), be32(1000)});
    auto c = cur(ok);
    fl::FlowTimes t;
    check(codec::decode_flow_times(c, t) == DecodeErrorKind::None, __LINE__);
    check(t.start_ms == 1000 && t.finish_ms == 1000, __LINE__);

    Bytes back = cat({be32(2000), be32(1999)});
    auto c2 = cur(back);
    check(codec::decode_flow_times(c2, t) == DecodeErrorKind::Malformed, __LINE__);
    check(c2.position() == 0, __LINE__);
  }

  // Integers, blobs, prefix lengths
  {
    Bytes b = cat({be16(51000), be64(0x0102030405060708ull), Bytes{129}});
    auto c = cur(b);
    std::uint16_t port = 0; std::uint64_t n = 0; std::uint8_t pl = 0;
    check(codec::decode_uint(c, port) == DecodeErrorKind::None && port == 51000, __LINE__);
    check(codec::decode_uint(c, n) == DecodeErrorKind::None && n == 0x0102030405060708ull, __LINE__);
    check(codec::decode_prefix_len(c, pl) == DecodeErrorKind::Malformed, __LINE__);
    check(c.remaining() == 1, __LINE__);

    std::uint32_t w = 0;
    check(codec::decode_uint(c, w) == DecodeErrorKind::Truncated, __LINE__);

    Bytes blob = {1, 2, 3};
    auto cb = cur(blob);
    std::uint8_t out[3] = {0};
    check(codec::decode_blob(cb, 3, out) == DecodeErrorKind::None, __LINE__);
    check(out[0] == 1 && out[2] == 3, __LINE__);
  }

  // Exporter metadata
  {
    Bytes b = cat({be32(86400000u), be32(1700000000u), be32(999999999u), be16(9),
                   Bytes{1, 7}, be32(424242u)});
    auto c = cur(b);
    fl::AgentInfo ai;
    fl::EngineInfo ei;
    check(codec::decode_agent_info(c, ai) == DecodeErrorKind::None, __LINE__);
    check(ai.sys_uptime_ms == 86400000u && ai.netflow_version == 9, __LINE__);
    check(codec::decode_engine_info(c, ei) == DecodeErrorKind::None, __LINE__);
    check(ei.engine_type == 1 && ei.engine_id == 7 && ei.flow_sequence == 424242u, __LINE__);
    check(c.remaining() == 0, __LINE__);
  }

  // decode_field stores into the matching slot only
  {
    Bytes b = be16(443);
    auto c = cur(b);
    fl::FlowRecord rec;
    check(codec::decode_field(c, fl::FieldId::SrcPort, rec) == DecodeErrorKind::None, __LINE__);
    check(rec.src_port && *rec.src_port == 443, __LINE__);
    check(!rec.dst_port, __LINE__);
    check(rec.field_count() == 1, __LINE__);

    Bytes bad = {9, 1, 2, 3, 4};
    auto c2 = cur(bad);
    check(codec::decode_field(c2, fl::FieldId::GatewayAddr, rec) == DecodeErrorKind::UnknownAddressFamily, __LINE__);
    check(!rec.gateway_addr, __LINE__);
  }

  if (g_failures) return 1;
  std::cout << "[PASS] field_codec\n";
  return 0;
}
