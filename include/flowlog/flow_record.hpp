#pragma once
#include "flowlog/decode_error.hpp"
#include "flowlog/wire_format.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fl {

struct IpAddress {
  AddressFamily family = AddressFamily::IPv4;
  std::array<std::uint8_t, 16> bytes{};   // only size() leading bytes are used

  std::size_t size() const noexcept { return family == AddressFamily::IPv6 ? 16 : 4; }
  std::string to_string() const;

  bool operator==(const IpAddress& o) const noexcept;
  bool operator!=(const IpAddress& o) const noexcept { return !(*this == o); }
};

// Collector receive time, passed through untouched (no timezone handling).
struct Timestamp {
  std::uint32_t seconds = 0;
  std::uint32_t micros  = 0;
};

// Agent-uptime relative, milliseconds.
struct FlowTimes {
  std::uint32_t start_ms  = 0;
  std::uint32_t finish_ms = 0;
};

struct AgentInfo {
  std::uint32_t sys_uptime_ms   = 0;
  std::uint32_t export_secs     = 0;
  std::uint32_t export_nsecs    = 0;
  std::uint16_t netflow_version = 0;
};

struct EngineInfo {
  std::uint8_t  engine_type   = 0;
  std::uint8_t  engine_id     = 0;
  std::uint32_t flow_sequence = 0;
};

// One decoded record. A field is engaged iff its bit was set in the mask.
struct FlowRecord {
  std::uint8_t format_version = 0;

  std::optional<Timestamp>     recv_time;
  std::optional<std::uint8_t>  protocol;
  std::optional<std::uint8_t>  tcp_flags;
  std::optional<std::uint8_t>  tos;
  std::optional<IpAddress>     agent_addr;
  std::optional<IpAddress>     src_addr;
  std::optional<IpAddress>     dst_addr;
  std::optional<IpAddress>     gateway_addr;
  std::optional<std::uint16_t> src_port;
  std::optional<std::uint16_t> dst_port;
  std::optional<std::uint64_t> packets;
  std::optional<std::uint64_t> octets;
  std::optional<std::uint32_t> if_index_in;
  std::optional<std::uint32_t> if_index_out;
  std::optional<FlowTimes>     flow_times;
  std::optional<std::uint32_t> src_as;
  std::optional<std::uint32_t> dst_as;
  std::optional<std::uint8_t>  src_mask;
  std::optional<std::uint8_t>  dst_mask;
  std::optional<std::uint32_t> tag;
  std::optional<AgentInfo>     agent_info;
  std::optional<EngineInfo>    engine_info;

  bool has(FieldId id) const noexcept;
  std::size_t field_count() const noexcept;

  // Present fields in canonical order.
  std::vector<FieldId> present_fields() const;
};

// Non-fatal "unrecognized fields present" condition.
struct RecordDiagnostics {
  std::uint32_t unknown_mask_bits = 0;   // set bits past the version's field list
  std::size_t   skipped_bytes     = 0;   // declared bytes left after the known fields

  bool unrecognized_fields_present() const noexcept {
    return unknown_mask_bits != 0 || skipped_bytes != 0;
  }
};

struct DecodeOutcome {
  enum class Kind { Record, Error };

  Kind kind = Kind::Error;
  std::uint64_t offset = 0;   // stream offset of the record (or error)
  FlowRecord record;          // Kind::Record only
  RecordDiagnostics diag;     // Kind::Record only
  DecodeError error;          // Kind::Error only

  bool ok() const noexcept { return kind == Kind::Record; }

  static DecodeOutcome make_record(FlowRecord r, RecordDiagnostics d, std::uint64_t offset);
  static DecodeOutcome make_error(DecodeError e);
};

}
