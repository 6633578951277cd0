#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace fl {

// On-disk record prologue:
//   magic[4] | format_version u8 | declared_length u16 | field_mask (2 or 4 bytes)
// All integers big-endian; declared_length counts the whole record.
constexpr std::array<std::uint8_t, 4> kRecordMagic{{0xC7, 0xF1, 0x0E, 0x5D}};
constexpr std::size_t kMagicBytes   = kRecordMagic.size();
constexpr std::size_t kPrefixBytes  = kMagicBytes + 1 + 2;
constexpr std::size_t kMaxRecordLen = 0xFFFF;

// Every field any version knows, in canonical decode order.
enum class FieldId : std::uint8_t {
  RecvTime, Protocol, TcpFlags, Tos,
  AgentAddr, SrcAddr, DstAddr, GatewayAddr,
  SrcPort, DstPort, Packets, Octets,
  IfIndexIn, IfIndexOut, FlowTimes,
  SrcAs, DstAs, SrcMask, DstMask,
  Tag, AgentInfo, EngineInfo,
};

constexpr std::size_t kFieldCount = 22;

const char* field_name(FieldId id) noexcept;

// Explicit family tag preceding every address field.
enum class AddressFamily : std::uint8_t { IPv4 = 4, IPv6 = 6 };

struct FormatVersion {
  std::uint8_t version;
  std::size_t mask_bytes;
  const FieldId* fields;     // bit i of the mask selects fields[i]
  std::size_t field_count;

  std::size_t header_size() const noexcept { return kPrefixBytes + mask_bytes; }
  std::uint32_t known_mask() const noexcept {
    return field_count >= 32 ? 0xFFFFFFFFu : ((1u << field_count) - 1u);
  }
};

// Built-in tables; nullptr for a version this decoder has never heard of.
const FormatVersion* find_format(std::uint8_t version) noexcept;
std::vector<std::uint8_t> builtin_versions();
std::size_t max_header_size() noexcept;

}
