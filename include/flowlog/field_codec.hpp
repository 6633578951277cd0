#pragma once
#include "flowlog/byte_cursor.hpp"
#include "flowlog/decode_error.hpp"
#include "flowlog/flow_record.hpp"

#include <cstddef>
#include <cstdint>

namespace fl::codec {

// Stateless decoders, one per on-disk primitive.
// Each returns DecodeErrorKind::None on success. On failure the cursor is
// left where it was, so composite fields never half-consume.

DecodeErrorKind decode_uint(ByteCursor& c, std::uint8_t& out) noexcept;
DecodeErrorKind decode_uint(ByteCursor& c, std::uint16_t& out) noexcept;
DecodeErrorKind decode_uint(ByteCursor& c, std::uint32_t& out) noexcept;
DecodeErrorKind decode_uint(ByteCursor& c, std::uint64_t& out) noexcept;

// Opaque bytes, copied out verbatim.
DecodeErrorKind decode_blob(ByteCursor& c, std::size_t n, std::uint8_t* out) noexcept;

// Family tag (4 or 6) then exactly 4 or 16 address bytes.
DecodeErrorKind decode_address(ByteCursor& c, IpAddress& out) noexcept;

DecodeErrorKind decode_timestamp(ByteCursor& c, Timestamp& out) noexcept;
DecodeErrorKind decode_flow_times(ByteCursor& c, FlowTimes& out) noexcept;
DecodeErrorKind decode_prefix_len(ByteCursor& c, std::uint8_t& out) noexcept;
DecodeErrorKind decode_agent_info(ByteCursor& c, AgentInfo& out) noexcept;
DecodeErrorKind decode_engine_info(ByteCursor& c, EngineInfo& out) noexcept;

// Decode one field by id and store it in `rec`.
DecodeErrorKind decode_field(ByteCursor& c, FieldId id, FlowRecord& rec) noexcept;

}
