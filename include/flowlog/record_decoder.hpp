#pragma once
#include "flowlog/byte_cursor.hpp"
#include "flowlog/decode_error.hpp"
#include "flowlog/decoder_config.hpp"
#include "flowlog/flow_record.hpp"
#include "flowlog/wire_format.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace fl {

struct RecordHeader {
  std::array<std::uint8_t, kMagicBytes> magic{};
  std::uint8_t  format_version  = 0;
  std::uint16_t declared_length = 0;
  std::uint32_t field_mask      = 0;
  std::uint32_t unknown_bits    = 0;   // field_mask bits past the version's list
  std::size_t   header_size     = 0;
  const FormatVersion* format   = nullptr;

  std::size_t body_size() const noexcept {
    return declared_length > header_size ? declared_length - header_size : 0;
  }
};

// Parse and validate one record prologue.
// On success the cursor sits at the first body byte. On failure it is left
// unchanged and `err` says why; Truncated means "call again with more bytes".
// For UnsupportedVersion the prologue fields (version, declared_length) are
// still filled in so a lenient caller can skip the record.
bool decode_header(ByteCursor& c, const DecoderConfig& cfg,
                   RecordHeader& out, DecodeError& err);

// Decode the body described by `hdr`. Reads exactly hdr.body_size() bytes on
// success and never looks past them. On failure the cursor is left unchanged.
bool decode_body(ByteCursor& c, const RecordHeader& hdr,
                 FlowRecord& out, RecordDiagnostics& diag, DecodeError& err);

// Header + body in one step. The cursor only moves when a record is returned.
DecodeOutcome decode_record(ByteCursor& c, const DecoderConfig& cfg);

}
