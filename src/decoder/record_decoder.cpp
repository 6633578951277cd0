#include "flowlog/record_decoder.hpp"
#include "flowlog/field_codec.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace fl {

static DecodeError make_err(DecodeErrorKind k, std::uint64_t at, std::string detail) {
  DecodeError e;
  e.kind = k;
  e.offset = at;
  e.detail = std::move(detail);
  return e;
}

bool decode_header(ByteCursor& c, const DecoderConfig& cfg,
                   RecordHeader& out, DecodeError& err) {
  const std::size_t start = c.position();
  const std::uint64_t at = c.offset();

  // A mismatch in the bytes already present is final; no need to wait for the rest.
  const std::size_t have = std::min(c.remaining(), kMagicBytes);
  if (!std::equal(c.here(), c.here() + have, kRecordMagic.begin())) {
    err = make_err(DecodeErrorKind::BadMagic, at, "record magic mismatch");
    return false;
  }

  RecordHeader h;
  if (!c.read_exact(kMagicBytes, h.magic.data()) ||
      !c.read_u8(h.format_version) ||
      !c.read_u16(h.declared_length)) {
    c.rewind_to(start);
    err = make_err(DecodeErrorKind::Truncated, at, "short record prologue");
    return false;
  }

  h.format = cfg.knows_version(h.format_version) ? find_format(h.format_version) : nullptr;
  if (!h.format) {
    c.rewind_to(start);
    out = h;
    err = make_err(DecodeErrorKind::UnsupportedVersion, at + kMagicBytes,
                   "format version " + std::to_string(h.format_version) + " not supported");
    return false;
  }

  h.header_size = h.format->header_size();
  if (h.declared_length < h.header_size || h.declared_length > cfg.max_record_size) {
    c.rewind_to(start);
    err = make_err(DecodeErrorKind::BadLength, at + kMagicBytes + 1,
                   "declared_length " + std::to_string(h.declared_length) + " outside [" +
                   std::to_string(h.header_size) + ", " + std::to_string(cfg.max_record_size) + "]");
    return false;
  }

  std::uint32_t mask = 0;
  for (std::size_t i = 0; i < h.format->mask_bytes; ++i) {
    std::uint8_t b = 0;
    if (!c.read_u8(b)) {
      c.rewind_to(start);
      err = make_err(DecodeErrorKind::Truncated, at, "short field mask");
      return false;
    }
    mask = (mask << 8) | b;
  }
  h.field_mask = mask;
  h.unknown_bits = mask & ~h.format->known_mask();

  out = h;
  err = DecodeError{};
  return true;
}

bool decode_body(ByteCursor& c, const RecordHeader& hdr,
                 FlowRecord& out, RecordDiagnostics& diag, DecodeError& err) {
  const std::size_t start = c.position();
  if (!hdr.format) {
    err = make_err(DecodeErrorKind::UnsupportedVersion, c.offset(), "header has no field table");
    return false;
  }

  ByteCursor body;
  if (!c.window(hdr.body_size(), body)) {
    err = make_err(DecodeErrorKind::Truncated, c.offset(), "record body incomplete");
    return false;
  }

  FlowRecord rec;
  rec.format_version = hdr.format_version;
  std::uint64_t dst_at = 0;

  for (std::size_t i = 0; i < hdr.format->field_count; ++i) {
    if (!(hdr.field_mask & (1u << i))) continue;

    const FieldId id = hdr.format->fields[i];
    const std::uint64_t field_at = body.offset();
    if (id == FieldId::DstAddr) dst_at = field_at;
    const DecodeErrorKind k = codec::decode_field(body, id, rec);
    if (k == DecodeErrorKind::None) continue;

    c.rewind_to(start);
    if (k == DecodeErrorKind::Truncated) {
      // The body window holds every declared byte, so running dry here means
      // the mask asks for more than declared_length allows.
      err = make_err(DecodeErrorKind::FieldOverrun, body.offset_at(body.size()),
                     std::string(field_name(id)) + " runs past declared_length " +
                     std::to_string(hdr.declared_length));
    } else {
      err = make_err(k, field_at, std::string(field_name(id)) + ": " + to_string(k));
    }
    return false;
  }

  // Endpoints of one flow share an address family.
  if (rec.src_addr && rec.dst_addr && rec.src_addr->family != rec.dst_addr->family) {
    c.rewind_to(start);
    err = make_err(DecodeErrorKind::Malformed, dst_at, "src/dst address family mismatch");
    return false;
  }

  diag = RecordDiagnostics{};
  diag.unknown_mask_bits = hdr.unknown_bits;
  diag.skipped_bytes = body.remaining();
  out = std::move(rec);
  err = DecodeError{};
  return true;
}

DecodeOutcome decode_record(ByteCursor& c, const DecoderConfig& cfg) {
  const std::size_t start = c.position();
  const std::uint64_t at = c.offset();

  RecordHeader hdr;
  DecodeError err;
  if (!decode_header(c, cfg, hdr, err)) return DecodeOutcome::make_error(std::move(err));

  FlowRecord rec;
  RecordDiagnostics diag;
  if (!decode_body(c, hdr, rec, diag, err)) {
    c.rewind_to(start);
    if (err.kind == DecodeErrorKind::Truncated) err.offset = at;
    return DecodeOutcome::make_error(std::move(err));
  }
  return DecodeOutcome::make_record(std::move(rec), diag, at);
}

}
