#include "flowlog/decode_error.hpp"

namespace fl {

const char* to_string(DecodeErrorKind k) noexcept {
  switch (k) {
    case DecodeErrorKind::None:                 return "none";
    case DecodeErrorKind::Truncated:            return "truncated";
    case DecodeErrorKind::BadMagic:             return "bad_magic";
    case DecodeErrorKind::UnsupportedVersion:   return "unsupported_version";
    case DecodeErrorKind::BadLength:            return "bad_length";
    case DecodeErrorKind::FieldOverrun:         return "field_overrun";
    case DecodeErrorKind::UnknownAddressFamily: return "unknown_address_family";
    case DecodeErrorKind::Malformed:            return "malformed";
    case DecodeErrorKind::SourceIo:             return "source_io";
  }
  return "unknown";
}

bool is_structural(DecodeErrorKind k) noexcept {
  switch (k) {
    case DecodeErrorKind::BadMagic:
    case DecodeErrorKind::UnsupportedVersion:
    case DecodeErrorKind::BadLength:
    case DecodeErrorKind::FieldOverrun:
      return true;
    default:
      return false;
  }
}

}
