#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace fl {

enum class DecodeErrorKind : std::uint8_t {
  None = 0,
  Truncated,            // not enough bytes (terminal only once the source is closed)
  BadMagic,             // stream desynchronized
  UnsupportedVersion,   // magic ok, version not in the configured set
  BadLength,            // declared_length outside [header size, max_record_size]
  FieldOverrun,         // mask needs more bytes than declared_length provides
  UnknownAddressFamily,
  Malformed,
  SourceIo,             // byte source failed; always fatal
};

constexpr std::size_t kDecodeErrorKinds = 9;

const char* to_string(DecodeErrorKind k) noexcept;

// Errors that mean the stream framing can no longer be trusted.
bool is_structural(DecodeErrorKind k) noexcept;

struct DecodeError {
  DecodeErrorKind kind = DecodeErrorKind::None;
  std::uint64_t offset = 0;   // absolute stream offset
  std::string detail;

  explicit operator bool() const noexcept { return kind != DecodeErrorKind::None; }
};

}
