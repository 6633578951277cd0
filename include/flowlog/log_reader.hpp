#pragma once
#include "flowlog/decode_error.hpp"
#include "flowlog/decoder_config.hpp"
#include "flowlog/flow_record.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fl {

// Incremental decoder over one byte stream.
//
// Bytes go in with feed(); outcomes come out of next(), one per record
// attempt. next() returns std::nullopt when it needs more bytes (suspended)
// or when the sequence is over; finished() tells the two apart. close()
// says no more bytes will arrive, fail() reports a broken source.
// A reader may be abandoned between any two next() calls; no partial record
// is ever handed out.
class LogReader {
public:
  enum class State {
    AwaitingHeader,
    AwaitingBody,
    RecordReady,
    Discarding,    // lenient: skipping a record of an unsupported version
    Resyncing,     // lenient: scanning for the next record magic
    EndOfStream,
    Failed,
  };

  struct Stats {
    std::uint64_t records         = 0;
    std::uint64_t errors          = 0;
    std::uint64_t unrecognized    = 0;   // records with unrecognized fields present
    std::uint64_t skipped_regions = 0;   // resyncs + discarded records
    std::uint64_t skipped_bytes   = 0;
    std::uint64_t bytes_fed       = 0;
    std::uint64_t bytes_consumed  = 0;
    std::array<std::uint64_t, kDecodeErrorKinds> errors_by_kind{};
    DecodeError last_error;
  };

  explicit LogReader(DecoderConfig cfg = {});
  ~LogReader();

  LogReader(const LogReader&) = delete;
  LogReader& operator=(const LogReader&) = delete;

  // Append bytes. Returns false once the stream is closed, failed or finished.
  bool feed(const std::uint8_t* data, std::size_t n);
  bool feed(std::string_view bytes);

  void close() noexcept;
  void fail(std::string detail);

  std::optional<DecodeOutcome> next();

  bool finished() const noexcept;
  bool closed() const noexcept;
  State state() const noexcept;

  // Stream offset of the first byte not yet consumed.
  std::uint64_t offset() const noexcept;
  std::size_t buffered() const noexcept;

  const Stats& stats() const noexcept;
  const DecoderConfig& config() const noexcept;

private:
  struct Impl; Impl* p_;
};

const char* to_string(LogReader::State s) noexcept;

}
