#include "flowlog/log_reader.hpp"
#include "flowlog/byte_cursor.hpp"
#include "flowlog/record_decoder.hpp"
#include "flowlog/wire_format.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace fl {

namespace {
constexpr std::size_t kCompactThreshold = 64 * 1024;
}

struct LogReader::Impl {
  DecoderConfig cfg;
  std::vector<std::uint8_t> buf;
  std::size_t head{0};        // first unconsumed byte in buf
  std::uint64_t base{0};      // stream offset of buf[head]
  State state{State::AwaitingHeader};
  bool is_closed{false};
  bool io_failed{false};
  std::string io_detail;
  std::size_t discard_left{0};
  std::uint64_t discard_at{0};  // stream offset of the record being discarded
  RecordHeader pending;       // valid while AwaitingBody
  Stats stats;

  explicit Impl(DecoderConfig c) : cfg(std::move(c)) {}

  std::size_t avail() const noexcept { return buf.size() - head; }
  ByteCursor cursor() const noexcept { return ByteCursor(buf.data() + head, avail(), base); }

  void consume(std::size_t n) {
    head += n;
    base += n;
    stats.bytes_consumed += n;
    if (head == buf.size()) {
      buf.clear();
      head = 0;
    } else if (head >= kCompactThreshold && head * 2 >= buf.size()) {
      buf.erase(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(head));
      head = 0;
    }
  }

  void skip(std::size_t n) {
    consume(n);
    stats.skipped_bytes += n;
  }

  DecodeOutcome error_outcome(DecodeError err) {
    ++stats.errors;
    ++stats.errors_by_kind[static_cast<std::size_t>(err.kind)];
    stats.last_error = err;
    return DecodeOutcome::make_error(std::move(err));
  }

  DecodeOutcome terminal(DecodeError err) {
    state = State::Failed;
    return error_outcome(std::move(err));
  }

  // Strict: stop. Lenient: step past the bad record start and hunt for magic.
  DecodeOutcome structural(DecodeError err) {
    if (!cfg.lenient()) return terminal(std::move(err));
    ++stats.skipped_regions;
    skip(1);
    state = State::Resyncing;
    return error_outcome(std::move(err));
  }

  // Drop bytes up to the next magic. Keeps a possible partial magic at the
  // tail of the buffer when none is found.
  bool scan_for_magic() {
    const std::uint8_t* first = buf.data() + head;
    const std::uint8_t* last = buf.data() + buf.size();
    const std::uint8_t* hit = std::search(first, last, kRecordMagic.begin(), kRecordMagic.end());
    if (hit != last) {
      skip(static_cast<std::size_t>(hit - first));
      return true;
    }
    const std::size_t keep = std::min(avail(), kMagicBytes - 1);
    skip(avail() - keep);
    return false;
  }

  std::optional<DecodeOutcome> step() {
    if (io_failed && state != State::Failed) {
      DecodeError e;
      e.kind = DecodeErrorKind::SourceIo;
      e.offset = stats.bytes_fed;
      e.detail = io_detail;
      return terminal(std::move(e));
    }

    for (;;) {
      switch (state) {
        case State::EndOfStream:
        case State::Failed:
          return std::nullopt;

        case State::RecordReady:
          state = State::AwaitingHeader;
          continue;

        case State::Discarding: {
          const std::size_t n = std::min(discard_left, avail());
          skip(n);
          discard_left -= n;
          if (discard_left == 0) { state = State::AwaitingHeader; continue; }
          if (!is_closed) return std::nullopt;
          DecodeError e;
          e.kind = DecodeErrorKind::Truncated;
          e.offset = discard_at;
          e.detail = "stream closed inside a skipped record, " +
                     std::to_string(discard_left) + " bytes short";
          return terminal(std::move(e));
        }

        case State::Resyncing:
          if (scan_for_magic()) { state = State::AwaitingHeader; continue; }
          if (is_closed) {
            skip(avail());
            state = State::EndOfStream;
          }
          return std::nullopt;

        case State::AwaitingHeader: {
          if (avail() == 0) {
            if (is_closed) state = State::EndOfStream;
            return std::nullopt;
          }
          ByteCursor c = cursor();
          DecodeError err;
          if (decode_header(c, cfg, pending, err)) {
            state = State::AwaitingBody;
            continue;
          }
          switch (err.kind) {
            case DecodeErrorKind::Truncated:
              if (is_closed) return terminal(std::move(err));
              return std::nullopt;
            case DecodeErrorKind::UnsupportedVersion:
              if (cfg.lenient() && pending.declared_length >= kPrefixBytes) {
                ++stats.skipped_regions;
                discard_left = pending.declared_length;
                discard_at = base;
                state = State::Discarding;
                return error_outcome(std::move(err));
              }
              return structural(std::move(err));
            default:
              return structural(std::move(err));
          }
        }

        case State::AwaitingBody: {
          if (avail() < pending.declared_length) {
            if (!is_closed) return std::nullopt;
            DecodeError e;
            e.kind = DecodeErrorKind::Truncated;
            e.offset = base;
            e.detail = "stream closed inside a record of " +
                       std::to_string(pending.declared_length) + " bytes";
            return terminal(std::move(e));
          }

          ByteCursor c = cursor();
          const std::uint64_t at = base;
          FlowRecord rec;
          RecordDiagnostics diag;
          DecodeError err;
          if (c.skip(pending.header_size) && decode_body(c, pending, rec, diag, err)) {
            consume(pending.declared_length);
            ++stats.records;
            if (diag.unrecognized_fields_present()) ++stats.unrecognized;
            state = State::RecordReady;
            return DecodeOutcome::make_record(std::move(rec), diag, at);
          }
          if (is_structural(err.kind)) return structural(std::move(err));

          // A bad field value spoils this record only; its extent is still known.
          consume(pending.declared_length);
          state = State::AwaitingHeader;
          return error_outcome(std::move(err));
        }
      }
    }
  }
};

LogReader::LogReader(DecoderConfig cfg) : p_(new Impl(std::move(cfg))) {}
LogReader::~LogReader() { delete p_; }

bool LogReader::feed(const std::uint8_t* data, std::size_t n) {
  if (p_->is_closed || p_->io_failed || finished()) return false;
  p_->buf.insert(p_->buf.end(), data, data + n);
  p_->stats.bytes_fed += n;
  return true;
}

bool LogReader::feed(std::string_view bytes) {
  return feed(reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size());
}

void LogReader::close() noexcept { p_->is_closed = true; }

void LogReader::fail(std::string detail) {
  if (finished()) return;
  p_->io_failed = true;
  p_->io_detail = std::move(detail);
}

std::optional<DecodeOutcome> LogReader::next() { return p_->step(); }

bool LogReader::finished() const noexcept {
  return p_->state == State::EndOfStream || p_->state == State::Failed;
}

bool LogReader::closed() const noexcept { return p_->is_closed; }
LogReader::State LogReader::state() const noexcept { return p_->state; }
std::uint64_t LogReader::offset() const noexcept { return p_->base; }
std::size_t LogReader::buffered() const noexcept { return p_->avail(); }
const LogReader::Stats& LogReader::stats() const noexcept { return p_->stats; }
const DecoderConfig& LogReader::config() const noexcept { return p_->cfg; }

const char* to_string(LogReader::State s) noexcept {
  switch (s) {
    case LogReader::State::AwaitingHeader: return "awaiting_header";
    case LogReader::State::AwaitingBody:   return "awaiting_body";
    case LogReader::State::RecordReady:    return "record_ready";
    case LogReader::State::Discarding:     return "discarding";
    case LogReader::State::Resyncing:      return "resyncing";
    case LogReader::State::EndOfStream:    return "end_of_stream";
    case LogReader::State::Failed:         return "failed";
  }
  return "unknown";
}

}
