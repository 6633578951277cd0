#pragma once
#include "flowlog/decoder_config.hpp"
#include "flowlog/flow_record.hpp"
#include "flowlog/log_reader.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace fl {

// Feeds a flow log file into a LogReader in fixed-size chunks.
class LogFileReader {
public:
  struct Config {
    std::size_t chunk_bytes = 512 * 1024;                // 512 KiB
    bool        follow      = false;                     // keep polling at EOF (file still being written)
    std::chrono::milliseconds poll_interval{200};
  };

  explicit LogFileReader(std::string path);                   // default configs
  LogFileReader(std::string path, DecoderConfig dcfg);
  LogFileReader(std::string path, DecoderConfig dcfg, Config cfg);

  ~LogFileReader();

  LogFileReader(const LogFileReader&) = delete;
  LogFileReader& operator=(const LogFileReader&) = delete;

  // Return false from the callback to stop early (at a record boundary).
  using OutcomeCallback = std::function<bool(const DecodeOutcome&)>;

  // Runs until end of stream, a terminal error, the callback says stop or
  // request_stop() is called. Returns false on open/read failure; the
  // failure is also delivered to the callback as a SourceIo outcome.
  bool for_each_outcome(const OutcomeCallback& cb);

  // Safe to call from another thread; ends follow mode at the next poll.
  void request_stop() noexcept;

  int last_error() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  const LogReader& reader() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
