#include "flowlog/log_file_reader.hpp"

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <thread>
#include <utility>
#include <vector>

namespace fl {

struct LogFileReader::Impl {
  std::string path;
  Config cfg;
  LogReader reader;
  std::atomic<bool> stop{false};
  int last_errno{0};
  std::uint64_t bytes{0};

  Impl(std::string p, DecoderConfig d, Config c)
    : path(std::move(p)), cfg(c), reader(std::move(d)) {}

  // Hand every ready outcome to cb; false if cb asked to stop.
  bool drain(const OutcomeCallback& cb) {
    while (auto o = reader.next()) {
      if (!cb(*o)) return false;
    }
    return true;
  }

  bool fail_and_drain(const std::string& what, int err, const OutcomeCallback& cb) {
    last_errno = err;
    reader.fail(what + " " + path + ": " + std::strerror(last_errno));
    (void)drain(cb);
    return false;
  }

  bool for_each_outcome(const OutcomeCallback& cb) {
    FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) return fail_and_drain("open", errno, cb);

    std::vector<std::uint8_t> buf(cfg.chunk_bytes ? cfg.chunk_bytes : 1);

    while (!stop.load(std::memory_order_relaxed)) {
      std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
      if (n > 0) {
        bytes += n;
        (void)reader.feed(buf.data(), n);
        if (!drain(cb) || reader.finished()) break;
        continue;
      }
      if (std::ferror(f)) {
        const int err = errno;
        std::fclose(f);
        return fail_and_drain("read", err, cb);
      }

      // EOF
      if (cfg.follow) {
        std::clearerr(f);
        std::this_thread::sleep_for(cfg.poll_interval);
        continue;
      }
      reader.close();
      (void)drain(cb);
      break;
    }

    std::fclose(f);
    return true;
  }
};

LogFileReader::LogFileReader(std::string path)
  : LogFileReader(std::move(path), DecoderConfig{}, Config{}) {}

LogFileReader::LogFileReader(std::string path, DecoderConfig dcfg)
  : LogFileReader(std::move(path), std::move(dcfg), Config{}) {}

LogFileReader::LogFileReader(std::string path, DecoderConfig dcfg, Config cfg)
  : p_(new Impl(std::move(path), std::move(dcfg), cfg)) {}

LogFileReader::~LogFileReader() { delete p_; }

bool LogFileReader::for_each_outcome(const OutcomeCallback& cb) { return p_->for_each_outcome(cb); }
void LogFileReader::request_stop() noexcept { p_->stop.store(true, std::memory_order_relaxed); }
int  LogFileReader::last_error() const noexcept { return p_->last_errno; }
std::uint64_t LogFileReader::bytes_read() const noexcept { return p_->bytes; }
const LogReader& LogFileReader::reader() const noexcept { return p_->reader; }

}
