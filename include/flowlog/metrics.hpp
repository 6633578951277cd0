#pragma once
#include "flowlog/decode_error.hpp"
#include "flowlog/flow_record.hpp"
#include "flowlog/log_reader.hpp"

#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace fl {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct RunStats {
  std::uint64_t files = 0;
  std::uint64_t records = 0;
  std::uint64_t errors = 0;
  std::uint64_t unrecognized = 0;
  std::uint64_t skipped_regions = 0;
  std::uint64_t skipped_bytes = 0;
  std::uint64_t bytes = 0;
  double throughput_mb_s = 0.0;
  double records_per_sec = 0.0;

  std::vector<StageTiming> stages;
  std::unordered_map<std::string, std::uint64_t> errors_by_kind;
};

class MetricsRegistry {
public:
  void reset();
  void add_file() noexcept { ++files_; }
  void add_bytes(std::uint64_t b) noexcept { bytes_ += b; }

  // Folds one reader's counters in once it is done.
  void add_reader(const LogReader::Stats& s);

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t files_{0};
  std::uint64_t records_{0};
  std::uint64_t errors_{0};
  std::uint64_t unrecognized_{0};
  std::uint64_t skipped_regions_{0};
  std::uint64_t skipped_bytes_{0};
  std::uint64_t bytes_{0};
  std::unordered_map<std::string, std::uint64_t> kind_errs_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
