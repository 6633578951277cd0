#include "flowlog/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace fl {

void MetricsRegistry::reset() {
  files_ = records_ = errors_ = unrecognized_ = 0;
  skipped_regions_ = skipped_bytes_ = bytes_ = 0;
  kind_errs_.clear();
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::add_reader(const LogReader::Stats& s) {
  records_ += s.records;
  errors_ += s.errors;
  unrecognized_ += s.unrecognized;
  skipped_regions_ += s.skipped_regions;
  skipped_bytes_ += s.skipped_bytes;
  for (std::size_t i = 0; i < s.errors_by_kind.size(); ++i) {
    if (s.errors_by_kind[i] == 0) continue;
    kind_errs_[to_string(static_cast<DecodeErrorKind>(i))] += s.errors_by_kind[i];
  }
}

void MetricsRegistry::start_stage(std::string_view name) {
  stage_starts_[std::string(name)] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_ms_[key] += static_cast<std::uint64_t>(ms);
  stage_starts_.erase(it);
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.files = files_;
  r.records = records_;
  r.errors = errors_;
  r.unrecognized = unrecognized_;
  r.skipped_regions = skipped_regions_;
  r.skipped_bytes = skipped_bytes_;
  r.bytes = bytes_;
  r.throughput_mb_s = (wall_ms > 0.0) ? (bytes_ / (1024.0*1024.0)) / (wall_ms / 1000.0) : 0.0;
  r.records_per_sec = (wall_ms > 0.0) ? records_ / (wall_ms / 1000.0) : 0.0;

  r.errors_by_kind = kind_errs_;
  r.stages.reserve(stage_accum_ms_.size());
  for (auto& kv : stage_accum_ms_) r.stages.push_back(StageTiming{kv.first, kv.second});
  std::sort(r.stages.begin(), r.stages.end(),
            [](const StageTiming& a, const StageTiming& b) { return a.name < b.name; });
  return r;
}

}
