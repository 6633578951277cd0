#pragma once
#include "flowlog/metrics.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fl {

// Per-file line of the run summary.
struct RunJsonFile {
  std::string path;
  std::uint64_t bytes = 0;
  std::uint64_t records = 0;
  std::uint64_t errors = 0;
  std::string final_state;        // LogReader state name at the end
  std::string last_error;         // empty when the file decoded cleanly
  std::uint64_t last_error_offset = 0;
};

struct RunJsonPayload {
  RunStats stats;
  double wall_time_ms = 0.0;
  std::string recovery_policy;
  std::vector<RunJsonFile> files;
};

class RunJsonWriter {
public:
  // Serialize payload to a compact JSON string.
  static std::string to_json(const RunJsonPayload& p);

  // Write to `path`, creating parent directories.
  static bool write_file(const std::string& path, const std::string& json,
                         std::string* err_out = nullptr);
};

}
