#include "flowlog/run_json.hpp"
#include <cmath> // std::isfinite
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fl {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:   o << c;      break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  const RunStats& s = p.stats;
  std::ostringstream o;
  o << "{";
  o << "\"files\":" << s.files << ",";
  o << "\"records\":" << s.records << ",";
  o << "\"errors\":" << s.errors << ",";
  o << "\"unrecognized\":" << s.unrecognized << ",";
  o << "\"skipped_regions\":" << s.skipped_regions << ",";
  o << "\"skipped_bytes\":" << s.skipped_bytes << ",";
  o << "\"bytes\":" << s.bytes << ",";
  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(s.throughput_mb_s) << ",";
  o << "\"records_per_sec\":" << safe_num(s.records_per_sec) << ",";
  o << "\"recovery_policy\":"; esc(o, p.recovery_policy); o << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<s.stages.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, s.stages[i].name);
    o << ",\"duration_ms\":" << s.stages[i].duration_ms << "}";
  }
  o << "],";

  o << "\"errors_by_kind\":{";
  bool first=true;
  for (auto& kv : s.errors_by_kind) {
    if (!first) o << ",";
    first=false;
    esc(o, kv.first); o << ":" << kv.second;
  }
  o << "},";

  o << "\"inputs\":[";
  for (size_t i=0;i<p.files.size();++i){
    if (i) o << ",";
    const auto& f = p.files[i];
    o << "{\"path\":"; esc(o, f.path);
    o << ",\"bytes\":"   << f.bytes
      << ",\"records\":" << f.records
      << ",\"errors\":"  << f.errors;
    o << ",\"final_state\":"; esc(o, f.final_state);
    o << ",\"last_error\":";  esc(o, f.last_error);
    o << ",\"last_error_offset\":" << f.last_error_offset << "}";
  }
  o << "]";

  o << "}";
  return o.str();
}

bool RunJsonWriter::write_file(const std::string& path, const std::string& json,
                               std::string* err_out) {
  const std::filesystem::path out(path);
  std::error_code ec;
  if (out.has_parent_path()) std::filesystem::create_directories(out.parent_path(), ec);
  if (ec) {
    if (err_out) *err_out = "cannot create " + out.parent_path().string() + ": " + ec.message();
    return false;
  }
  std::ofstream rj(out, std::ios::binary);
  if (!rj) {
    if (err_out) *err_out = "failed to write " + path;
    return false;
  }
  rj.write(json.data(), static_cast<std::streamsize>(json.size()));
  if (!rj) {
    if (err_out) *err_out = "short write to " + path;
    return false;
  }
  return true;
}

}
