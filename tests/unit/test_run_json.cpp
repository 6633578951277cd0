#include "flowlog/log_reader.hpp"
#include "flowlog/metrics.hpp"
#include "flowlog/run_json.hpp"
#include "../support/record_builder.hpp"

#include <simdjson.h>
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using namespace fltest;

int main(){
  // Two readers folded into one registry
  fl::MetricsRegistry m;
  {
    fl::DecoderConfig lenient;
    lenient.recovery = fl::RecoveryPolicy::Lenient;
    fl::LogReader a(lenient);
    a.feed(view(cat({https_flow_record(), Bytes{1, 2}, https_flow_record()})));
    a.close();
    while (a.next()) {}

    fl::LogReader b;
    b.feed(view(https_flow_record()));
    b.close();
    while (b.next()) {}

    m.start_stage("decode");
    m.end_stage("decode");
    m.end_stage("never_started");
    m.add_file(); m.add_file();
    m.add_bytes(a.stats().bytes_fed + b.stats().bytes_fed);
    m.add_reader(a.stats());
    m.add_reader(b.stats());
  }

  fl::RunStats s = m.snapshot(1000.0);
  check(s.files == 2, __LINE__);
  check(s.records == 3, __LINE__);
  check(s.errors == 1, __LINE__);
  check(s.skipped_regions == 1, __LINE__);
  check(s.skipped_bytes == 2, __LINE__);
  check(s.errors_by_kind["bad_magic"] == 1, __LINE__);
  check(s.stages.size() == 1 && s.stages[0].name == "decode", __LINE__);
  check(s.records_per_sec == 3.0, __LINE__);

  fl::RunJsonPayload p;
  p.stats = s;
  p.wall_time_ms = 1000.0;
  p.recovery_policy = "lenient";
  fl::RunJsonFile f;
  f.path = "dir/with \"quote\".flog";
  f.records = 2;
  f.errors = 1;
  f.final_state = "end_of_stream";
  f.last_error = "bad_magic";
  f.last_error_offset = 22;
  p.files.push_back(f);

  const std::string json = fl::RunJsonWriter::to_json(p);

  simdjson::ondemand::parser parser;
  simdjson::padded_string buf(json);
  auto doc = parser.iterate(buf);
  check(doc["records"].get_uint64().value_or(0) == 3, __LINE__);
  check(doc["skipped_bytes"].get_uint64().value_or(0) == 2, __LINE__);
  check(doc["recovery_policy"].get_string().value_or("") == "lenient", __LINE__);
  check(doc["errors_by_kind"]["bad_magic"].get_uint64().value_or(0) == 1, __LINE__);

  bool saw_input = false;
  auto inputs = doc["inputs"].get_array();
  for (auto in : inputs) {
    std::string_view path = in["path"].get_string().value_or("");
    check(path == "dir/with \"quote\".flog", __LINE__);
    check(in["last_error_offset"].get_uint64().value_or(0) == 22, __LINE__);
    saw_input = true;
  }
  check(saw_input, __LINE__);

  // write_file makes parent directories
  const fs::path root = fs::temp_directory_path() / "flowlog_test_run_json";
  fs::remove_all(root);
  std::string err;
  check(fl::RunJsonWriter::write_file((root / "a" / "run.json").string(), json, &err), __LINE__);
  check(fs::file_size(root / "a" / "run.json") == json.size(), __LINE__);
  fs::remove_all(root);

  m.reset();
  check(m.snapshot(0.0).records == 0, __LINE__);

  if (g_failures) return 1;
  std::cout << "[PASS] run_json\n";
  return 0;
}
