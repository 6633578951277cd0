#include "flowlog/decoder_config.hpp"
#include "flowlog/log_file_reader.hpp"
#include "flowlog/log_reader.hpp"
#include "flowlog/metrics.hpp"
#include "flowlog/run_json.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct Cli {
  std::string config_path;
  std::string run_json;
  std::string recovery;          // overrides config when set
  long max_record_size = -1;     // overrides config when >= 0
  bool follow = false;
  bool verbose = false;
  std::vector<std::string> files;
};

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    if (eat("--config=", &c.config_path)) continue;
    if (eat("--run-json=", &c.run_json)) continue;
    if (eat("--recovery=", &c.recovery)) continue;
    if (a.rfind("--max-record-size=", 0) == 0) {
      c.max_record_size = std::strtol(a.c_str() + std::string("--max-record-size=").size(), nullptr, 10);
      continue;
    }
    if (a == "--lenient") { c.recovery = "lenient"; continue; }
    if (a == "--strict")  { c.recovery = "strict";  continue; }
    if (a == "--follow")  { c.follow = true;  continue; }
    if (a == "-v" || a == "--verbose") { c.verbose = true; continue; }
    if (a == "-h" || a == "--help") {
      std::cout <<
        "Usage: flowscan [--config=FILE] [--strict|--lenient|--recovery=MODE]\n"
        "                [--max-record-size=N] [--follow] [--run-json=PATH] [-v]\n"
        "                <flow-log> [<flow-log> ...]\n";
      std::exit(0);
    }
    c.files.push_back(a);
  }
  return c;
}

std::atomic<fl::LogFileReader*> g_following{nullptr};

extern "C" void on_sigint(int) {
  if (fl::LogFileReader* r = g_following.load()) r->request_stop();
}

bool build_config(const Cli& cli, fl::DecoderConfig& out) {
  std::string err;
  if (!cli.config_path.empty()) {
    auto loaded = fl::load_decoder_config(cli.config_path, &err);
    if (!loaded) { std::cerr << "[config] " << err << "\n"; return false; }
    out = *loaded;
  }
  if (!cli.recovery.empty()) {
    auto p = fl::parse_recovery_policy(cli.recovery);
    if (!p) { std::cerr << "[config] unknown recovery policy: " << cli.recovery << "\n"; return false; }
    out.recovery = *p;
  }
  if (cli.max_record_size >= 0) out.max_record_size = static_cast<std::size_t>(cli.max_record_size);
  if (!out.validate(&err)) { std::cerr << "[config] " << err << "\n"; return false; }
  return true;
}

// 0 = clean, 1 = I/O failure, 3 = decode errors
int scan_one_file(const std::string& path,
                  const fl::DecoderConfig& dcfg,
                  const Cli& cli,
                  fl::MetricsRegistry& metrics,
                  fl::RunJsonPayload& payload) {
  fl::LogFileReader::Config rcfg;
  rcfg.follow = cli.follow;
  fl::LogFileReader reader(path, dcfg, rcfg);

  g_following.store(cli.follow ? &reader : nullptr);
  metrics.start_stage("decode");
  const bool io_ok = reader.for_each_outcome([&](const fl::DecodeOutcome& o){
    if (!o.ok()) {
      std::cerr << "[scan] " << path << ": " << fl::to_string(o.error.kind)
                << " at offset " << o.error.offset;
      if (!o.error.detail.empty()) std::cerr << " (" << o.error.detail << ")";
      std::cerr << "\n";
    } else if (cli.verbose && o.diag.unrecognized_fields_present()) {
      std::cerr << "[scan] " << path << ": record at offset " << o.offset
                << " has unrecognized fields (" << o.diag.skipped_bytes << " bytes skipped)\n";
    }
    return true;
  });
  metrics.end_stage("decode");
  g_following.store(nullptr);

  const auto& st = reader.reader().stats();
  metrics.add_file();
  metrics.add_bytes(reader.bytes_read());
  metrics.add_reader(st);

  fl::RunJsonFile f;
  f.path = path;
  f.bytes = reader.bytes_read();
  f.records = st.records;
  f.errors = st.errors;
  f.final_state = fl::to_string(reader.reader().state());
  if (st.last_error) {
    f.last_error = fl::to_string(st.last_error.kind);
    f.last_error_offset = st.last_error.offset;
  }
  payload.files.push_back(f);

  if (!io_ok) {
    std::cerr << "[scan] read failed: " << path << "\n";
    return 1;
  }
  if (reader.reader().state() == fl::LogReader::State::Failed) {
    std::cerr << "[scan] " << path << ": decoded " << st.records
              << " records, then failed at byte offset " << st.last_error.offset
              << " with reason " << fl::to_string(st.last_error.kind) << "\n";
    return 3;
  }
  std::cout << "[scan] " << (st.errors ? "done: " : "ok: ") << path
            << " records=" << st.records
            << " errors=" << st.errors
            << " skipped_regions=" << st.skipped_regions
            << " skipped_bytes=" << st.skipped_bytes << "\n";
  return st.errors ? 3 : 0;
}

}

int main(int argc, char** argv) {
  auto cli = parse_cli(argc, argv);
  if (cli.files.empty()) {
    std::cerr << "flowscan: no input files (see --help)\n";
    return 2;
  }

  fl::DecoderConfig dcfg;
  if (!build_config(cli, dcfg)) return 2;
  if (cli.follow) std::signal(SIGINT, on_sigint);

  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  fl::MetricsRegistry metrics;
  fl::RunJsonPayload payload;
  payload.recovery_policy = fl::to_string(dcfg.recovery);

  int rc = 0;
  for (const auto& f : cli.files) {
    int r = scan_one_file(f, dcfg, cli, metrics, payload);
    if (r > rc) rc = r;
  }

  const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
  payload.wall_time_ms = wall_ms;
  payload.stats = metrics.snapshot(wall_ms);

  if (!cli.run_json.empty()) {
    std::string err;
    if (!fl::RunJsonWriter::write_file(cli.run_json, fl::RunJsonWriter::to_json(payload), &err)) {
      std::cerr << "[scan] run.json: " << err << "\n";
      return 2;
    }
  }
  return rc;
}
