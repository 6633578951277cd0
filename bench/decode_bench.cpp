#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "flowlog/log_file_reader.hpp"
#include "flowlog/log_reader.hpp"
#include "flowlog/wire_format.hpp"

namespace fs = std::filesystem;
using clk = std::chrono::steady_clock;

static void put16(std::vector<std::uint8_t>& o, std::uint16_t v) { o.push_back(v >> 8); o.push_back(v & 0xFF); }
static void put32(std::vector<std::uint8_t>& o, std::uint32_t v) { put16(o, v >> 16); put16(o, v & 0xFFFF); }
static void put64(std::vector<std::uint8_t>& o, std::uint64_t v) { put32(o, v >> 32); put32(o, v & 0xFFFFFFFF); }

// v1 record with recv_time, protocol, src/dst addr, ports, packets, octets, flow_times.
static void append_record(std::vector<std::uint8_t>& out, std::uint32_t i) {
  std::vector<std::uint8_t> body;
  put32(body, 1700000000u + i); put32(body, i % 1000000u);        // bit 0
  body.push_back(i % 2 ? 6 : 17);                                 // bit 1
  body.push_back(4); put32(body, 0x0A000000u | (i & 0xFFFF));      // bit 5
  body.push_back(4); put32(body, 0xC0000200u | (i & 0xFF));        // bit 6
  put16(body, 1024 + i % 60000); put16(body, 443);                 // bits 8, 9
  put64(body, 1 + i % 100); put64(body, 64 * (1 + i % 100));       // bits 10, 11
  put32(body, i); put32(body, i + 250);                            // bit 14
  const std::uint16_t mask = (1u << 0) | (1u << 1) | (1u << 5) | (1u << 6) |
                             (1u << 8) | (1u << 9) | (1u << 10) | (1u << 11) | (1u << 14);

  out.insert(out.end(), fl::kRecordMagic.begin(), fl::kRecordMagic.end());
  out.push_back(1);
  put16(out, static_cast<std::uint16_t>(fl::kPrefixBytes + 2 + body.size()));
  put16(out, mask);
  out.insert(out.end(), body.begin(), body.end());
}

static std::string make_synth_log(std::size_t records, std::size_t junk_every) {
  fs::path p = fs::temp_directory_path() / "fl_bench_synth.flog";
  std::vector<std::uint8_t> buf;
  buf.reserve(records * 64);
  for (std::size_t r = 0; r < records; ++r) {
    append_record(buf, static_cast<std::uint32_t>(r));
    if (junk_every && (r % junk_every) == junk_every - 1) {
      for (int k = 0; k < 5; ++k) buf.push_back(0xAB);
    }
  }
  std::ofstream out(p, std::ios::binary);
  out.write(reinterpret_cast<const char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
  out.flush();
  return p.string();
}

struct Args {
  std::string path;              // if empty -> synth
  std::size_t records = 500'000; // for synth
  std::size_t junk_every = 0;    // insert garbage after every N records (synth only)
  std::size_t chunk = 512 * 1024;
  bool lenient = false;
  int iters = 3;
};

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i=1;i<argc;++i){
    std::string s(argv[i]);
    auto eq = s.find('=');
    auto key = s.substr(0, eq);
    auto val = (eq==std::string::npos) ? "" : s.substr(eq+1);
    if (key=="--file") a.path = val;
    else if (key=="--records") a.records = std::stoull(val);
    else if (key=="--junk-every") a.junk_every = std::stoull(val);
    else if (key=="--chunk") a.chunk = std::stoull(val);
    else if (key=="--lenient") a.lenient = true;
    else if (key=="--iters") a.iters = std::stoi(val);
    else if (key=="--help" || key=="-h") {
      std::cout <<
        "Usage: fl_bench_decode [--file=path] [--records=N] [--junk-every=N] [--chunk=BYTES] [--lenient] [--iters=K]\n"
        "If --file is omitted, a synthetic v1 flow log is generated.\n";
      std::exit(0);
    }
  }
  return a;
}

static void bench_file(const Args& a, const std::string& path) {
  std::cout << "\n[decode] file=" << path << " chunk=" << a.chunk
            << " policy=" << (a.lenient ? "lenient" : "strict") << " iters=" << a.iters << "\n";
  for (int k=1;k<=a.iters;++k) {
    fl::DecoderConfig dcfg;
    dcfg.recovery = a.lenient ? fl::RecoveryPolicy::Lenient : fl::RecoveryPolicy::Strict;
    fl::LogFileReader::Config rcfg;
    rcfg.chunk_bytes = a.chunk;
    fl::LogFileReader rd(path, dcfg, rcfg);
    std::uint64_t nrec=0, nerr=0, octets=0;

    auto t0 = clk::now();
    rd.for_each_outcome([&](const fl::DecodeOutcome& o){
      if (o.ok()) { ++nrec; if (o.record.octets) octets += *o.record.octets; }
      else ++nerr;
      return true;
    });
    auto t1 = clk::now();

    const double sec = std::chrono::duration<double>(t1-t0).count();
    const double mib = rd.bytes_read() / (1024.0*1024.0);
    std::cout << "  iter " << k
              << ": records=" << nrec
              << " errors=" << nerr
              << " octets=" << octets
              << " bytes=" << rd.bytes_read()
              << " time=" << sec << "s"
              << "  throughput=" << (mib/sec) << " MiB/s"
              << "  records/s=" << (nrec/sec) << "\n";
  }
}

int main(int argc, char** argv){
  Args a = parse_args(argc, argv);

  std::string path = a.path;
  if (path.empty() || !fs::exists(path)) path = make_synth_log(a.records, a.junk_every);
  bench_file(a, path);
  return 0;
}
