#include "flowlog/log_file_reader.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <cctype>
#include <cstring>

namespace fs = std::filesystem;

static bool ieq_ext(const std::string& s, const char* ext) {
  if (s.size() != std::strlen(ext)) return false;
  for (size_t i = 0; i < s.size(); ++i)
    if (std::tolower(static_cast<unsigned char>(s[i])) != std::tolower(static_cast<unsigned char>(ext[i]))) return false;
  return true;
}

static bool expected_ok_for(const fs::path& p) {
  const std::string n = p.filename().string();
  if (n.find("bad") != std::string::npos) return false;
  if (n.find("malformed") != std::string::npos) return false;
  if (n.find("truncated") != std::string::npos) return false;
  return true;
}

struct Res {
  bool ok{true};
  uint64_t records{0};
  uint64_t errors{0};
  uint64_t bytes{0};
  fl::DecodeError first_error;
  std::string final_state;
};

static Res run(const fs::path& f, fl::RecoveryPolicy policy) {
  Res r;
  fl::DecoderConfig cfg;
  cfg.recovery = policy;
  fl::LogFileReader reader(f.string(), cfg);
  bool io_ok = reader.for_each_outcome([&](const fl::DecodeOutcome& o){
    if (o.ok()) { ++r.records; return true; }
    if (!r.errors) r.first_error = o.error;
    ++r.errors;
    return true;
  });
  r.ok = io_ok && r.errors == 0;
  r.bytes = reader.bytes_read();
  r.final_state = fl::to_string(reader.reader().state());
  return r;
}

int main(int argc, char** argv){
  fs::path dir = (argc > 1) ? fs::path(argv[1]) : fs::path("tests/data");
  if (!fs::exists(dir)) {
    std::cerr << "[ERR] fixtures dir not found: " << dir << "\n";
    return 2;
  }

  size_t total=0, passed=0, failed=0;
  for (auto& it : fs::directory_iterator(dir)) {
    if (!it.is_regular_file()) continue;
    const fs::path p = it.path();
    if (!ieq_ext(p.extension().string(), ".flog")) continue;

    const Res strict = run(p, fl::RecoveryPolicy::Strict);
    const Res lenient = run(p, fl::RecoveryPolicy::Lenient);

    const bool expect_ok = expected_ok_for(p);
    // Lenient never yields fewer records than strict on the same bytes.
    const bool verdict = (strict.ok == expect_ok) && lenient.records >= strict.records;

    ++total; verdict ? ++passed : ++failed;

    std::cout << (verdict ? "[PASS] " : "[FAIL] ") << p.filename().string()
              << "  records=" << strict.records
              << "  lenient_records=" << lenient.records
              << "  bytes=" << strict.bytes
              << "  final=" << strict.final_state
              << "  expected_ok=" << (expect_ok?"true":"false");
    if (!verdict) std::cout << "  actual_ok=" << (strict.ok?"true":"false");
    std::cout << "\n";
    if (strict.errors)
      std::cout << "       error: " << fl::to_string(strict.first_error.kind)
                << " at offset " << strict.first_error.offset
                << " (" << strict.first_error.detail << ")\n";
  }

  if (total == 0) {
    std::cerr << "[ERR] no .flog fixtures in " << dir << "\n";
    return 2;
  }
  std::cout << "\nSummary: total=" << total << " passed=" << passed << " failed=" << failed << "\n";
  return failed == 0 ? 0 : 1;
}
