#include "flowlog/decoder_config.hpp"
#include "flowlog/wire_format.hpp"

#include <simdjson.h>
#include <algorithm>
#include <cctype>
#include <string>

namespace fl {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

static void set_err(std::string* err, std::string msg) {
  if (err) *err = std::move(msg);
}

const char* to_string(RecoveryPolicy p) noexcept {
  return p == RecoveryPolicy::Lenient ? "lenient" : "strict";
}

std::optional<RecoveryPolicy> parse_recovery_policy(std::string_view s) {
  if (ieq(s, "strict"))  return RecoveryPolicy::Strict;
  if (ieq(s, "lenient")) return RecoveryPolicy::Lenient;
  return std::nullopt;
}

bool DecoderConfig::knows_version(std::uint8_t v) const noexcept {
  return std::find(known_versions.begin(), known_versions.end(), v) != known_versions.end();
}

bool DecoderConfig::validate(std::string* err) const {
  if (known_versions.empty()) { set_err(err, "known_versions is empty"); return false; }
  for (auto v : known_versions) {
    if (!find_format(v)) {
      set_err(err, "no field table for format version " + std::to_string(v));
      return false;
    }
  }
  if (max_record_size < max_header_size()) {
    set_err(err, "max_record_size " + std::to_string(max_record_size) +
                 " is smaller than a record header");
    return false;
  }
  if (max_record_size > kMaxRecordLen) {
    set_err(err, "max_record_size " + std::to_string(max_record_size) +
                 " exceeds the 16-bit declared_length field");
    return false;
  }
  return true;
}

std::optional<DecoderConfig> parse_decoder_config(std::string_view json, std::string* err) {
  DecoderConfig cfg;

  thread_local simdjson::ondemand::parser parser;
  simdjson::padded_string buf(json);

  try {
    auto doc = parser.iterate(buf);
    simdjson::ondemand::object obj = doc.get_object();
    for (auto field : obj) {
      std::string_view key = field.unescaped_key().value();
      simdjson::ondemand::value v = field.value();

      if (key == "recovery_policy") {
        std::string_view s = v.get_string().value();
        auto p = parse_recovery_policy(s);
        if (!p) { set_err(err, "recovery_policy must be strict or lenient, got '" + std::string(s) + "'"); return std::nullopt; }
        cfg.recovery = *p;
      } else if (key == "max_record_size") {
        cfg.max_record_size = static_cast<std::size_t>(v.get_uint64().value());
      } else if (key == "known_versions") {
        cfg.known_versions.clear();
        simdjson::ondemand::array arr = v.get_array();
        for (auto e : arr) {
          std::uint64_t n = e.get_uint64().value();
          if (n > 0xFF) { set_err(err, "known_versions entry out of range: " + std::to_string(n)); return std::nullopt; }
          cfg.known_versions.push_back(static_cast<std::uint8_t>(n));
        }
      }
    }
  } catch (const simdjson::simdjson_error& e) {
    set_err(err, std::string("config parse error: ") + e.what());
    return std::nullopt;
  }

  if (!cfg.validate(err)) return std::nullopt;
  return cfg;
}

std::optional<DecoderConfig> load_decoder_config(const std::string& path, std::string* err) {
  auto loaded = simdjson::padded_string::load(path);
  if (loaded.error()) {
    set_err(err, "cannot read config " + path + ": " + simdjson::error_message(loaded.error()));
    return std::nullopt;
  }
  const simdjson::padded_string& text = loaded.value_unsafe();
  return parse_decoder_config(std::string_view(text.data(), text.size()), err);
}

}
