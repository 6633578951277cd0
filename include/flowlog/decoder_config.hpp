#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fl {

// What the reader does after a structural error:
// strict  -> stop the sequence; lenient -> report it, resync, carry on
enum class RecoveryPolicy { Strict, Lenient };

const char* to_string(RecoveryPolicy p) noexcept;
std::optional<RecoveryPolicy> parse_recovery_policy(std::string_view s);

struct DecoderConfig {
  RecoveryPolicy recovery = RecoveryPolicy::Strict;
  std::size_t max_record_size = 8 * 1024;          // guard per record
  std::vector<std::uint8_t> known_versions = {1, 2};

  bool knows_version(std::uint8_t v) const noexcept;
  bool lenient() const noexcept { return recovery == RecoveryPolicy::Lenient; }

  // Rejects versions without a built-in table and unusable size limits.
  bool validate(std::string* err = nullptr) const;
};

// {"recovery_policy": "strict"|"lenient", "max_record_size": N, "known_versions": [..]}
// Missing keys keep their defaults; unknown keys are ignored.
std::optional<DecoderConfig> parse_decoder_config(std::string_view json, std::string* err = nullptr);
std::optional<DecoderConfig> load_decoder_config(const std::string& path, std::string* err = nullptr);

}
