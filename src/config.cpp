#include "sv2/config.hpp"
#include "sv2/error.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace sv2 {

void validate_config(const FrameLimits& cfg) {
  ensure(cfg.max_payload_len >= 1 && cfg.max_payload_len <= kMaxPayloadLen,
         ErrorCode::InvalidConfig, "max_payload_len out of range");
}

void validate_config(const EncryptorConfig& cfg) {
  ensure(cfg.max_payload_len >= 1 && cfg.max_payload_len <= kMaxPayloadLen,
         ErrorCode::InvalidConfig, "encryptor max_payload_len out of range");
}

void validate_config(const CertificateConfig& cfg) {
  ensure(cfg.validity_secs > 0, ErrorCode::InvalidConfig, "validity_secs must be positive");
}

void validate_config(const PoolConfig& cfg) {
  ensure(!cfg.bind_host.empty(), ErrorCode::InvalidConfig, "bind_host is empty");
  ensure(cfg.port != 0, ErrorCode::InvalidConfig, "port must be non-zero");
  ensure(!cfg.keys_dir.empty(), ErrorCode::InvalidConfig, "keys_dir is empty");
  validate_config(cfg.certificate);
  validate_config(cfg.encryptor);
}

void validate_config(const MinerConfig& cfg) {
  ensure(!cfg.host.empty(), ErrorCode::InvalidConfig, "host is empty");
  ensure(cfg.port != 0, ErrorCode::InvalidConfig, "port must be non-zero");
  ensure(!cfg.authority_pub_path.empty(), ErrorCode::InvalidConfig,
         "authority_pub_path is empty");
  ensure(!cfg.user_identity.empty() && cfg.user_identity.size() <= 255,
         ErrorCode::InvalidConfig, "user_identity must be 1..255 bytes");
  ensure(std::isfinite(cfg.nominal_hash_rate) && cfg.nominal_hash_rate >= 0.0f,
         ErrorCode::InvalidConfig, "nominal_hash_rate must be finite and non-negative");
  validate_config(cfg.encryptor);
}

static unsigned long parse_unsigned(const std::string& text, const char* field,
                                    unsigned long max) {
  const std::string bad = std::string(field) + " must be a number in 1.." + std::to_string(max);
  if (text.empty() || text[0] < '0' || text[0] > '9') throw Error(ErrorCode::InvalidConfig, bad);
  std::size_t used = 0;
  unsigned long v = 0;
  try {
    v = std::stoul(text, &used, 10);
  } catch (const std::logic_error&) {
    throw Error(ErrorCode::InvalidConfig, bad);
  }
  if (used != text.size() || v == 0 || v > max) throw Error(ErrorCode::InvalidConfig, bad);
  return v;
}

std::uint16_t parse_port(const std::string& text) {
  return static_cast<std::uint16_t>(
      parse_unsigned(text, "port", std::numeric_limits<std::uint16_t>::max()));
}

std::uint32_t parse_validity_secs(const std::string& text) {
  return static_cast<std::uint32_t>(
      parse_unsigned(text, "validity_secs", std::numeric_limits<std::uint32_t>::max()));
}

} // namespace sv2
