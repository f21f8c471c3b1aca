#pragma once
#include "sv2.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace sv2 {

// Cap applied to frame payload lengths before any buffer is allocated
struct FrameLimits {
  std::uint32_t max_payload_len = kMaxPayloadLen;
};

struct EncryptorConfig {
  std::uint32_t max_payload_len = kMaxPayloadLen;
  // Rekey both directions after this many Noise messages; 0 disables
  std::uint64_t rekey_interval = 0;
};

struct CertificateConfig {
  std::uint16_t version = 0;
  std::uint32_t validity_secs = 24 * 60 * 60;
};

struct PoolConfig {
  std::string bind_host = "0.0.0.0";
  std::uint16_t port = 3336;
  std::string keys_dir;
  CertificateConfig certificate;
  EncryptorConfig encryptor;
};

struct MinerConfig {
  std::string host;
  std::uint16_t port = 3336;
  std::string authority_pub_path;
  std::string user_identity;
  float nominal_hash_rate = 1.0e12f;
  EncryptorConfig encryptor;
};

// Each throws Error(InvalidConfig) naming the first bad field
void validate_config(const FrameLimits& cfg);
void validate_config(const EncryptorConfig& cfg);
void validate_config(const CertificateConfig& cfg);
void validate_config(const PoolConfig& cfg);
void validate_config(const MinerConfig& cfg);

// Command-line values; out of range or non-numeric text throws Error(InvalidConfig)
std::uint16_t parse_port(const std::string& text);
std::uint32_t parse_validity_secs(const std::string& text);

} // namespace sv2
