#pragma once
#include "sv2.hpp"
#include "config.hpp"
#include "crypto.hpp"
#include "framing.hpp"
#include "noise.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>

namespace sv2 {

// Encrypted frame layout:
//   ENCRYPT(6-byte header)                  22 bytes
//   ENCRYPT(payload[0 .. 65519))            chunk + 16
//   ENCRYPT(payload[65519 .. 131038)) ...   chunk + 16
// Every sealed piece is one Noise message and consumes one nonce.
static constexpr std::size_t kEncryptedHeaderLen = kHeaderLen + kTagLen;

struct DecryptedFrame {
  Frame frame;
  // Ciphertext bytes the frame occupied
  std::size_t consumed;
};

using EncryptedReadResult = std::variant<Incomplete, DecryptedFrame>;

// Transport session of one connection, built by NoiseInitiator or
// NoiseResponder::into_encryptor(). Not thread-safe: callers serialize access.
class ConnectionEncryptor {
public:
  enum class Role { Initiator, Responder };

  ConnectionEncryptor(ConnectionEncryptor&&) = default;
  ConnectionEncryptor& operator=(ConnectionEncryptor&&) = default;

  // Throws PayloadTooLarge over the configured cap and NonceExhausted when the
  // whole frame cannot be sealed with the nonces left
  Bytes encrypt(const Frame& f);

  // One whole encrypted frame. Any authentication failure, missing or trailing
  // byte throws DecryptionFailed and poisons the encryptor.
  Frame decrypt(const std::uint8_t* data, std::size_t len);
  Frame decrypt(const Bytes& data) { return decrypt(data.data(), data.size()); }

  // Streaming variant: `data` always starts at the current frame. The
  // decrypted header is kept between calls that return Incomplete.
  EncryptedReadResult read(const std::uint8_t* data, std::size_t len);

  static std::size_t encrypted_frame_size(std::size_t payload_len);

  Role role() const { return role_; }
  bool poisoned() const { return poisoned_; }
  std::uint64_t send_nonce() const { return send_.nonce(); }
  std::uint64_t recv_nonce() const { return recv_.nonce(); }
  void set_send_nonce(std::uint64_t n) { send_.set_nonce(n); }
  std::uint64_t rekey_interval() const { return cfg_.rekey_interval; }
  const Hash& handshake_hash() const { return h_; }

private:
  friend class NoiseInitiator;
  friend class NoiseResponder;

  ConnectionEncryptor(Role role, CipherState send, CipherState recv, const Hash& h,
                      const EncryptorConfig& cfg);

  Bytes seal(const std::uint8_t* pt, std::size_t n);
  // Poisons and throws DecryptionFailed on a tag mismatch
  Bytes open(const std::uint8_t* ct, std::size_t n);
  FrameHeader open_header(const std::uint8_t* ct);
  Frame open_payload(const FrameHeader& h, const std::uint8_t* ct, std::size_t len);
  [[noreturn]] void poison(ErrorCode code, const char* msg);

  Role role_;
  CipherState send_;
  CipherState recv_;
  Hash h_;
  EncryptorConfig cfg_;
  std::uint64_t sent_messages_{0};
  std::uint64_t received_messages_{0};
  std::optional<FrameHeader> pending_header_;
  bool poisoned_{false};
};

} // namespace sv2
