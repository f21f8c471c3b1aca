#pragma once
#include "sv2.hpp"
#include "certificate.hpp"
#include "config.hpp"
#include "crypto.hpp"
#include "util.hpp"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <variant>

namespace sv2 {

static constexpr const char* kNoiseProtocolName = "Noise_NX_25519_ChaChaPoly_BLAKE2s";

static constexpr std::size_t kMaxNoiseMessageLen = 65535;
static constexpr std::size_t kMaxChunkPlaintextLen = kMaxNoiseMessageLen - kTagLen;

// -> e [payload]
static constexpr std::size_t kHandshakeFirstMessageMinLen = kKeyLen;
// <- e, ee, s, es, SignatureNoiseMessage
static constexpr std::size_t kHandshakeSecondMessageLen =
    kKeyLen + (kKeyLen + kTagLen) + (SignatureNoiseMessage::kSerializedLen + kTagLen);

// 2^64-1 is reserved for rekey
static constexpr std::uint64_t kReservedNonce = (std::numeric_limits<std::uint64_t>::max)();

class ConnectionEncryptor;

class CipherState {
public:
  CipherState() = default;
  explicit CipherState(SecureBytes key);

  bool has_key() const { return has_key_; }
  std::uint64_t nonce() const { return n_; }
  void set_nonce(std::uint64_t n) { n_ = n; }

  // Without a key the plaintext passes through. Throws NonceExhausted at 2^64-1.
  Bytes encrypt_with_ad(const std::uint8_t* ad, std::size_t ad_len,
                        const std::uint8_t* pt, std::size_t pt_len);

  // False on a tag mismatch; the nonce only advances on success
  bool decrypt_with_ad(const std::uint8_t* ad, std::size_t ad_len,
                       const std::uint8_t* ct, std::size_t ct_len, Bytes& out);

  // k = ENCRYPT(k, 2^64-1, "", zeros)[0:32]; the nonce is kept
  void rekey();

private:
  SecureBytes k_;
  bool has_key_{false};
  std::uint64_t n_{0};
};

class SymmetricState {
public:
  explicit SymmetricState(const std::string& protocol_name);

  void mix_hash(const std::uint8_t* data, std::size_t n);
  void mix_key(const std::uint8_t* ikm, std::size_t n);

  Bytes encrypt_and_hash(const std::uint8_t* pt, std::size_t n);
  bool decrypt_and_hash(const std::uint8_t* ct, std::size_t n, Bytes& out);

  // First for initiator-to-responder traffic, second for the reverse
  std::pair<CipherState, CipherState> split();

  const Hash& handshake_hash() const { return h_; }

private:
  SecureBytes ck_;
  Hash h_{};
  CipherState cs_;
};

// Initiator side of Noise NX. Phases:
//   Uninitialized -> AwaitingSecondMessage -> Established -> Consumed
// Any error moves to Failed, after which every operation throws.
class NoiseInitiator {
public:
  explicit NoiseInitiator(AuthorityPublicKey authority, Clock clock = system_clock_unix);

  Bytes write_first_message(const Bytes& payload = {});

  void read_second_message(const std::uint8_t* msg, std::size_t n);
  void read_second_message(const Bytes& msg) { read_second_message(msg.data(), msg.size()); }

  // Exactly once, from Established; wipes the handshake state
  ConnectionEncryptor into_encryptor(const EncryptorConfig& cfg = {});

  bool is_established() const;
  bool has_failed() const;
  const char* phase() const;

  // Established only
  const PublicKey& remote_static_key() const;
  const SignedCertificate& certificate() const;
  const Hash& handshake_hash() const;

private:
  struct Uninitialized {};
  struct AwaitingSecondMessage {
    SymmetricState ss;
    KeyPair e;
  };
  struct Established {
    CipherState send;
    CipherState recv;
    Hash h;
    PublicKey rs;
    SignedCertificate cert;
  };
  struct Consumed {};
  struct Failed {};

  void fail(const char* what);

  AuthorityPublicKey authority_;
  Clock clock_;
  std::variant<Uninitialized, AwaitingSecondMessage, Established, Consumed, Failed> state_;
};

// Responder side of Noise NX, holding the static key and its certificate.
//   AwaitingFirstMessage -> Established -> Consumed
class NoiseResponder {
public:
  NoiseResponder(StaticKeyPair static_keys, SignatureNoiseMessage certificate);

  // Reads message 1 and returns message 2
  Bytes respond(const std::uint8_t* msg, std::size_t n);
  Bytes respond(const Bytes& msg) { return respond(msg.data(), msg.size()); }

  ConnectionEncryptor into_encryptor(const EncryptorConfig& cfg = {});

  bool is_established() const;
  bool has_failed() const;
  const char* phase() const;

  // Established only
  const Bytes& first_message_payload() const;
  const Hash& handshake_hash() const;

private:
  struct AwaitingFirstMessage {};
  struct Established {
    CipherState send;
    CipherState recv;
    Hash h;
    Bytes first_payload;
  };
  struct Consumed {};
  struct Failed {};

  void fail(const char* what);

  StaticKeyPair s_;
  SignatureNoiseMessage certificate_;
  std::variant<AwaitingFirstMessage, Established, Consumed, Failed> state_;
};

} // namespace sv2
