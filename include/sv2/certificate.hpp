#pragma once
#include "sv2.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "crypto.hpp"
#include "util.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <tuple>

namespace sv2 {

struct AuthorityPublicKey {
  PublicKey bytes{};
};

// Ed25519 key of the pool authority that signs static-key certificates
struct AuthorityKeyPair {
  SecureBytes priv;
  AuthorityPublicKey pub;

  static AuthorityKeyPair generate();
  static AuthorityKeyPair from_private(SecureBytes priv);
};

// Long-term X25519 identity of the responder
struct StaticKeyPair {
  SecureBytes priv;
  PublicKey pub{};

  static StaticKeyPair generate();
  // Rejects an all-zero private key
  static StaticKeyPair from_private(SecureBytes priv);
};

// Binds a static key to a validity window [valid_from, not_valid_after)
class SignedCertificate {
public:
  static constexpr std::size_t kSerializedLen = 2 + 4 + 4 + kKeyLen;

  // Throws Error(InvalidArgument) when valid_from >= not_valid_after
  SignedCertificate(std::uint16_t version, std::uint32_t valid_from,
                    std::uint32_t not_valid_after, const PublicKey& static_public_key);

  std::uint16_t version() const { return version_; }
  std::uint32_t valid_from() const { return valid_from_; }
  std::uint32_t not_valid_after() const { return not_valid_after_; }
  const PublicKey& static_public_key() const { return static_public_key_; }

  bool is_valid_at(std::uint32_t now) const { return valid_from_ <= now && now < not_valid_after_; }

  // The signed bytes: u16 version | u32 valid_from | u32 not_valid_after | key
  Bytes serialize() const;

private:
  std::uint16_t version_;
  std::uint32_t valid_from_;
  std::uint32_t not_valid_after_;
  PublicKey static_public_key_;
};

// Handshake message 2 payload
struct SignatureNoiseMessage {
  static constexpr std::size_t kSerializedLen = 2 + 4 + 4 + kSignatureLen;

  std::uint16_t version{0};
  std::uint32_t valid_from{0};
  std::uint32_t not_valid_after{0};
  Signature64 signature{};

  template <class Self>
  static auto fields(Self& m) {
    return std::tie(m.version, m.valid_from, m.not_valid_after, m.signature);
  }

  Bytes serialize() const;
  // Throws Truncated or TooLong on a wrong length
  static SignatureNoiseMessage parse(const std::uint8_t* data, std::size_t len);
};

SignatureNoiseMessage sign_certificate(const AuthorityKeyPair& authority,
                                       const SignedCertificate& cert);

// Certificate valid from `now` for cfg.validity_secs
SignatureNoiseMessage issue_certificate(const AuthorityKeyPair& authority,
                                        const PublicKey& static_pub,
                                        const CertificateConfig& cfg,
                                        std::uint32_t now);

// Throws Error(AuthenticationFailed) on a bad signature, an empty window or
// `now` outside the window
SignedCertificate verify_certificate(const AuthorityPublicKey& authority,
                                     const PublicKey& static_pub,
                                     const SignatureNoiseMessage& msg,
                                     std::uint32_t now);

// ------------------------------ key files ------------------------------
// One base58 line per file.

void save_key(const std::string& path, const std::uint8_t* key, std::size_t n);
// Owner-only file; the encoded text is wiped once written
void save_secret_key(const std::string& path, const SecureBytes& key);
SecureBytes load_secret_key(const std::string& path);
PublicKey load_public_key(const std::string& path);

} // namespace sv2
