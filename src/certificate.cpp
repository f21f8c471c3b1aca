#include "sv2/certificate.hpp"
#include "sv2/error.hpp"
#include "sv2/log.hpp"
#include <cstring>
#include <limits>

namespace sv2 {

static bool all_zero(const Bytes& b) {
  std::uint8_t acc = 0;
  for (auto v : b) acc |= v;
  return acc == 0;
}

// ------------------------------ key pairs ------------------------------

AuthorityKeyPair AuthorityKeyPair::generate() {
  KeyPair kp = ed25519_generate();
  AuthorityKeyPair out;
  out.priv = std::move(kp.priv);
  out.pub.bytes = kp.pub;
  return out;
}

AuthorityKeyPair AuthorityKeyPair::from_private(SecureBytes priv) {
  ensure(priv.b.size() == kKeyLen, ErrorCode::InvalidArgument,
         "authority private key must be 32 bytes");
  AuthorityKeyPair out;
  out.pub.bytes = ed25519_public_from_private(priv);
  out.priv = std::move(priv);
  return out;
}

StaticKeyPair StaticKeyPair::generate() {
  KeyPair kp = x25519_generate();
  StaticKeyPair out;
  out.priv = std::move(kp.priv);
  out.pub = kp.pub;
  return out;
}

StaticKeyPair StaticKeyPair::from_private(SecureBytes priv) {
  ensure(priv.b.size() == kKeyLen, ErrorCode::InvalidArgument,
         "static private key must be 32 bytes");
  ensure(!all_zero(priv.b), ErrorCode::InvalidArgument, "static private key is all zeros");
  StaticKeyPair out;
  out.pub = x25519_public_from_private(priv);
  out.priv = std::move(priv);
  return out;
}

// ------------------------------ certificate ------------------------------

SignedCertificate::SignedCertificate(std::uint16_t version, std::uint32_t valid_from,
                                     std::uint32_t not_valid_after,
                                     const PublicKey& static_public_key)
  : version_(version), valid_from_(valid_from), not_valid_after_(not_valid_after),
    static_public_key_(static_public_key) {
  ensure(valid_from_ < not_valid_after_, ErrorCode::InvalidArgument,
         "valid_from must precede not_valid_after");
}

Bytes SignedCertificate::serialize() const {
  ByteWriter w(kSerializedLen);
  w(version_, valid_from_, not_valid_after_, static_public_key_);
  return w.take();
}

Bytes SignatureNoiseMessage::serialize() const {
  ByteWriter w(kSerializedLen);
  std::apply(w, fields(*this));
  return w.take();
}

SignatureNoiseMessage SignatureNoiseMessage::parse(const std::uint8_t* data, std::size_t len) {
  SignatureNoiseMessage m;
  ByteCursor cur(data, len);
  std::apply(cur, fields(m));
  cur.expect_end();
  return m;
}

SignatureNoiseMessage sign_certificate(const AuthorityKeyPair& authority,
                                       const SignedCertificate& cert) {
  Bytes signed_bytes = cert.serialize();
  SignatureNoiseMessage m;
  m.version = cert.version();
  m.valid_from = cert.valid_from();
  m.not_valid_after = cert.not_valid_after();
  m.signature = ed25519_sign(authority.priv, signed_bytes.data(), signed_bytes.size());
  return m;
}

SignatureNoiseMessage issue_certificate(const AuthorityKeyPair& authority,
                                        const PublicKey& static_pub,
                                        const CertificateConfig& cfg,
                                        std::uint32_t now) {
  validate_config(cfg);
  const std::uint32_t max = (std::numeric_limits<std::uint32_t>::max)();
  std::uint32_t not_valid_after = (max - now < cfg.validity_secs) ? max : now + cfg.validity_secs;
  SignedCertificate cert(cfg.version, now, not_valid_after, static_pub);
  logger()->info("issued certificate version={} valid_from={} not_valid_after={}",
                 cert.version(), cert.valid_from(), cert.not_valid_after());
  return sign_certificate(authority, cert);
}

SignedCertificate verify_certificate(const AuthorityPublicKey& authority,
                                     const PublicKey& static_pub,
                                     const SignatureNoiseMessage& msg,
                                     std::uint32_t now) {
  if (msg.valid_from >= msg.not_valid_after) {
    logger()->warn("certificate rejected: empty validity window");
    throw Error(ErrorCode::AuthenticationFailed, "certificate validity window is empty");
  }
  SignedCertificate cert(msg.version, msg.valid_from, msg.not_valid_after, static_pub);

  Bytes signed_bytes = cert.serialize();
  if (!ed25519_verify(authority.bytes, signed_bytes.data(), signed_bytes.size(),
                      msg.signature.data())) {
    logger()->warn("certificate rejected: bad signature");
    throw Error(ErrorCode::AuthenticationFailed, "certificate signature invalid");
  }
  if (!cert.is_valid_at(now)) {
    logger()->warn("certificate rejected: now={} outside [{}, {})",
                   now, cert.valid_from(), cert.not_valid_after());
    throw Error(ErrorCode::AuthenticationFailed, "certificate outside validity window");
  }
  return cert;
}

// ------------------------------ key files ------------------------------

void save_key(const std::string& path, const std::uint8_t* key, std::size_t n) {
  std::string text = encode_base58(key, n) + "\n";
  ensure(write_file(path, Bytes(text.begin(), text.end())), ErrorCode::IoError,
         "failed to write key file");
}

void save_secret_key(const std::string& path, const SecureBytes& key) {
  std::string encoded = encode_base58(key.b.data(), key.b.size());
  SecureBytes text(encoded.size() + 1);
  std::memcpy(text.b.data(), encoded.data(), encoded.size());
  text.b.back() = '\n';
  secure_bzero(&encoded[0], encoded.size());
  ensure(write_secret_file(path, text), ErrorCode::IoError, "failed to write secret key file");
}

static Bytes load_key_bytes(const std::string& path) {
  Bytes raw;
  ensure(read_file(path, raw), ErrorCode::IoError, "failed to read key file");
  std::string text(raw.begin(), raw.end());
  secure_bzero(raw.data(), raw.size());
  Bytes key = decode_base58(text);
  secure_bzero(&text[0], text.size());
  if (key.size() != kKeyLen) {
    secure_bzero(key.data(), key.size());
    throw Error(ErrorCode::InvalidArgument, "key file does not hold 32 bytes");
  }
  return key;
}

SecureBytes load_secret_key(const std::string& path) {
  return SecureBytes(load_key_bytes(path));
}

PublicKey load_public_key(const std::string& path) {
  Bytes key = load_key_bytes(path);
  PublicKey pub{};
  std::memcpy(pub.data(), key.data(), kKeyLen);
  return pub;
}

} // namespace sv2
