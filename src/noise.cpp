#include "sv2/noise.hpp"
#include "sv2/encryptor.hpp"
#include "sv2/error.hpp"
#include "sv2/log.hpp"
#include <cstring>

namespace sv2 {

// ------------------------------ CipherState ------------------------------

CipherState::CipherState(SecureBytes key) : k_(std::move(key)), has_key_(true) {
  ensure(k_.b.size() == kKeyLen, ErrorCode::InvalidArgument, "cipher key must be 32 bytes");
}

Bytes CipherState::encrypt_with_ad(const std::uint8_t* ad, std::size_t ad_len,
                                   const std::uint8_t* pt, std::size_t pt_len) {
  if (!has_key_) return Bytes(pt, pt + pt_len);
  ensure(n_ != kReservedNonce, ErrorCode::NonceExhausted, "send nonce exhausted");
  Bytes ct = chachapoly_seal(k_.b.data(), n_, ad, ad_len, pt, pt_len);
  ++n_;
  return ct;
}

bool CipherState::decrypt_with_ad(const std::uint8_t* ad, std::size_t ad_len,
                                  const std::uint8_t* ct, std::size_t ct_len, Bytes& out) {
  if (!has_key_) {
    out.assign(ct, ct + ct_len);
    return true;
  }
  ensure(n_ != kReservedNonce, ErrorCode::NonceExhausted, "receive nonce exhausted");
  if (!chachapoly_open(k_.b.data(), n_, ad, ad_len, ct, ct_len, out)) return false;
  ++n_;
  return true;
}

void CipherState::rekey() {
  ensure(has_key_, ErrorCode::InvalidArgument, "rekey without a key");
  std::uint8_t zeros[kKeyLen] = {0};
  Bytes next = chachapoly_seal(k_.b.data(), kReservedNonce, nullptr, 0, zeros, kKeyLen);
  next.resize(kKeyLen);
  k_ = SecureBytes(std::move(next));
}

// ------------------------------ SymmetricState ------------------------------

// HKDF(ck, ikm) split into two 32-byte outputs
static std::pair<SecureBytes, SecureBytes> noise_hkdf(const SecureBytes& ck,
                                                      const std::uint8_t* ikm, std::size_t n) {
  Hash prk = hkdf_extract_blake2s(ck.b.data(), ck.b.size(), ikm, n);
  SecureBytes okm = hkdf_expand_blake2s(prk, "", 2 * kHashLen);
  secure_bzero(prk.data(), prk.size());

  SecureBytes out1(kHashLen), out2(kHashLen);
  std::memcpy(out1.b.data(), okm.b.data(), kHashLen);
  std::memcpy(out2.b.data(), okm.b.data() + kHashLen, kHashLen);
  return {std::move(out1), std::move(out2)};
}

SymmetricState::SymmetricState(const std::string& protocol_name) : ck_(kHashLen) {
  if (protocol_name.size() <= kHashLen) {
    std::memcpy(h_.data(), protocol_name.data(), protocol_name.size());
  } else {
    h_ = blake2s((const std::uint8_t*)protocol_name.data(), protocol_name.size());
  }
  std::memcpy(ck_.b.data(), h_.data(), kHashLen);
}

void SymmetricState::mix_hash(const std::uint8_t* data, std::size_t n) {
  h_ = blake2s(h_.data(), h_.size(), data, n);
}

void SymmetricState::mix_key(const std::uint8_t* ikm, std::size_t n) {
  auto [ck, temp_k] = noise_hkdf(ck_, ikm, n);
  ck_ = std::move(ck);
  cs_ = CipherState(std::move(temp_k));
}

Bytes SymmetricState::encrypt_and_hash(const std::uint8_t* pt, std::size_t n) {
  Bytes ct = cs_.encrypt_with_ad(h_.data(), h_.size(), pt, n);
  mix_hash(ct.data(), ct.size());
  return ct;
}

bool SymmetricState::decrypt_and_hash(const std::uint8_t* ct, std::size_t n, Bytes& out) {
  if (!cs_.decrypt_with_ad(h_.data(), h_.size(), ct, n, out)) return false;
  mix_hash(ct, n);
  return true;
}

std::pair<CipherState, CipherState> SymmetricState::split() {
  auto [k1, k2] = noise_hkdf(ck_, nullptr, 0);
  secure_bzero(ck_.b.data(), ck_.b.size());
  cs_ = CipherState();
  return {CipherState(std::move(k1)), CipherState(std::move(k2))};
}

// DH failures inside the handshake are handshake failures
static SecureBytes handshake_dh(const SecureBytes& priv, const PublicKey& pub) {
  try {
    return x25519_dh(priv, pub);
  } catch (const Error& e) {
    throw Error(ErrorCode::HandshakeFailed, std::string("DH failed: ") + e.what());
  }
}

static SymmetricState start_handshake() {
  SymmetricState ss(kNoiseProtocolName);
  ss.mix_hash(nullptr, 0); // empty prologue
  return ss;
}

// ------------------------------ NoiseInitiator ------------------------------

NoiseInitiator::NoiseInitiator(AuthorityPublicKey authority, Clock clock)
  : authority_(authority), clock_(std::move(clock)) {
  ensure((bool)clock_, ErrorCode::InvalidArgument, "clock is empty");
}

void NoiseInitiator::fail(const char* what) {
  state_.emplace<Failed>();
  logger()->warn("noise initiator failed: {}", what);
}

Bytes NoiseInitiator::write_first_message(const Bytes& payload) {
  ensure(!has_failed(), ErrorCode::HandshakeFailed, "handshake has failed");
  if (!std::holds_alternative<Uninitialized>(state_)) {
    fail("first message written twice");
    throw Error(ErrorCode::UnexpectedHandshakeMessage, "first message already written");
  }
  try {
    ensure(kKeyLen + payload.size() <= kMaxNoiseMessageLen, ErrorCode::HandshakeFailed,
           "first message payload too large");

    SymmetricState ss = start_handshake();
    KeyPair e = x25519_generate();

    Bytes msg(e.pub.begin(), e.pub.end());
    ss.mix_hash(e.pub.data(), e.pub.size());
    Bytes p = ss.encrypt_and_hash(payload.data(), payload.size());
    msg.insert(msg.end(), p.begin(), p.end());

    state_ = AwaitingSecondMessage{std::move(ss), std::move(e)};
    logger()->debug("noise initiator sent first message ({} bytes)", msg.size());
    return msg;
  } catch (const std::exception& e) {
    fail(e.what());
    throw;
  }
}

void NoiseInitiator::read_second_message(const std::uint8_t* msg, std::size_t n) {
  ensure(!has_failed(), ErrorCode::HandshakeFailed, "handshake has failed");
  auto* st = std::get_if<AwaitingSecondMessage>(&state_);
  if (!st) {
    fail("second message out of order");
    throw Error(ErrorCode::UnexpectedHandshakeMessage, "not awaiting the second message");
  }
  try {
    ensure(n == kHandshakeSecondMessageLen, ErrorCode::HandshakeFailed,
           "second message has the wrong length");
    SymmetricState& ss = st->ss;
    const std::uint8_t* p = msg;

    // e
    PublicKey re{};
    std::memcpy(re.data(), p, kKeyLen);
    ss.mix_hash(re.data(), re.size());
    p += kKeyLen;

    // ee
    SecureBytes ee = handshake_dh(st->e.priv, re);
    ss.mix_key(ee.b.data(), ee.b.size());

    // s
    Bytes rs_bytes;
    ensure(ss.decrypt_and_hash(p, kKeyLen + kTagLen, rs_bytes), ErrorCode::HandshakeFailed,
           "static key decryption failed");
    PublicKey rs{};
    std::memcpy(rs.data(), rs_bytes.data(), kKeyLen);
    p += kKeyLen + kTagLen;

    // es
    SecureBytes es = handshake_dh(st->e.priv, rs);
    ss.mix_key(es.b.data(), es.b.size());

    // SignatureNoiseMessage
    Bytes payload;
    ensure(ss.decrypt_and_hash(p, SignatureNoiseMessage::kSerializedLen + kTagLen, payload),
           ErrorCode::HandshakeFailed, "certificate decryption failed");
    SignatureNoiseMessage sig = SignatureNoiseMessage::parse(payload.data(), payload.size());
    SignedCertificate cert = verify_certificate(authority_, rs, sig, clock_());

    Hash h = ss.handshake_hash();
    auto [c1, c2] = ss.split();
    state_ = Established{std::move(c1), std::move(c2), h, rs, cert};
    logger()->info("noise handshake established (initiator), certificate valid until {}",
                   cert.not_valid_after());
  } catch (const std::exception& e) {
    fail(e.what());
    throw;
  }
}

ConnectionEncryptor NoiseInitiator::into_encryptor(const EncryptorConfig& cfg) {
  ensure(!has_failed(), ErrorCode::HandshakeFailed, "handshake has failed");
  auto* st = std::get_if<Established>(&state_);
  ensure(st != nullptr, ErrorCode::UnexpectedHandshakeMessage, "handshake is not established");
  validate_config(cfg);
  ConnectionEncryptor enc(ConnectionEncryptor::Role::Initiator, std::move(st->send),
                          std::move(st->recv), st->h, cfg);
  state_.emplace<Consumed>();
  return enc;
}

bool NoiseInitiator::is_established() const { return std::holds_alternative<Established>(state_); }
bool NoiseInitiator::has_failed() const { return std::holds_alternative<Failed>(state_); }

const char* NoiseInitiator::phase() const {
  switch (state_.index()) {
    case 0: return "Uninitialized";
    case 1: return "AwaitingSecondMessage";
    case 2: return "Established";
    case 3: return "Consumed";
    default: return "Failed";
  }
}

const PublicKey& NoiseInitiator::remote_static_key() const {
  auto* st = std::get_if<Established>(&state_);
  ensure(st != nullptr, ErrorCode::UnexpectedHandshakeMessage, "handshake is not established");
  return st->rs;
}

const SignedCertificate& NoiseInitiator::certificate() const {
  auto* st = std::get_if<Established>(&state_);
  ensure(st != nullptr, ErrorCode::UnexpectedHandshakeMessage, "handshake is not established");
  return st->cert;
}

const Hash& NoiseInitiator::handshake_hash() const {
  auto* st = std::get_if<Established>(&state_);
  ensure(st != nullptr, ErrorCode::UnexpectedHandshakeMessage, "handshake is not established");
  return st->h;
}

// ------------------------------ NoiseResponder ------------------------------

NoiseResponder::NoiseResponder(StaticKeyPair static_keys, SignatureNoiseMessage certificate)
  : s_(std::move(static_keys)), certificate_(certificate) {
  ensure(s_.priv.b.size() == kKeyLen, ErrorCode::InvalidArgument, "static key is not set");
}

void NoiseResponder::fail(const char* what) {
  state_.emplace<Failed>();
  logger()->warn("noise responder failed: {}", what);
}

Bytes NoiseResponder::respond(const std::uint8_t* msg, std::size_t n) {
  ensure(!has_failed(), ErrorCode::HandshakeFailed, "handshake has failed");
  if (!std::holds_alternative<AwaitingFirstMessage>(state_)) {
    fail("first message received twice");
    throw Error(ErrorCode::UnexpectedHandshakeMessage, "first message already processed");
  }
  try {
    ensure(n >= kHandshakeFirstMessageMinLen && n <= kMaxNoiseMessageLen,
           ErrorCode::HandshakeFailed, "first message has the wrong length");

    SymmetricState ss = start_handshake();

    // -> e
    PublicKey re{};
    std::memcpy(re.data(), msg, kKeyLen);
    ss.mix_hash(re.data(), re.size());
    Bytes first_payload;
    ensure(ss.decrypt_and_hash(msg + kKeyLen, n - kKeyLen, first_payload),
           ErrorCode::HandshakeFailed, "first message payload rejected");

    // <- e
    KeyPair e = x25519_generate();
    Bytes out(e.pub.begin(), e.pub.end());
    out.reserve(kHandshakeSecondMessageLen);
    ss.mix_hash(e.pub.data(), e.pub.size());

    // ee
    SecureBytes ee = handshake_dh(e.priv, re);
    ss.mix_key(ee.b.data(), ee.b.size());

    // s
    Bytes enc_s = ss.encrypt_and_hash(s_.pub.data(), s_.pub.size());
    out.insert(out.end(), enc_s.begin(), enc_s.end());

    // es
    SecureBytes es = handshake_dh(s_.priv, re);
    ss.mix_key(es.b.data(), es.b.size());

    // SignatureNoiseMessage
    Bytes cert = certificate_.serialize();
    Bytes enc_cert = ss.encrypt_and_hash(cert.data(), cert.size());
    out.insert(out.end(), enc_cert.begin(), enc_cert.end());

    Hash h = ss.handshake_hash();
    auto [c1, c2] = ss.split();
    state_ = Established{std::move(c2), std::move(c1), h, std::move(first_payload)};
    logger()->info("noise handshake established (responder)");
    return out;
  } catch (const std::exception& e) {
    fail(e.what());
    throw;
  }
}

ConnectionEncryptor NoiseResponder::into_encryptor(const EncryptorConfig& cfg) {
  ensure(!has_failed(), ErrorCode::HandshakeFailed, "handshake has failed");
  auto* st = std::get_if<Established>(&state_);
  ensure(st != nullptr, ErrorCode::UnexpectedHandshakeMessage, "handshake is not established");
  validate_config(cfg);
  ConnectionEncryptor enc(ConnectionEncryptor::Role::Responder, std::move(st->send),
                          std::move(st->recv), st->h, cfg);
  state_.emplace<Consumed>();
  return enc;
}

bool NoiseResponder::is_established() const { return std::holds_alternative<Established>(state_); }
bool NoiseResponder::has_failed() const { return std::holds_alternative<Failed>(state_); }

const char* NoiseResponder::phase() const {
  switch (state_.index()) {
    case 0: return "AwaitingFirstMessage";
    case 1: return "Established";
    case 2: return "Consumed";
    default: return "Failed";
  }
}

const Bytes& NoiseResponder::first_message_payload() const {
  auto* st = std::get_if<Established>(&state_);
  ensure(st != nullptr, ErrorCode::UnexpectedHandshakeMessage, "handshake is not established");
  return st->first_payload;
}

const Hash& NoiseResponder::handshake_hash() const {
  auto* st = std::get_if<Established>(&state_);
  ensure(st != nullptr, ErrorCode::UnexpectedHandshakeMessage, "handshake is not established");
  return st->h;
}

} // namespace sv2
