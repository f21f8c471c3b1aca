#include "sv2/crypto.hpp"
#include "sv2/error.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cstring>
#include <limits>
#include <memory>

namespace sv2 {

using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

static void ensure_crypto(bool ok, const char* msg) {
  ensure(ok, ErrorCode::CryptoFailure, msg);
}

static int to_int_len(std::size_t n) {
  ensure(n <= (std::size_t)(std::numeric_limits<int>::max)(), ErrorCode::InvalidArgument,
         "buffer too large for OpenSSL");
  return (int)n;
}

bool ct_equal(const std::uint8_t* a, const std::uint8_t* b, std::size_t n) {
  return CRYPTO_memcmp(a, b, n) == 0;
}

// ------------------------------ raw key helpers ------------------------------

static KeyPair generate_raw(int type) {
  PkeyCtxPtr pctx(EVP_PKEY_CTX_new_id(type, nullptr), EVP_PKEY_CTX_free);
  ensure_crypto(pctx != nullptr, "EVP_PKEY_CTX_new_id failed");
  ensure_crypto(EVP_PKEY_keygen_init(pctx.get()) == 1, "keygen_init failed");
  EVP_PKEY* raw = nullptr;
  ensure_crypto(EVP_PKEY_keygen(pctx.get(), &raw) == 1, "keygen failed");
  PkeyPtr pkey(raw, EVP_PKEY_free);

  KeyPair kp;
  std::size_t len = kKeyLen;
  ensure_crypto(EVP_PKEY_get_raw_private_key(pkey.get(), kp.priv.b.data(), &len) == 1 &&
                len == kKeyLen, "get_raw_private_key failed");
  len = kKeyLen;
  ensure_crypto(EVP_PKEY_get_raw_public_key(pkey.get(), kp.pub.data(), &len) == 1 &&
                len == kKeyLen, "get_raw_public_key failed");
  return kp;
}

static PkeyPtr load_private(int type, const SecureBytes& priv) {
  ensure(priv.b.size() == kKeyLen, ErrorCode::InvalidArgument, "private key must be 32 bytes");
  PkeyPtr pkey(EVP_PKEY_new_raw_private_key(type, nullptr, priv.b.data(), kKeyLen),
               EVP_PKEY_free);
  ensure_crypto(pkey != nullptr, "EVP_PKEY_new_raw_private_key failed");
  return pkey;
}

static PublicKey public_from_private(int type, const SecureBytes& priv) {
  PkeyPtr pkey = load_private(type, priv);
  PublicKey pub{};
  std::size_t len = kKeyLen;
  ensure_crypto(EVP_PKEY_get_raw_public_key(pkey.get(), pub.data(), &len) == 1 &&
                len == kKeyLen, "get_raw_public_key failed");
  return pub;
}

// ------------------------------ X25519 ------------------------------

KeyPair x25519_generate() { return generate_raw(EVP_PKEY_X25519); }

PublicKey x25519_public_from_private(const SecureBytes& priv) {
  return public_from_private(EVP_PKEY_X25519, priv);
}

SecureBytes x25519_dh(const SecureBytes& priv, const PublicKey& peer_pub) {
  PkeyPtr local = load_private(EVP_PKEY_X25519, priv);
  PkeyPtr peer(EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr, peer_pub.data(), kKeyLen),
               EVP_PKEY_free);
  ensure_crypto(peer != nullptr, "EVP_PKEY_new_raw_public_key failed");

  PkeyCtxPtr dctx(EVP_PKEY_CTX_new(local.get(), nullptr), EVP_PKEY_CTX_free);
  ensure_crypto(dctx != nullptr, "EVP_PKEY_CTX_new failed");
  ensure_crypto(EVP_PKEY_derive_init(dctx.get()) == 1, "derive_init failed");
  ensure_crypto(EVP_PKEY_derive_set_peer(dctx.get(), peer.get()) == 1, "derive_set_peer failed");

  SecureBytes shared(kKeyLen);
  std::size_t len = kKeyLen;
  // OpenSSL rejects an all-zero result (low-order peer point)
  ensure_crypto(EVP_PKEY_derive(dctx.get(), shared.b.data(), &len) == 1 && len == kKeyLen,
                "X25519 derive failed");
  return shared;
}

// ------------------------------ ChaCha20-Poly1305 ------------------------------

static std::array<std::uint8_t, kAeadNonceLen> make_nonce(std::uint64_t n) {
  std::array<std::uint8_t, kAeadNonceLen> nonce{};
  for (int i = 0; i < 8; ++i) nonce[4 + i] = (std::uint8_t)((n >> (8 * i)) & 0xFF);
  return nonce;
}

Bytes chachapoly_seal(const std::uint8_t key[kKeyLen], std::uint64_t n,
                      const std::uint8_t* ad, std::size_t ad_len,
                      const std::uint8_t* pt, std::size_t pt_len) {
  auto nonce = make_nonce(n);
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
  ensure_crypto(ctx != nullptr, "EVP_CIPHER_CTX_new failed");

  ensure_crypto(EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) == 1,
                "EncryptInit failed");
  ensure_crypto(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, (int)kAeadNonceLen, nullptr) == 1,
                "Set IV len failed");
  ensure_crypto(EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key, nonce.data()) == 1,
                "EncryptInit key/nonce failed");

  int tmp = 0;
  if (ad_len) {
    ensure_crypto(EVP_EncryptUpdate(ctx.get(), nullptr, &tmp, ad, to_int_len(ad_len)) == 1,
                  "EncryptUpdate AAD failed");
  }

  Bytes ct(pt_len + kTagLen);
  int len1 = 0;
  if (pt_len) {
    ensure_crypto(EVP_EncryptUpdate(ctx.get(), ct.data(), &len1, pt, to_int_len(pt_len)) == 1,
                  "EncryptUpdate PT failed");
  }
  int len2 = 0;
  ensure_crypto(EVP_EncryptFinal_ex(ctx.get(), ct.data() + len1, &len2) == 1, "EncryptFinal failed");
  ensure_crypto((std::size_t)len1 + (std::size_t)len2 == pt_len, "ciphertext length mismatch");

  ensure_crypto(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, (int)kTagLen,
                                    ct.data() + pt_len) == 1, "GET_TAG failed");
  return ct;
}

bool chachapoly_open(const std::uint8_t key[kKeyLen], std::uint64_t n,
                     const std::uint8_t* ad, std::size_t ad_len,
                     const std::uint8_t* ct, std::size_t ct_len,
                     Bytes& out) {
  out.clear();
  if (ct_len < kTagLen) return false;
  const std::size_t msg_len = ct_len - kTagLen;
  const std::uint8_t* tag = ct + msg_len;
  auto nonce = make_nonce(n);

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
  ensure_crypto(ctx != nullptr, "EVP_CIPHER_CTX_new failed");

  ensure_crypto(EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) == 1,
                "DecryptInit failed");
  ensure_crypto(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, (int)kAeadNonceLen, nullptr) == 1,
                "Set IV len failed");
  ensure_crypto(EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key, nonce.data()) == 1,
                "DecryptInit key/nonce failed");

  int tmp = 0;
  if (ad_len) {
    ensure_crypto(EVP_DecryptUpdate(ctx.get(), nullptr, &tmp, ad, to_int_len(ad_len)) == 1,
                  "DecryptUpdate AAD failed");
  }

  Bytes pt(msg_len);
  int len1 = 0;
  if (msg_len) {
    ensure_crypto(EVP_DecryptUpdate(ctx.get(), pt.data(), &len1, ct, to_int_len(msg_len)) == 1,
                  "DecryptUpdate CT failed");
  }
  ensure_crypto(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, (int)kTagLen, (void*)tag) == 1,
                "SET_TAG failed");

  // The tag comparison inside DecryptFinal is constant-time
  int len2 = 0;
  if (EVP_DecryptFinal_ex(ctx.get(), pt.data() + len1, &len2) != 1) {
    secure_bzero(pt.data(), pt.size());
    return false;
  }
  pt.resize((std::size_t)len1 + (std::size_t)len2);
  out = std::move(pt);
  return true;
}

// ------------------------------ BLAKE2s ------------------------------

Hash blake2s(const std::uint8_t* a, std::size_t a_len,
             const std::uint8_t* b, std::size_t b_len) {
  Hash out{};
  MdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  ensure_crypto(ctx != nullptr, "EVP_MD_CTX_new failed");
  unsigned int len = 0;
  ensure_crypto(EVP_DigestInit_ex(ctx.get(), EVP_blake2s256(), nullptr) == 1, "DigestInit failed");
  if (a_len) ensure_crypto(EVP_DigestUpdate(ctx.get(), a, a_len) == 1, "DigestUpdate failed");
  if (b_len) ensure_crypto(EVP_DigestUpdate(ctx.get(), b, b_len) == 1, "DigestUpdate failed");
  ensure_crypto(EVP_DigestFinal_ex(ctx.get(), out.data(), &len) == 1, "DigestFinal failed");
  ensure_crypto(len == kHashLen, "blake2s length mismatch");
  return out;
}

Hash blake2s(const std::uint8_t* data, std::size_t n) {
  return blake2s(data, n, nullptr, 0);
}

static void hmac_blake2s(const std::uint8_t* key, std::size_t key_len,
                         const std::uint8_t* data, std::size_t data_len,
                         std::uint8_t out[kHashLen]) {
  static const std::uint8_t kEmpty[1] = {0};
  unsigned int len = 0;
  ensure_crypto(HMAC(EVP_blake2s256(), key, to_int_len(key_len),
                     data_len ? data : kEmpty, data_len, out, &len) != nullptr,
                "HMAC failed");
  ensure_crypto(len == kHashLen, "HMAC length mismatch");
}

Hash hkdf_extract_blake2s(const std::uint8_t* salt, std::size_t salt_len,
                          const std::uint8_t* ikm, std::size_t ikm_len) {
  Hash prk{};
  hmac_blake2s(salt, salt_len, ikm, ikm_len, prk.data());
  return prk;
}

SecureBytes hkdf_expand_blake2s(const Hash& prk, const std::string& info, std::size_t out_len) {
  ensure(out_len <= 255 * kHashLen, ErrorCode::InvalidArgument, "HKDF output too long");
  SecureBytes out(out_len);
  SecureBytes block(kHashLen + info.size() + 1);
  std::uint8_t t[kHashLen];
  std::size_t t_len = 0;
  std::size_t done = 0;
  for (std::uint8_t i = 1; done < out_len; ++i) {
    // T(i) = HMAC(prk, T(i-1) | info | i)
    std::memcpy(block.b.data(), t, t_len);
    if (!info.empty()) std::memcpy(block.b.data() + t_len, info.data(), info.size());
    block.b[t_len + info.size()] = i;
    hmac_blake2s(prk.data(), prk.size(), block.b.data(), t_len + info.size() + 1, t);
    t_len = kHashLen;
    std::size_t take = (out_len - done < kHashLen) ? out_len - done : kHashLen;
    std::memcpy(out.b.data() + done, t, take);
    done += take;
  }
  secure_bzero(t, sizeof(t));
  return out;
}

// ------------------------------ Ed25519 ------------------------------

KeyPair ed25519_generate() { return generate_raw(EVP_PKEY_ED25519); }

PublicKey ed25519_public_from_private(const SecureBytes& priv) {
  return public_from_private(EVP_PKEY_ED25519, priv);
}

std::array<std::uint8_t, kSignatureLen> ed25519_sign(const SecureBytes& priv,
                                                     const std::uint8_t* msg, std::size_t n) {
  PkeyPtr pkey = load_private(EVP_PKEY_ED25519, priv);
  MdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  ensure_crypto(ctx != nullptr, "EVP_MD_CTX_new failed");
  ensure_crypto(EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) == 1,
                "DigestSignInit failed");

  std::array<std::uint8_t, kSignatureLen> sig{};
  std::size_t len = sig.size();
  ensure_crypto(EVP_DigestSign(ctx.get(), sig.data(), &len, msg, n) == 1 && len == kSignatureLen,
                "Ed25519 sign failed");
  return sig;
}

bool ed25519_verify(const PublicKey& pub, const std::uint8_t* msg, std::size_t n,
                    const std::uint8_t* sig) {
  PkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, pub.data(), kKeyLen),
               EVP_PKEY_free);
  if (!pkey) return false;
  MdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  ensure_crypto(ctx != nullptr, "EVP_MD_CTX_new failed");
  ensure_crypto(EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) == 1,
                "DigestVerifyInit failed");
  return EVP_DigestVerify(ctx.get(), sig, kSignatureLen, msg, n) == 1;
}

} // namespace sv2
