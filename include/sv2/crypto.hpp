#pragma once
#include "sv2.hpp"
#include "util.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace sv2 {

static constexpr std::size_t kKeyLen = 32;       // X25519, Ed25519, ChaCha20 keys
static constexpr std::size_t kHashLen = 32;      // BLAKE2s-256
static constexpr std::size_t kAeadNonceLen = 12; // 4 zero bytes + u64 LE counter
static constexpr std::size_t kTagLen = 16;
static constexpr std::size_t kSignatureLen = 64;

using PublicKey = std::array<std::uint8_t, kKeyLen>;
using Hash = std::array<std::uint8_t, kHashLen>;

struct KeyPair {
  SecureBytes priv = SecureBytes(kKeyLen);
  PublicKey pub{};
};

bool ct_equal(const std::uint8_t* a, const std::uint8_t* b, std::size_t n);

// ------------------------------ X25519 ------------------------------

KeyPair x25519_generate();
PublicKey x25519_public_from_private(const SecureBytes& priv);

// Throws Error(CryptoFailure) on a low-order peer key
SecureBytes x25519_dh(const SecureBytes& priv, const PublicKey& peer_pub);

// ------------------------------ ChaCha20-Poly1305 ------------------------------

// Ciphertext with the 16-byte tag appended
Bytes chachapoly_seal(const std::uint8_t key[kKeyLen], std::uint64_t n,
                      const std::uint8_t* ad, std::size_t ad_len,
                      const std::uint8_t* pt, std::size_t pt_len);

// False when the tag does not verify; `out` is left empty
bool chachapoly_open(const std::uint8_t key[kKeyLen], std::uint64_t n,
                     const std::uint8_t* ad, std::size_t ad_len,
                     const std::uint8_t* ct, std::size_t ct_len,
                     Bytes& out);

// ------------------------------ BLAKE2s ------------------------------

Hash blake2s(const std::uint8_t* data, std::size_t n);
Hash blake2s(const std::uint8_t* a, std::size_t a_len,
             const std::uint8_t* b, std::size_t b_len);

// RFC 5869 over HMAC-BLAKE2s
Hash hkdf_extract_blake2s(const std::uint8_t* salt, std::size_t salt_len,
                          const std::uint8_t* ikm, std::size_t ikm_len);
SecureBytes hkdf_expand_blake2s(const Hash& prk, const std::string& info, std::size_t out_len);

// ------------------------------ Ed25519 ------------------------------

KeyPair ed25519_generate();
PublicKey ed25519_public_from_private(const SecureBytes& priv);
std::array<std::uint8_t, kSignatureLen> ed25519_sign(const SecureBytes& priv,
                                                     const std::uint8_t* msg, std::size_t n);
bool ed25519_verify(const PublicKey& pub, const std::uint8_t* msg, std::size_t n,
                    const std::uint8_t* sig);

} // namespace sv2
