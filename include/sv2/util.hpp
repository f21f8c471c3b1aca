#pragma once
#include "sv2.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace sv2 {

struct SecureBytes {
  Bytes b;
  SecureBytes() = default;
  explicit SecureBytes(std::size_t n);
  explicit SecureBytes(Bytes&& data);
  ~SecureBytes();
  SecureBytes(const SecureBytes&) = delete;
  SecureBytes& operator=(const SecureBytes&) = delete;
  SecureBytes(SecureBytes&&) noexcept;
  SecureBytes& operator=(SecureBytes&&) noexcept;
};

void secure_bzero(void* p, std::size_t n);

void rand_bytes(std::uint8_t* out, std::size_t n);

// Unix seconds, truncated to the u32 used by certificates
using Clock = std::function<std::uint32_t()>;
std::uint32_t system_clock_unix();

// Bitcoin-alphabet base58, used for key files
std::string encode_base58(const std::uint8_t* data, std::size_t n);
std::string encode_base58(const Bytes& data);
Bytes decode_base58(const std::string& text);

bool read_file(const std::string& path, Bytes& out);
bool write_file(const std::string& path, const Bytes& data);
// Creates or truncates path with mode 0600, also narrowing an existing file
bool write_secret_file(const std::string& path, const SecureBytes& data);

} // namespace sv2
