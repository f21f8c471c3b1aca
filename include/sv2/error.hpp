#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace sv2 {

enum class ErrorCode : std::uint8_t {
  Truncated,
  TooLong,
  PayloadTooLarge,
  InvalidFrame,
  UnexpectedHandshakeMessage,
  HandshakeFailed,
  AuthenticationFailed,
  NonceExhausted,
  DecryptionFailed,
  MalformedMessage,
  UnsupportedMessage,
  InvalidArgument,
  InvalidConfig,
  CryptoFailure,
  IoError
};

const char* to_string(ErrorCode code) noexcept;

class Error : public std::runtime_error {
public:
  Error(ErrorCode code, const std::string& msg);

  // Message-layer errors name the message type code that failed to decode
  Error(ErrorCode code, std::uint8_t message_type, const std::string& msg);

  ErrorCode code() const noexcept { return code_; }
  std::optional<std::uint8_t> message_type() const noexcept { return message_type_; }

private:
  ErrorCode code_;
  std::optional<std::uint8_t> message_type_;
};

void ensure(bool ok, ErrorCode code, const char* msg);

} // namespace sv2
