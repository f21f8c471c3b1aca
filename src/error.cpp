#include "sv2/error.hpp"

namespace sv2 {

const char* to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::Truncated:                  return "Truncated";
    case ErrorCode::TooLong:                    return "TooLong";
    case ErrorCode::PayloadTooLarge:            return "PayloadTooLarge";
    case ErrorCode::InvalidFrame:               return "InvalidFrame";
    case ErrorCode::UnexpectedHandshakeMessage: return "UnexpectedHandshakeMessage";
    case ErrorCode::HandshakeFailed:            return "HandshakeFailed";
    case ErrorCode::AuthenticationFailed:       return "AuthenticationFailed";
    case ErrorCode::NonceExhausted:             return "NonceExhausted";
    case ErrorCode::DecryptionFailed:           return "DecryptionFailed";
    case ErrorCode::MalformedMessage:           return "MalformedMessage";
    case ErrorCode::UnsupportedMessage:         return "UnsupportedMessage";
    case ErrorCode::InvalidArgument:            return "InvalidArgument";
    case ErrorCode::InvalidConfig:              return "InvalidConfig";
    case ErrorCode::CryptoFailure:              return "CryptoFailure";
    case ErrorCode::IoError:                    return "IoError";
  }
  return "Unknown";
}

Error::Error(ErrorCode code, const std::string& msg)
  : std::runtime_error(std::string(to_string(code)) + ": " + msg), code_(code) {}

Error::Error(ErrorCode code, std::uint8_t message_type, const std::string& msg)
  : std::runtime_error(std::string(to_string(code)) + ": " + msg),
    code_(code), message_type_(message_type) {}

void ensure(bool ok, ErrorCode code, const char* msg) {
  if (!ok) throw Error(code, msg);
}

} // namespace sv2
