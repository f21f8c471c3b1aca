#include "sv2/messages.hpp"
#include "sv2/log.hpp"
#include <string>

namespace sv2 {

static void malformed(MessageType t, const char* msg) {
  throw Error(ErrorCode::MalformedMessage, (std::uint8_t)t,
              std::string(message_name(t)) + ": " + msg);
}

void validate(const SetupConnection& m) {
  if (!is_known_protocol(m.protocol)) malformed(m.kType, "unknown protocol");
  if (m.min_version < kProtocolVersion) malformed(m.kType, "min_version must be at least 2");
  if (m.max_version < m.min_version) malformed(m.kType, "max_version below min_version");
  if (m.vendor.empty()) malformed(m.kType, "vendor is empty");
  if (m.firmware.empty()) malformed(m.kType, "firmware is empty");
}

void validate(const SetupConnectionError& m) {
  if (m.error_code.str() == error_codes::kUnsupportedFeatureFlags && m.flags == 0) {
    malformed(m.kType, "unsupported-feature-flags without any flags");
  }
}

MessageType message_type(const Message& m) {
  return std::visit([](const auto& v) { return std::decay_t<decltype(v)>::kType; }, m);
}

Bytes serialize(const Message& m) {
  return std::visit([](const auto& v) { return serialize(v); }, m);
}

Frame to_frame(const Message& m) {
  MessageType t = message_type(m);
  return Frame(make_extension_type(0, is_channel_message(t)), (std::uint8_t)t, serialize(m));
}

// Walks the variant alternatives for the one whose kType matches
template <std::size_t I = 0>
static Message decode_alternative(MessageType t, const std::uint8_t* p, std::size_t n) {
  if constexpr (I == std::variant_size_v<Message>) {
    throw Error(ErrorCode::UnsupportedMessage, (std::uint8_t)t, "no decoder for message type");
  } else {
    using M = std::variant_alternative_t<I, Message>;
    if (M::kType == t) return deserialize_as<M>(p, n);
    return decode_alternative<I + 1>(t, p, n);
  }
}

DecodedMessage deserialize(std::uint16_t extension_type, std::uint8_t message_type,
                           const std::uint8_t* payload, std::size_t len) {
  auto t = message_type_from_code(message_type);
  if ((extension_type & kExtensionTypeMask) != 0 || !t) {
    logger()->debug("unsupported message ext={:#06x} type={:#04x} len={}",
                    extension_type, message_type, len);
    return UnsupportedMessage{extension_type, message_type, Bytes(payload, payload + len)};
  }

  bool channel_bit = (extension_type & kChannelBitMask) != 0;
  if (channel_bit != is_channel_message(*t)) {
    malformed(*t, channel_bit ? "unexpected channel bit" : "missing channel bit");
  }
  return decode_alternative(*t, payload, len);
}

DecodedMessage deserialize(std::uint16_t extension_type, std::uint8_t message_type,
                           const Bytes& payload) {
  return deserialize(extension_type, message_type, payload.data(), payload.size());
}

DecodedMessage from_frame(const Frame& f) {
  return deserialize(f.extension_type(), f.message_type(), f.payload());
}

bool has_unknown_protocol(const Frame& f) {
  // protocol is the first payload byte
  return f.extension_type() == 0 &&
         f.message_type() == (std::uint8_t)MessageType::SetupConnection &&
         !f.payload().empty() && !is_known_protocol(f.payload()[0]);
}

} // namespace sv2
