#pragma once
#include "sv2.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "error.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace sv2 {

// Wire header: u16 extension_type | u8 msg_type | U24 msg_length (all LE).
// Bit 15 of extension_type flags a channel message.
struct FrameHeader {
  std::uint16_t extension_type{0};
  std::uint8_t message_type{0};
  std::uint32_t payload_length{0};

  std::uint16_t extension() const { return extension_type & kExtensionTypeMask; }
  bool channel_msg() const { return (extension_type & kChannelBitMask) != 0; }
};

std::array<std::uint8_t, kHeaderLen> encode_header(const FrameHeader& h);

// Header-only peek; nothing when fewer than kHeaderLen bytes are available
std::optional<FrameHeader> peek_header(const std::uint8_t* data, std::size_t len);

inline std::uint16_t make_extension_type(std::uint16_t extension, bool channel_msg) {
  return (std::uint16_t)((extension & kExtensionTypeMask) | (channel_msg ? kChannelBitMask : 0));
}

// Immutable once constructed; payload_length() always equals payload().size()
class Frame {
public:
  Frame(std::uint16_t extension_type, std::uint8_t message_type, Bytes payload,
        const FrameLimits& limits = {});

  std::uint16_t extension_type() const { return extension_type_; }
  std::uint16_t extension() const { return extension_type_ & kExtensionTypeMask; }
  bool channel_msg() const { return (extension_type_ & kChannelBitMask) != 0; }
  std::uint8_t message_type() const { return message_type_; }
  std::uint32_t payload_length() const { return (std::uint32_t)payload_.size(); }
  const Bytes& payload() const { return payload_; }

  FrameHeader header() const;

  // Header followed by payload
  Bytes serialize() const;

  friend bool operator==(const Frame& a, const Frame& b);
  friend bool operator!=(const Frame& a, const Frame& b) { return !(a == b); }

private:
  std::uint16_t extension_type_;
  std::uint8_t message_type_;
  Bytes payload_;
};

// Throws Error(PayloadTooLarge) past limits.max_payload_len
Bytes encode_frame(std::uint16_t extension_type, std::uint8_t message_type,
                   const Bytes& payload, const FrameLimits& limits = {});

// More input is needed; `needed` counts bytes beyond what the cursor holds
struct Incomplete {
  std::size_t needed{0};
};

struct Invalid {
  ErrorCode code{ErrorCode::InvalidFrame};
  std::string reason;
};

using FrameDecodeResult = std::variant<Incomplete, Invalid, Frame>;

// Reads the header, checks the cap, checks the remaining input, and only
// then copies the payload. The cursor advances only when a Frame is returned.
FrameDecodeResult decode_frame(ByteCursor& cur, const FrameLimits& limits = {});

// Buffers a partially received byte stream and yields whole frames.
class FrameReader {
public:
  explicit FrameReader(FrameLimits limits = {});

  void feed(const std::uint8_t* data, std::size_t n);
  void feed(const Bytes& data) { feed(data.data(), data.size()); }

  // Next complete frame, or nothing when more input is needed.
  // An invalid header throws Error(InvalidFrame) and poisons the reader.
  std::optional<Frame> next();

  std::size_t buffered() const { return buf_.size() - start_; }
  bool poisoned() const { return poisoned_; }

private:
  FrameLimits limits_;
  Bytes buf_;
  std::size_t start_{0};
  bool poisoned_{false};
};

} // namespace sv2
