#include "sv2/framing.hpp"
#include <utility>

namespace sv2 {

std::array<std::uint8_t, kHeaderLen> encode_header(const FrameHeader& h) {
  ensure(h.payload_length <= kMaxPayloadLen, ErrorCode::PayloadTooLarge,
         "payload length exceeds U24");
  std::array<std::uint8_t, kHeaderLen> out{};
  out[0] = (std::uint8_t)(h.extension_type & 0xFF);
  out[1] = (std::uint8_t)((h.extension_type >> 8) & 0xFF);
  out[2] = h.message_type;
  out[3] = (std::uint8_t)(h.payload_length & 0xFF);
  out[4] = (std::uint8_t)((h.payload_length >> 8) & 0xFF);
  out[5] = (std::uint8_t)((h.payload_length >> 16) & 0xFF);
  return out;
}

std::optional<FrameHeader> peek_header(const std::uint8_t* data, std::size_t len) {
  if (len < kHeaderLen) return std::nullopt;
  FrameHeader h;
  h.extension_type = (std::uint16_t)(data[0] | (data[1] << 8));
  h.message_type = data[2];
  h.payload_length = (std::uint32_t)data[3] |
                     ((std::uint32_t)data[4] << 8) |
                     ((std::uint32_t)data[5] << 16);
  return h;
}

// ------------------------------ Frame ------------------------------

Frame::Frame(std::uint16_t extension_type, std::uint8_t message_type, Bytes payload,
             const FrameLimits& limits)
  : extension_type_(extension_type), message_type_(message_type), payload_(std::move(payload)) {
  ensure(payload_.size() <= kMaxPayloadLen && payload_.size() <= limits.max_payload_len,
         ErrorCode::PayloadTooLarge, "frame payload exceeds cap");
}

FrameHeader Frame::header() const {
  FrameHeader h;
  h.extension_type = extension_type_;
  h.message_type = message_type_;
  h.payload_length = payload_length();
  return h;
}

Bytes Frame::serialize() const {
  auto hdr = encode_header(header());
  Bytes out;
  out.reserve(kHeaderLen + payload_.size());
  out.insert(out.end(), hdr.begin(), hdr.end());
  out.insert(out.end(), payload_.begin(), payload_.end());
  return out;
}

bool operator==(const Frame& a, const Frame& b) {
  return a.extension_type_ == b.extension_type_ &&
         a.message_type_ == b.message_type_ &&
         a.payload_ == b.payload_;
}

Bytes encode_frame(std::uint16_t extension_type, std::uint8_t message_type,
                   const Bytes& payload, const FrameLimits& limits) {
  return Frame(extension_type, message_type, payload, limits).serialize();
}

// ------------------------------ decode ------------------------------

FrameDecodeResult decode_frame(ByteCursor& cur, const FrameLimits& limits) {
  auto h = peek_header(cur.current(), cur.remaining());
  if (!h) return Incomplete{kHeaderLen - cur.remaining()};

  if (h->payload_length > limits.max_payload_len) {
    return Invalid{ErrorCode::PayloadTooLarge, "declared payload length exceeds cap"};
  }

  std::size_t total = kHeaderLen + (std::size_t)h->payload_length;
  if (cur.remaining() < total) return Incomplete{total - cur.remaining()};

  cur.skip(kHeaderLen);
  Bytes payload = cur.take(h->payload_length);
  return Frame(h->extension_type, h->message_type, std::move(payload), limits);
}

// ------------------------------ FrameReader ------------------------------

FrameReader::FrameReader(FrameLimits limits) : limits_(limits) {
  validate_config(limits_);
}

void FrameReader::feed(const std::uint8_t* data, std::size_t n) {
  ensure(!poisoned_, ErrorCode::InvalidFrame, "frame reader is poisoned");
  if (start_ > 0 && start_ == buf_.size()) {
    buf_.clear();
    start_ = 0;
  }
  if (n) buf_.insert(buf_.end(), data, data + n);
}

std::optional<Frame> FrameReader::next() {
  ensure(!poisoned_, ErrorCode::InvalidFrame, "frame reader is poisoned");

  ByteCursor cur(buf_.data() + start_, buf_.size() - start_);
  FrameDecodeResult r = decode_frame(cur, limits_);

  if (auto* inv = std::get_if<Invalid>(&r)) {
    poisoned_ = true;
    throw Error(ErrorCode::InvalidFrame, inv->reason);
  }
  if (std::holds_alternative<Incomplete>(r)) {
    // Compact once the consumed prefix dominates the buffer
    if (start_ > 0 && start_ >= buf_.size() / 2) {
      buf_.erase(buf_.begin(), buf_.begin() + (std::ptrdiff_t)start_);
      start_ = 0;
    }
    return std::nullopt;
  }

  start_ += cur.position();
  return std::get<Frame>(std::move(r));
}

} // namespace sv2
