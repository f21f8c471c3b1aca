#include "sv2/codec.hpp"
#include <cstring>

namespace sv2 {

bool is_valid_utf8(const std::uint8_t* p, std::size_t n) {
  std::size_t i = 0;
  while (i < n) {
    std::uint8_t c = p[i];
    if (c < 0x80) {
      ++i;
      continue;
    }
    std::size_t extra = 0;
    std::uint32_t cp = 0;
    std::uint32_t min = 0;
    if ((c & 0xE0) == 0xC0) {
      extra = 1; cp = c & 0x1F; min = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2; cp = c & 0x0F; min = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3; cp = c & 0x07; min = 0x10000;
    } else {
      return false;
    }
    if (n - i <= extra) return false;
    for (std::size_t k = 1; k <= extra; ++k) {
      std::uint8_t cc = p[i + k];
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    // overlong, surrogate, beyond U+10FFFF
    if (cp < min || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) return false;
    i += extra + 1;
  }
  return true;
}

// ------------------------------ ByteWriter ------------------------------

void ByteWriter::u16(std::uint16_t v) {
  out_.push_back((std::uint8_t)(v & 0xFF));
  out_.push_back((std::uint8_t)((v >> 8) & 0xFF));
}

void ByteWriter::u24(std::uint32_t v) {
  ensure(v <= U24::kMax, ErrorCode::TooLong, "U24 value out of range");
  out_.push_back((std::uint8_t)(v & 0xFF));
  out_.push_back((std::uint8_t)((v >> 8) & 0xFF));
  out_.push_back((std::uint8_t)((v >> 16) & 0xFF));
}

void ByteWriter::u32(std::uint32_t v) {
  for (int i = 0; i < 4; ++i) out_.push_back((std::uint8_t)((v >> (8 * i)) & 0xFF));
}

void ByteWriter::u64(std::uint64_t v) {
  for (int i = 0; i < 8; ++i) out_.push_back((std::uint8_t)((v >> (8 * i)) & 0xFF));
}

void ByteWriter::f32(float v) {
  std::uint32_t bits = 0;
  std::memcpy(&bits, &v, sizeof(bits));
  u32(bits);
}

void ByteWriter::raw(const std::uint8_t* p, std::size_t n) {
  if (n) out_.insert(out_.end(), p, p + n);
}

void ByteWriter::length_prefix(std::size_t n, std::size_t prefix_len) {
  switch (prefix_len) {
    case 1:
      ensure(n <= 0xFF, ErrorCode::TooLong, "length exceeds 1-byte prefix");
      u8((std::uint8_t)n);
      break;
    case 2:
      ensure(n <= 0xFFFF, ErrorCode::TooLong, "length exceeds 2-byte prefix");
      u16((std::uint16_t)n);
      break;
    case 3:
      u24((std::uint32_t)(n <= U24::kMax ? n : U24::kMax + 1u));
      break;
    default:
      throw Error(ErrorCode::InvalidArgument, "unsupported length prefix width");
  }
}

// ------------------------------ ByteCursor ------------------------------

void ByteCursor::need(std::size_t n) const {
  ensure(n <= remaining(), ErrorCode::Truncated, "input truncated");
}

std::uint8_t ByteCursor::u8() {
  need(1);
  return data_[pos_++];
}

std::uint16_t ByteCursor::u16() {
  need(2);
  std::uint16_t v = (std::uint16_t)(data_[pos_] | (data_[pos_ + 1] << 8));
  pos_ += 2;
  return v;
}

std::uint32_t ByteCursor::u24() {
  need(3);
  std::uint32_t v = (std::uint32_t)data_[pos_] |
                    ((std::uint32_t)data_[pos_ + 1] << 8) |
                    ((std::uint32_t)data_[pos_ + 2] << 16);
  pos_ += 3;
  return v;
}

std::uint32_t ByteCursor::u32() {
  need(4);
  std::uint32_t v = 0;
  for (int i = 3; i >= 0; --i) v = (v << 8) | data_[pos_ + i];
  pos_ += 4;
  return v;
}

std::uint64_t ByteCursor::u64() {
  need(8);
  std::uint64_t v = 0;
  for (int i = 7; i >= 0; --i) v = (v << 8) | data_[pos_ + i];
  pos_ += 8;
  return v;
}

float ByteCursor::f32() {
  std::uint32_t bits = u32();
  float v = 0;
  std::memcpy(&v, &bits, sizeof(v));
  return v;
}

bool ByteCursor::boolean() {
  need(1);
  std::uint8_t b = data_[pos_];
  ensure(b <= 1, ErrorCode::MalformedMessage, "bool must be 0 or 1");
  ++pos_;
  return b == 1;
}

void ByteCursor::read_into(std::uint8_t* out, std::size_t n) {
  need(n);
  if (n) std::memcpy(out, data_ + pos_, n);
  pos_ += n;
}

Bytes ByteCursor::take(std::size_t n) {
  need(n);
  Bytes out(data_ + pos_, data_ + pos_ + n);
  pos_ += n;
  return out;
}

void ByteCursor::skip(std::size_t n) {
  need(n);
  pos_ += n;
}

std::size_t ByteCursor::length_prefix(std::size_t prefix_len, std::size_t max) {
  std::size_t start = pos_;
  std::size_t n = 0;
  switch (prefix_len) {
    case 1: n = u8(); break;
    case 2: n = u16(); break;
    case 3: n = u24(); break;
    default: throw Error(ErrorCode::InvalidArgument, "unsupported length prefix width");
  }
  if (n > max) {
    pos_ = start;
    throw Error(ErrorCode::TooLong, "declared length exceeds type bound");
  }
  if (n > remaining()) {
    pos_ = start;
    throw Error(ErrorCode::Truncated, "declared length exceeds remaining input");
  }
  return n;
}

void ByteCursor::expect_end() const {
  ensure(at_end(), ErrorCode::TooLong, "trailing bytes");
}

} // namespace sv2
