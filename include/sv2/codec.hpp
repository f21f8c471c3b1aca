#pragma once
#include "sv2.hpp"
#include "error.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace sv2 {

// Little-endian primitive codec for the Stratum V2 binary types.
//
//   U8 U16 U24 U32 U64 F32 BOOL   fixed width, little-endian
//   U256, Signature64            fixed byte arrays
//   B0_32 B0_255 B0_64K B0_16M   byte strings, 1/1/2/3-byte length prefix
//   STR0_32 STR0_255             UTF-8 strings, 1-byte length prefix
//   SEQ0_255[T] SEQ0_64K[T]      sequences, 1/2-byte count prefix

using U256 = std::array<std::uint8_t, 32>;
using Signature64 = std::array<std::uint8_t, 64>;

class U24 {
public:
  static constexpr std::uint32_t kMax = 0xFFFFFF;

  U24() = default;
  explicit U24(std::uint32_t v) : v_(v) {
    ensure(v <= kMax, ErrorCode::TooLong, "U24 value out of range");
  }
  std::uint32_t value() const { return v_; }

  friend bool operator==(const U24& a, const U24& b) { return a.v_ == b.v_; }
  friend bool operator!=(const U24& a, const U24& b) { return a.v_ != b.v_; }

private:
  std::uint32_t v_{0};
};

bool is_valid_utf8(const std::uint8_t* p, std::size_t n);

// ------------------------------ writer ------------------------------

class ByteWriter {
public:
  ByteWriter() = default;
  explicit ByteWriter(std::size_t reserve) { out_.reserve(reserve); }

  void u8(std::uint8_t v) { out_.push_back(v); }
  void u16(std::uint16_t v);
  void u24(std::uint32_t v);
  void u32(std::uint32_t v);
  void u64(std::uint64_t v);
  void f32(float v);
  void boolean(bool v) { out_.push_back(v ? 1 : 0); }
  void raw(const std::uint8_t* p, std::size_t n);
  void length_prefix(std::size_t n, std::size_t prefix_len);

  // Encodes every field in order; used by message field visitors
  template <class... T>
  void operator()(const T&... fields);

  std::size_t size() const { return out_.size(); }
  const Bytes& bytes() const { return out_; }
  Bytes take() { return std::move(out_); }

private:
  Bytes out_;
};

// ------------------------------ cursor ------------------------------

// Explicit position over a bounds-checked slice. Reads never go past the
// slice; a short read throws Error(Truncated) and leaves the position alone.
class ByteCursor {
public:
  ByteCursor(const std::uint8_t* data, std::size_t len) : data_(data), len_(len) {}
  explicit ByteCursor(const Bytes& b) : data_(b.data()), len_(b.size()) {}

  std::size_t position() const { return pos_; }
  std::size_t remaining() const { return len_ - pos_; }
  bool at_end() const { return pos_ == len_; }
  const std::uint8_t* current() const { return data_ + pos_; }

  std::uint8_t u8();
  std::uint16_t u16();
  std::uint32_t u24();
  std::uint32_t u32();
  std::uint64_t u64();
  float f32();
  bool boolean();
  void read_into(std::uint8_t* out, std::size_t n);
  Bytes take(std::size_t n);
  void skip(std::size_t n);

  // Reads a prefix of prefix_len bytes, checks it against max (TooLong) and
  // against the remaining input (Truncated)
  std::size_t length_prefix(std::size_t prefix_len, std::size_t max);

  // Trailing bytes throw Error(TooLong)
  void expect_end() const;

  template <class... T>
  void operator()(T&... fields);

private:
  void need(std::size_t n) const;

  const std::uint8_t* data_;
  std::size_t len_;
  std::size_t pos_{0};
};

// ------------------------------ length-prefixed types ------------------------------

template <std::size_t Max, std::size_t PrefixLen>
class B0 {
public:
  static constexpr std::size_t kMaxLen = Max;
  static constexpr std::size_t kPrefixLen = PrefixLen;

  B0() = default;
  explicit B0(Bytes data) : data_(std::move(data)) {
    ensure(data_.size() <= Max, ErrorCode::TooLong, "byte string exceeds its bound");
  }
  B0(std::initializer_list<std::uint8_t> il) : B0(Bytes(il)) {}

  const Bytes& bytes() const { return data_; }
  std::size_t size() const { return data_.size(); }
  bool empty() const { return data_.empty(); }

  friend bool operator==(const B0& a, const B0& b) { return a.data_ == b.data_; }
  friend bool operator!=(const B0& a, const B0& b) { return a.data_ != b.data_; }

private:
  Bytes data_;
};

using B0_32 = B0<32, 1>;
using B0_255 = B0<255, 1>;
using B0_64K = B0<65535, 2>;
using B0_16M = B0<16777215, 3>;

template <std::size_t Max>
class Str0 {
public:
  static constexpr std::size_t kMaxLen = Max;

  Str0() = default;
  // Throws TooLong past Max bytes and InvalidArgument on bad UTF-8
  Str0(std::string s) : s_(std::move(s)) {
    ensure(s_.size() <= Max, ErrorCode::TooLong, "string exceeds its bound");
    ensure(is_valid_utf8((const std::uint8_t*)s_.data(), s_.size()),
           ErrorCode::InvalidArgument, "string is not valid UTF-8");
  }
  Str0(const char* s) : Str0(std::string(s)) {}

  const std::string& str() const { return s_; }
  std::size_t size() const { return s_.size(); }
  bool empty() const { return s_.empty(); }

  friend bool operator==(const Str0& a, const Str0& b) { return a.s_ == b.s_; }
  friend bool operator!=(const Str0& a, const Str0& b) { return a.s_ != b.s_; }

private:
  std::string s_;
};

using Str0_32 = Str0<32>;
using Str0_255 = Str0<255>;

template <class T, std::size_t Max, std::size_t PrefixLen>
class Seq0 {
public:
  static constexpr std::size_t kMaxLen = Max;
  static constexpr std::size_t kPrefixLen = PrefixLen;

  Seq0() = default;
  explicit Seq0(std::vector<T> items) : items_(std::move(items)) {
    ensure(items_.size() <= Max, ErrorCode::TooLong, "sequence exceeds its bound");
  }
  Seq0(std::initializer_list<T> il) : Seq0(std::vector<T>(il)) {}

  const std::vector<T>& items() const { return items_; }
  std::size_t size() const { return items_.size(); }
  bool empty() const { return items_.empty(); }
  const T& operator[](std::size_t i) const { return items_[i]; }

  friend bool operator==(const Seq0& a, const Seq0& b) { return a.items_ == b.items_; }
  friend bool operator!=(const Seq0& a, const Seq0& b) { return a.items_ != b.items_; }

private:
  std::vector<T> items_;
};

template <class T> using Seq0_255 = Seq0<T, 255, 1>;
template <class T> using Seq0_64K = Seq0<T, 65535, 2>;

// ------------------------------ encode / decode overloads ------------------------------

inline void encode(ByteWriter& w, std::uint8_t v) { w.u8(v); }
inline void encode(ByteWriter& w, std::uint16_t v) { w.u16(v); }
inline void encode(ByteWriter& w, std::uint32_t v) { w.u32(v); }
inline void encode(ByteWriter& w, std::uint64_t v) { w.u64(v); }
inline void encode(ByteWriter& w, float v) { w.f32(v); }
inline void encode(ByteWriter& w, bool v) { w.boolean(v); }
inline void encode(ByteWriter& w, const U24& v) { w.u24(v.value()); }

template <std::size_t N>
void encode(ByteWriter& w, const std::array<std::uint8_t, N>& v) {
  w.raw(v.data(), N);
}

template <std::size_t Max, std::size_t PrefixLen>
void encode(ByteWriter& w, const B0<Max, PrefixLen>& v) {
  w.length_prefix(v.size(), PrefixLen);
  w.raw(v.bytes().data(), v.size());
}

template <std::size_t Max>
void encode(ByteWriter& w, const Str0<Max>& v) {
  w.length_prefix(v.size(), 1);
  w.raw((const std::uint8_t*)v.str().data(), v.size());
}

template <class T, std::size_t Max, std::size_t PrefixLen>
void encode(ByteWriter& w, const Seq0<T, Max, PrefixLen>& v) {
  w.length_prefix(v.size(), PrefixLen);
  for (const auto& item : v.items()) encode(w, item);
}

inline void decode(ByteCursor& c, std::uint8_t& v) { v = c.u8(); }
inline void decode(ByteCursor& c, std::uint16_t& v) { v = c.u16(); }
inline void decode(ByteCursor& c, std::uint32_t& v) { v = c.u32(); }
inline void decode(ByteCursor& c, std::uint64_t& v) { v = c.u64(); }
inline void decode(ByteCursor& c, float& v) { v = c.f32(); }
inline void decode(ByteCursor& c, bool& v) { v = c.boolean(); }
inline void decode(ByteCursor& c, U24& v) { v = U24(c.u24()); }

template <std::size_t N>
void decode(ByteCursor& c, std::array<std::uint8_t, N>& v) {
  c.read_into(v.data(), N);
}

template <std::size_t Max, std::size_t PrefixLen>
void decode(ByteCursor& c, B0<Max, PrefixLen>& v) {
  std::size_t n = c.length_prefix(PrefixLen, Max);
  v = B0<Max, PrefixLen>(c.take(n));
}

template <std::size_t Max>
void decode(ByteCursor& c, Str0<Max>& v) {
  std::size_t n = c.length_prefix(1, Max);
  ensure(is_valid_utf8(c.current(), n), ErrorCode::MalformedMessage, "string is not valid UTF-8");
  Bytes raw = c.take(n);
  v = Str0<Max>(std::string(raw.begin(), raw.end()));
}

template <class T, std::size_t Max, std::size_t PrefixLen>
void decode(ByteCursor& c, Seq0<T, Max, PrefixLen>& v) {
  std::size_t count = c.length_prefix(PrefixLen, Max);
  std::vector<T> items;
  // Elements are at least one byte, so remaining() bounds the reservation
  items.reserve(count < c.remaining() ? count : c.remaining());
  for (std::size_t i = 0; i < count; ++i) {
    T item{};
    decode(c, item);
    items.push_back(std::move(item));
  }
  v = Seq0<T, Max, PrefixLen>(std::move(items));
}

template <class... T>
void ByteWriter::operator()(const T&... fields) {
  (encode(*this, fields), ...);
}

template <class... T>
void ByteCursor::operator()(T&... fields) {
  (decode(*this, fields), ...);
}

} // namespace sv2
