#include "sv2/codec.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

namespace {

template <class F>
bool throws_code(sv2::ErrorCode code, F&& f) {
  try {
    f();
  } catch (const sv2::Error& e) {
    return e.code() == code;
  }
  return false;
}

bool test_fixed_width_little_endian() {
  sv2::ByteWriter w;
  w.u8(0xAB);
  w.u16(0x0102);
  w.u24(0x030405);
  w.u32(0x06070809);
  w.u64(0x1011121314151617ull);
  w.boolean(true);

  const sv2::Bytes expected = {0xAB, 0x02, 0x01, 0x05, 0x04, 0x03, 0x09, 0x08, 0x07, 0x06,
                               0x17, 0x16, 0x15, 0x14, 0x13, 0x12, 0x11, 0x10, 0x01};
  if (w.bytes() != expected) return false;

  sv2::ByteCursor c(w.bytes());
  if (c.u8() != 0xAB) return false;
  if (c.u16() != 0x0102) return false;
  if (c.u24() != 0x030405) return false;
  if (c.u32() != 0x06070809) return false;
  if (c.u64() != 0x1011121314151617ull) return false;
  if (!c.boolean()) return false;
  return c.at_end();
}

bool test_f32_bit_pattern() {
  sv2::ByteWriter w;
  w.f32(12.3f);
  const sv2::Bytes expected = {0xcd, 0xcc, 0x44, 0x41};
  if (w.bytes() != expected) return false;

  sv2::ByteCursor c(expected);
  return c.f32() == 12.3f;
}

bool test_bool_rejects_other_values() {
  const sv2::Bytes in = {0x02};
  sv2::ByteCursor c(in);
  if (!throws_code(sv2::ErrorCode::MalformedMessage, [&] { c.boolean(); })) return false;
  return c.position() == 0;
}

bool test_truncated_read_keeps_position() {
  const sv2::Bytes in = {0x01, 0x02, 0x03};
  sv2::ByteCursor c(in);
  c.u8();
  if (!throws_code(sv2::ErrorCode::Truncated, [&] { c.u32(); })) return false;
  if (c.position() != 1) return false;
  return c.u16() == 0x0302;
}

bool test_u24_range() {
  if (!throws_code(sv2::ErrorCode::TooLong, [] { sv2::U24 v(0x1000000); (void)v; })) return false;
  sv2::U24 max(sv2::U24::kMax);
  return max.value() == 0xFFFFFF;
}

bool test_length_prefixed_bytes() {
  sv2::B0_64K b(sv2::Bytes{0xAA, 0xBB, 0xCC});
  sv2::ByteWriter w;
  w(b);
  const sv2::Bytes expected = {0x03, 0x00, 0xAA, 0xBB, 0xCC};
  if (w.bytes() != expected) return false;

  sv2::B0_64K out;
  sv2::ByteCursor c(expected);
  c(out);
  return out == b && c.at_end();
}

bool test_b0_16m_uses_three_byte_prefix() {
  sv2::B0_16M b(sv2::Bytes(300, 0x11));
  sv2::ByteWriter w;
  w(b);
  if (w.size() != 303) return false;
  return w.bytes()[0] == 0x2C && w.bytes()[1] == 0x01 && w.bytes()[2] == 0x00;
}

bool test_bounds_on_construction() {
  if (!throws_code(sv2::ErrorCode::TooLong, [] { sv2::B0_32 b(sv2::Bytes(33, 0)); })) {
    return false;
  }
  if (!throws_code(sv2::ErrorCode::TooLong, [] { sv2::Str0_32 s(std::string(33, 'a')); })) {
    return false;
  }
  sv2::Str0_32 ok(std::string(32, 'a'));
  return ok.size() == 32;
}

bool test_declared_length_past_bound() {
  // B0_32 with a declared length of 33
  sv2::Bytes in(1 + 33, 0);
  in[0] = 33;
  sv2::ByteCursor c(in);
  sv2::B0_32 b;
  if (!throws_code(sv2::ErrorCode::TooLong, [&] { c(b); })) return false;
  return c.position() == 0;
}

bool test_declared_length_past_input() {
  const sv2::Bytes in = {0x05, 'a', 'b'};
  sv2::ByteCursor c(in);
  sv2::Str0_255 s;
  if (!throws_code(sv2::ErrorCode::Truncated, [&] { c(s); })) return false;
  return c.position() == 0;
}

bool test_utf8_validation() {
  const std::uint8_t ascii[] = {'o', 'k'};
  const std::uint8_t two[] = {0xC3, 0xA9};
  const std::uint8_t overlong[] = {0xC0, 0xAF};
  const std::uint8_t surrogate[] = {0xED, 0xA0, 0x80};
  const std::uint8_t beyond[] = {0xF4, 0x90, 0x80, 0x80};
  const std::uint8_t cut[] = {0xE2, 0x82};

  if (!sv2::is_valid_utf8(ascii, sizeof(ascii))) return false;
  if (!sv2::is_valid_utf8(two, sizeof(two))) return false;
  if (sv2::is_valid_utf8(overlong, sizeof(overlong))) return false;
  if (sv2::is_valid_utf8(surrogate, sizeof(surrogate))) return false;
  if (sv2::is_valid_utf8(beyond, sizeof(beyond))) return false;
  if (sv2::is_valid_utf8(cut, sizeof(cut))) return false;

  if (!throws_code(sv2::ErrorCode::InvalidArgument, [] { sv2::Str0_255 s(std::string("\xC0\xAF")); })) {
    return false;
  }

  const sv2::Bytes in = {0x02, 0xC0, 0xAF};
  sv2::ByteCursor c(in);
  sv2::Str0_255 s;
  return throws_code(sv2::ErrorCode::MalformedMessage, [&] { c(s); });
}

bool test_sequences() {
  sv2::Seq0_64K<std::uint32_t> seq({1, 2, 0x01020304});
  sv2::ByteWriter w;
  w(seq);
  const sv2::Bytes expected = {0x03, 0x00, 0x01, 0x00, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00,
                               0x04, 0x03, 0x02, 0x01};
  if (w.bytes() != expected) return false;

  sv2::Seq0_64K<std::uint32_t> out;
  sv2::ByteCursor c(expected);
  c(out);
  if (out != seq) return false;

  // Count claims more elements than the input holds
  const sv2::Bytes short_in = {0x02, 0x00, 0x01, 0x00, 0x00, 0x00};
  sv2::ByteCursor sc(short_in);
  return throws_code(sv2::ErrorCode::Truncated, [&] { sc(out); });
}

bool test_u256_sequence() {
  sv2::U256 a{};
  a.fill(0x11);
  sv2::U256 b{};
  b.fill(0x22);
  sv2::Seq0_255<sv2::U256> path({a, b});
  sv2::ByteWriter w;
  w(path);
  if (w.size() != 1 + 64) return false;
  if (w.bytes()[0] != 2 || w.bytes()[1] != 0x11 || w.bytes()[33] != 0x22) return false;

  sv2::Seq0_255<sv2::U256> out;
  sv2::ByteCursor c(w.bytes());
  c(out);
  return out == path;
}

bool test_expect_end() {
  const sv2::Bytes in = {0x01, 0x02};
  sv2::ByteCursor c(in);
  c.u8();
  return throws_code(sv2::ErrorCode::TooLong, [&] { c.expect_end(); });
}

} // namespace

int main() {
  if (!test_fixed_width_little_endian()) {
    std::printf("test_fixed_width_little_endian failed\n");
    return EXIT_FAILURE;
  }
  if (!test_f32_bit_pattern()) {
    std::printf("test_f32_bit_pattern failed\n");
    return EXIT_FAILURE;
  }
  if (!test_bool_rejects_other_values()) {
    std::printf("test_bool_rejects_other_values failed\n");
    return EXIT_FAILURE;
  }
  if (!test_truncated_read_keeps_position()) {
    std::printf("test_truncated_read_keeps_position failed\n");
    return EXIT_FAILURE;
  }
  if (!test_u24_range()) {
    std::printf("test_u24_range failed\n");
    return EXIT_FAILURE;
  }
  if (!test_length_prefixed_bytes()) {
    std::printf("test_length_prefixed_bytes failed\n");
    return EXIT_FAILURE;
  }
  if (!test_b0_16m_uses_three_byte_prefix()) {
    std::printf("test_b0_16m_uses_three_byte_prefix failed\n");
    return EXIT_FAILURE;
  }
  if (!test_bounds_on_construction()) {
    std::printf("test_bounds_on_construction failed\n");
    return EXIT_FAILURE;
  }
  if (!test_declared_length_past_bound()) {
    std::printf("test_declared_length_past_bound failed\n");
    return EXIT_FAILURE;
  }
  if (!test_declared_length_past_input()) {
    std::printf("test_declared_length_past_input failed\n");
    return EXIT_FAILURE;
  }
  if (!test_utf8_validation()) {
    std::printf("test_utf8_validation failed\n");
    return EXIT_FAILURE;
  }
  if (!test_sequences()) {
    std::printf("test_sequences failed\n");
    return EXIT_FAILURE;
  }
  if (!test_u256_sequence()) {
    std::printf("test_u256_sequence failed\n");
    return EXIT_FAILURE;
  }
  if (!test_expect_end()) {
    std::printf("test_expect_end failed\n");
    return EXIT_FAILURE;
  }

  std::printf("All codec tests passed\n");
  return EXIT_SUCCESS;
}
