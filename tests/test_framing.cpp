#include "sv2/framing.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <variant>

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

bool test_header_layout() {
  sv2::FrameHeader h;
  h.extension_type = 0x8001;
  h.message_type = 0x1e;
  h.payload_length = 0x0A0B0C;
  auto bytes = sv2::encode_header(h);
  if (bytes[0] != 0x01 || bytes[1] != 0x80 || bytes[2] != 0x1e) return false;
  if (bytes[3] != 0x0C || bytes[4] != 0x0B || bytes[5] != 0x0A) return false;

  auto back = sv2::peek_header(bytes.data(), bytes.size());
  if (!back) return false;
  if (!back->channel_msg() || back->extension() != 1) return false;
  return back->payload_length == 0x0A0B0C;
}

bool test_peek_needs_six_bytes() {
  const std::uint8_t five[5] = {0};
  return !sv2::peek_header(five, sizeof(five)).has_value();
}

bool test_encode_decode_frame() {
  sv2::Bytes payload = {0xDE, 0xAD, 0xBE, 0xEF};
  sv2::Bytes wire = sv2::encode_frame(sv2::make_extension_type(0, true), 0x21, payload);
  if (wire.size() != sv2::kHeaderLen + payload.size()) return false;

  sv2::ByteCursor cur(wire);
  auto r = sv2::decode_frame(cur);
  auto* f = std::get_if<sv2::Frame>(&r);
  if (!f) return false;
  if (!f->channel_msg() || f->message_type() != 0x21) return false;
  if (f->payload() != payload) return false;
  return cur.at_end();
}

bool test_incomplete_does_not_advance() {
  sv2::Bytes wire = sv2::encode_frame(0, 0x01, sv2::Bytes(10, 0x55));

  sv2::ByteCursor head(wire.data(), 3);
  auto r1 = sv2::decode_frame(head);
  auto* inc1 = std::get_if<sv2::Incomplete>(&r1);
  if (!inc1 || inc1->needed != 3 || head.position() != 0) return false;

  sv2::ByteCursor part(wire.data(), 12);
  auto r2 = sv2::decode_frame(part);
  auto* inc2 = std::get_if<sv2::Incomplete>(&r2);
  if (!inc2 || inc2->needed != 4 || part.position() != 0) return false;
  return true;
}

bool test_empty_input() {
  const sv2::Bytes empty;
  sv2::ByteCursor cur(empty);
  auto r = sv2::decode_frame(cur);
  auto* inc = std::get_if<sv2::Incomplete>(&r);
  if (!inc || inc->needed != sv2::kHeaderLen || cur.position() != 0) return false;

  sv2::FrameReader reader;
  reader.feed(empty);
  return !reader.next().has_value() && !reader.poisoned();
}

// Headers shorter than six bytes are never judged, whatever they hold
bool test_short_headers_incomplete() {
  std::uint32_t seed = 0x9e3779b9u;
  for (int round = 0; round < 256; ++round) {
    std::uint8_t hdr[sv2::kHeaderLen];
    for (std::uint8_t& b : hdr) {
      seed = seed * 1664525u + 1013904223u;
      b = (std::uint8_t)(seed >> 24);
    }
    if (round == 0) {
      for (std::uint8_t& b : hdr) b = 0xFF;
    }
    for (std::size_t n = 0; n < sv2::kHeaderLen; ++n) {
      sv2::ByteCursor cur(hdr, n);
      auto r = sv2::decode_frame(cur);
      auto* inc = std::get_if<sv2::Incomplete>(&r);
      if (!inc || inc->needed != sv2::kHeaderLen - n || cur.position() != 0) {
        std::printf("  header prefix of %zu bytes not incomplete\n", n);
        return false;
      }
    }
    // The whole header alone decodes only when it declares no payload
    sv2::ByteCursor cur(hdr, sizeof(hdr));
    auto r = sv2::decode_frame(cur);
    std::uint32_t declared = hdr[3] | (hdr[4] << 8) | ((std::uint32_t)hdr[5] << 16);
    if (std::holds_alternative<sv2::Frame>(r) != (declared == 0)) return false;
  }
  return true;
}

bool test_cap_checked_before_payload() {
  // Header alone declares a payload over the cap; no payload bytes follow
  sv2::FrameHeader h;
  h.message_type = 0x00;
  h.payload_length = 1025;
  auto hdr = sv2::encode_header(h);

  sv2::FrameLimits limits;
  limits.max_payload_len = 1024;
  sv2::ByteCursor cur(hdr.data(), hdr.size());
  auto r = sv2::decode_frame(cur, limits);
  auto* inv = std::get_if<sv2::Invalid>(&r);
  if (!inv || inv->code != sv2::ErrorCode::PayloadTooLarge) return false;
  return cur.position() == 0;
}

bool test_frame_constructor_cap() {
  sv2::FrameLimits limits;
  limits.max_payload_len = 4;
  return throws_code(sv2::ErrorCode::PayloadTooLarge,
                     [&] { sv2::Frame f(0, 0, sv2::Bytes(5, 0), limits); });
}

bool test_empty_payload() {
  sv2::Frame f(0, 0x1c, {});
  sv2::Bytes wire = f.serialize();
  if (wire.size() != sv2::kHeaderLen) return false;
  sv2::ByteCursor cur(wire);
  auto r = sv2::decode_frame(cur);
  auto* back = std::get_if<sv2::Frame>(&r);
  return back && *back == f;
}

bool test_reader_splits_stream() {
  sv2::Bytes a = sv2::encode_frame(0, 0x10, sv2::Bytes(7, 0x01));
  sv2::Bytes b = sv2::encode_frame(sv2::make_extension_type(0, true), 0x18, sv2::Bytes(3, 0x02));
  sv2::Bytes stream = a;
  stream.insert(stream.end(), b.begin(), b.end());

  sv2::FrameReader reader;
  // Byte at a time
  int frames = 0;
  for (std::uint8_t byte : stream) {
    reader.feed(&byte, 1);
    while (auto f = reader.next()) {
      ++frames;
      if (frames == 1 && f->message_type() != 0x10) return false;
      if (frames == 2 && (f->message_type() != 0x18 || !f->channel_msg())) return false;
    }
  }
  return frames == 2 && reader.buffered() == 0;
}

bool test_reader_poisons_on_oversize() {
  sv2::FrameLimits limits;
  limits.max_payload_len = 16;
  sv2::FrameReader reader(limits);

  sv2::FrameHeader h;
  h.payload_length = 17;
  auto hdr = sv2::encode_header(h);
  reader.feed(hdr.data(), hdr.size());

  if (!throws_code(sv2::ErrorCode::InvalidFrame, [&] { reader.next(); })) return false;
  if (!reader.poisoned()) return false;
  return throws_code(sv2::ErrorCode::InvalidFrame, [&] { reader.feed(hdr.data(), 1); });
}

} // namespace

int main() {
  if (!test_header_layout()) {
    std::printf("test_header_layout failed\n");
    return EXIT_FAILURE;
  }
  if (!test_peek_needs_six_bytes()) {
    std::printf("test_peek_needs_six_bytes failed\n");
    return EXIT_FAILURE;
  }
  if (!test_empty_input()) {
    std::printf("test_empty_input failed\n");
    return EXIT_FAILURE;
  }
  if (!test_short_headers_incomplete()) {
    std::printf("test_short_headers_incomplete failed\n");
    return EXIT_FAILURE;
  }
  if (!test_encode_decode_frame()) {
    std::printf("test_encode_decode_frame failed\n");
    return EXIT_FAILURE;
  }
  if (!test_incomplete_does_not_advance()) {
    std::printf("test_incomplete_does_not_advance failed\n");
    return EXIT_FAILURE;
  }
  if (!test_cap_checked_before_payload()) {
    std::printf("test_cap_checked_before_payload failed\n");
    return EXIT_FAILURE;
  }
  if (!test_frame_constructor_cap()) {
    std::printf("test_frame_constructor_cap failed\n");
    return EXIT_FAILURE;
  }
  if (!test_empty_payload()) {
    std::printf("test_empty_payload failed\n");
    return EXIT_FAILURE;
  }
  if (!test_reader_splits_stream()) {
    std::printf("test_reader_splits_stream failed\n");
    return EXIT_FAILURE;
  }
  if (!test_reader_poisons_on_oversize()) {
    std::printf("test_reader_poisons_on_oversize failed\n");
    return EXIT_FAILURE;
  }

  std::printf("All framing tests passed\n");
  return EXIT_SUCCESS;
}
