#include "sv2/framing.hpp"
#include "sv2/messages.hpp"

#include <cstddef>
#include <cstdint>
#include <variant>

// Arbitrary bytes through the frame reader and message dispatch
extern "C" int LLVMFuzzerTestOneInput(const std::uint8_t* data, std::size_t size) {
  sv2::FrameLimits limits;
  limits.max_payload_len = 1 << 16;
  sv2::FrameReader reader(limits);
  try {
    reader.feed(data, size);
    while (auto f = reader.next()) {
      try {
        sv2::from_frame(*f);
      } catch (const sv2::Error&) {
      }
    }
  } catch (const sv2::Error&) {
  }
  return 0;
}
