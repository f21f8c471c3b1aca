#include "sv2/messages.hpp"

#include <cstddef>
#include <cstdint>
#include <variant>

template <std::size_t I = 0>
static void decode_every_type(const std::uint8_t* data, std::size_t size) {
  if constexpr (I < std::variant_size_v<sv2::Message>) {
    using M = std::variant_alternative_t<I, sv2::Message>;
    try {
      M m = sv2::deserialize_as<M>(data, size);
      // Whatever decodes must encode back to the same bytes
      sv2::Bytes again = sv2::serialize(m);
      if (again.size() != size) __builtin_trap();
    } catch (const sv2::Error&) {
    }
    decode_every_type<I + 1>(data, size);
  }
}

extern "C" int LLVMFuzzerTestOneInput(const std::uint8_t* data, std::size_t size) {
  decode_every_type(data, size);
  return 0;
}
