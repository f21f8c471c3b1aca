#include "sv2/messages.hpp"

#include <cstddef>
#include <cstdint>

extern "C" int LLVMFuzzerTestOneInput(const std::uint8_t* data, std::size_t size) {
  try {
    sv2::deserialize_as<sv2::SetupConnection>(data, size);
  } catch (const sv2::Error&) {
  }
  try {
    sv2::deserialize_as<sv2::SetupConnectionError>(data, size);
  } catch (const sv2::Error&) {
  }
  return 0;
}
