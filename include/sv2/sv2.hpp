#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace sv2 {
using Bytes = std::vector<std::uint8_t>;

// Stratum V2 protocol version negotiated in SetupConnection
static constexpr std::uint16_t kProtocolVersion = 2;

// Frame header: u16 extension_type | u8 msg_type | U24 msg_length
static constexpr std::size_t kHeaderLen = 6;
static constexpr std::uint32_t kMaxPayloadLen = 0xFFFFFF;
static constexpr std::uint16_t kChannelBitMask = 0x8000;
static constexpr std::uint16_t kExtensionTypeMask = 0x7FFF;
} // namespace sv2
