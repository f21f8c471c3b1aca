#pragma once
#include <cstdint>
#include <optional>

namespace sv2 {

// Message type codes of the Common and Mining protocols (extension_type 0)
enum class MessageType : std::uint8_t {
  SetupConnection = 0x00,
  SetupConnectionSuccess = 0x01,
  SetupConnectionError = 0x02,
  ChannelEndpointChanged = 0x03,

  OpenStandardMiningChannel = 0x10,
  OpenStandardMiningChannelSuccess = 0x11,
  OpenStandardMiningChannelError = 0x12,
  OpenExtendedMiningChannel = 0x13,
  OpenExtendedMiningChannelSuccess = 0x14,
  OpenExtendedMiningChannelError = 0x15,
  UpdateChannel = 0x16,
  UpdateChannelError = 0x17,
  CloseChannel = 0x18,
  SetExtranoncePrefix = 0x19,
  SubmitSharesStandard = 0x1a,
  SubmitSharesExtended = 0x1b,
  SubmitSharesSuccess = 0x1c,
  SubmitSharesError = 0x1d,
  NewMiningJob = 0x1e,
  NewExtendedMiningJob = 0x1f,
  SetNewPrevHash = 0x20,
  SetTarget = 0x21,
  SetCustomMiningJob = 0x22,
  SetCustomMiningJobSuccess = 0x23,
  SetCustomMiningJobError = 0x24,
  Reconnect = 0x25,
  SetGroupChannel = 0x26
};

// Nothing for codes outside the catalog
std::optional<MessageType> message_type_from_code(std::uint8_t code);

const char* message_name(MessageType t) noexcept;

// Whether frames of this type must carry the channel bit
bool is_channel_message(MessageType t) noexcept;

// SetupConnection.protocol
enum class Protocol : std::uint8_t {
  Mining = 0,
  JobNegotiation = 1,
  TemplateDistribution = 2,
  JobDistribution = 3
};

const char* protocol_name(Protocol p) noexcept;

bool is_known_protocol(std::uint8_t p) noexcept;

// SetupConnection.flags for the Mining protocol
namespace setup_flags {
static constexpr std::uint32_t kRequiresStandardJobs = 1u << 0;
static constexpr std::uint32_t kRequiresWorkSelection = 1u << 1;
static constexpr std::uint32_t kRequiresVersionRolling = 1u << 2;
} // namespace setup_flags

// SetupConnection.flags for the Job Negotiation protocol
namespace job_negotiation_flags {
static constexpr std::uint32_t kRequiresAsyncJobMining = 1u << 0;
} // namespace job_negotiation_flags

// SetupConnectionSuccess.flags for the Mining protocol
namespace success_flags {
static constexpr std::uint32_t kRequiresFixedVersion = 1u << 0;
static constexpr std::uint32_t kRequiresExtendedChannels = 1u << 1;
} // namespace success_flags

namespace error_codes {
static constexpr const char* kUnsupportedFeatureFlags = "unsupported-feature-flags";
static constexpr const char* kUnsupportedProtocol = "unsupported-protocol";
static constexpr const char* kProtocolVersionMismatch = "protocol-version-mismatch";
static constexpr const char* kUnknownUser = "unknown-user";
static constexpr const char* kMaxTargetOutOfRange = "max-target-out-of-range";
static constexpr const char* kInvalidChannelId = "invalid-channel-id";
static constexpr const char* kInvalidJobId = "invalid-job-id";
static constexpr const char* kStaleShare = "stale-share";
static constexpr const char* kDifficultyTooLow = "difficulty-too-low";
} // namespace error_codes

// Random channel id from the CSPRNG
std::uint32_t new_channel_id();

} // namespace sv2
