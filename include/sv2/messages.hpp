#pragma once
#include "sv2.hpp"
#include "codec.hpp"
#include "framing.hpp"
#include "protocol.hpp"
#include <cstdint>
#include <string>
#include <tuple>
#include <type_traits>
#include <variant>

namespace sv2 {

// Every message struct names its type code in kType and lists its wire fields,
// in order, in fields(). The same list drives encoding, decoding and equality.

// ------------------------------ Common protocol ------------------------------

struct SetupConnection {
  static constexpr MessageType kType = MessageType::SetupConnection;
  std::uint8_t protocol{0};
  std::uint16_t min_version{kProtocolVersion};
  std::uint16_t max_version{kProtocolVersion};
  std::uint32_t flags{0};
  Str0_255 endpoint_host;
  std::uint16_t endpoint_port{0};
  Str0_255 vendor;
  Str0_255 hardware_version;
  Str0_255 firmware;
  Str0_255 device_id;

  template <class Self>
  static auto fields(Self& m) {
    return std::tie(m.protocol, m.min_version, m.max_version, m.flags, m.endpoint_host,
                    m.endpoint_port, m.vendor, m.hardware_version, m.firmware, m.device_id);
  }
};

struct SetupConnectionSuccess {
  static constexpr MessageType kType = MessageType::SetupConnectionSuccess;
  std::uint16_t used_version{kProtocolVersion};
  std::uint32_t flags{0};

  template <class Self>
  static auto fields(Self& m) { return std::tie(m.used_version, m.flags); }
};

struct SetupConnectionError {
  static constexpr MessageType kType = MessageType::SetupConnectionError;
  // Unsupported feature flags; must be non-zero with unsupported-feature-flags
  std::uint32_t flags{0};
  Str0_255 error_code;

  template <class Self>
  static auto fields(Self& m) { return std::tie(m.flags, m.error_code); }
};

struct ChannelEndpointChanged {
  static constexpr MessageType kType = MessageType::ChannelEndpointChanged;
  std::uint32_t channel_id{0};

  template <class Self>
  static auto fields(Self& m) { return std::tie(m.channel_id); }
};

// ------------------------------ Mining protocol: channels ------------------------------

struct OpenStandardMiningChannel {
  static constexpr MessageType kType = MessageType::OpenStandardMiningChannel;
  std::uint32_t request_id{0};
  Str0_255 user_identity;
  float nominal_hash_rate{0};
  U256 max_target{};

  template <class Self>
  static auto fields(Self& m) {
    return std::tie(m.request_id, m.user_identity, m.nominal_hash_rate, m.max_target);
  }
};

struct OpenStandardMiningChannelSuccess {
  static constexpr MessageType kType = MessageType::OpenStandardMiningChannelSuccess;
  std::uint32_t request_id{0};
  std::uint32_t channel_id{0};
  U256 target{};
  B0_32 extranonce_prefix;
  std::uint32_t group_channel_id{0};

  template <class Self>
  static auto fields(Self& m) {
    return std::tie(m.request_id, m.channel_id, m.target, m.extranonce_prefix, m.group_channel_id);
  }
};

struct OpenStandardMiningChannelError {
  static constexpr MessageType kType = MessageType::OpenStandardMiningChannelError;
  std::uint32_t request_id{0};
  Str0_32 error_code;

  template <class Self>
  static auto fields(Self& m) { return std::tie(m.request_id, m.error_code); }
};

struct OpenExtendedMiningChannel {
  static constexpr MessageType kType = MessageType::OpenExtendedMiningChannel;
  std::uint32_t request_id{0};
  Str0_255 user_identity;
  float nominal_hash_rate{0};
  U256 max_target{};
  std::uint16_t min_extranonce_size{0};

  template <class Self>
  static auto fields(Self& m) {
    return std::tie(m.request_id, m.user_identity, m.nominal_hash_rate, m.max_target,
                    m.min_extranonce_size);
  }
};

struct OpenExtendedMiningChannelSuccess {
  static constexpr MessageType kType = MessageType::OpenExtendedMiningChannelSuccess;
  std::uint32_t request_id{0};
  std::uint32_t channel_id{0};
  U256 target{};
  std::uint16_t extranonce_size{0};
  B0_32 extranonce_prefix;

  template <class Self>
  static auto fields(Self& m) {
    return std::tie(m.request_id, m.channel_id, m.target, m.extranonce_size, m.extranonce_prefix);
  }
};

struct OpenExtendedMiningChannelError {
  static constexpr MessageType kType = MessageType::OpenExtendedMiningChannelError;
  std::uint32_t request_id{0};
  Str0_32 error_code;

  template <class Self>
  static auto fields(Self& m) { return std::tie(m.request_id, m.error_code); }
};

struct UpdateChannel {
  static constexpr MessageType kType = MessageType::UpdateChannel;
  std::uint32_t channel_id{0};
  float nominal_hash_rate{0};
  U256 maximum_target{};

  template <class Self>
  static auto fields(Self& m) { return std::tie(m.channel_id, m.nominal_hash_rate, m.maximum_target); }
};

struct UpdateChannelError {
  static constexpr MessageType kType = MessageType::UpdateChannelError;
  std::uint32_t channel_id{0};
  Str0_32 error_code;

  template <class Self>
  static auto fields(Self& m) { return std::tie(m.channel_id, m.error_code); }
};

struct CloseChannel {
  static constexpr MessageType kType = MessageType::CloseChannel;
  std::uint32_t channel_id{0};
  Str0_32 reason_code;

  template <class Self>
  static auto fields(Self& m) { return std::tie(m.channel_id, m.reason_code); }
};

struct SetExtranoncePrefix {
  static constexpr MessageType kType = MessageType::SetExtranoncePrefix;
  std::uint32_t channel_id{0};
  B0_32 extranonce_prefix;

  template <class Self>
  static auto fields(Self& m) { return std::tie(m.channel_id, m.extranonce_prefix); }
};

// ------------------------------ Mining protocol: shares ------------------------------

struct SubmitSharesStandard {
  static constexpr MessageType kType = MessageType::SubmitSharesStandard;
  std::uint32_t channel_id{0};
  std::uint32_t sequence_number{0};
  std::uint32_t job_id{0};
  std::uint32_t nonce{0};
  std::uint32_t ntime{0};
  std::uint32_t version{0};

  template <class Self>
  static auto fields(Self& m) {
    return std::tie(m.channel_id, m.sequence_number, m.job_id, m.nonce, m.ntime, m.version);
  }
};

struct SubmitSharesExtended {
  static constexpr MessageType kType = MessageType::SubmitSharesExtended;
  std::uint32_t channel_id{0};
  std::uint32_t sequence_number{0};
  std::uint32_t job_id{0};
  std::uint32_t nonce{0};
  std::uint32_t ntime{0};
  std::uint32_t version{0};
  B0_32 extranonce;

  template <class Self>
  static auto fields(Self& m) {
    return std::tie(m.channel_id, m.sequence_number, m.job_id, m.nonce, m.ntime, m.version,
                    m.extranonce);
  }
};

struct SubmitSharesSuccess {
  static constexpr MessageType kType = MessageType::SubmitSharesSuccess;
  std::uint32_t channel_id{0};
  std::uint32_t last_sequence_number{0};
  std::uint32_t new_submits_accepted_count{0};
  std::uint64_t new_shares_sum{0};

  template <class Self>
  static auto fields(Self& m) {
    return std::tie(m.channel_id, m.last_sequence_number, m.new_submits_accepted_count,
                    m.new_shares_sum);
  }
};

struct SubmitSharesError {
  static constexpr MessageType kType = MessageType::SubmitSharesError;
  std::uint32_t channel_id{0};
  std::uint32_t sequence_number{0};
  Str0_32 error_code;

  template <class Self>
  static auto fields(Self& m) { return std::tie(m.channel_id, m.sequence_number, m.error_code); }
};

// ------------------------------ Mining protocol: jobs ------------------------------

struct NewMiningJob {
  static constexpr MessageType kType = MessageType::NewMiningJob;
  std::uint32_t channel_id{0};
  std::uint32_t job_id{0};
  bool future_job{false};
  std::uint32_t version{0};
  B0_32 merkle_root;

  template <class Self>
  static auto fields(Self& m) {
    return std::tie(m.channel_id, m.job_id, m.future_job, m.version, m.merkle_root);
  }
};

struct NewExtendedMiningJob {
  static constexpr MessageType kType = MessageType::NewExtendedMiningJob;
  std::uint32_t channel_id{0};
  std::uint32_t job_id{0};
  bool future_job{false};
  std::uint32_t version{0};
  bool version_rolling_allowed{false};
  Seq0_255<U256> merkle_path;
  B0_64K coinbase_tx_prefix;
  B0_64K coinbase_tx_suffix;

  template <class Self>
  static auto fields(Self& m) {
    return std::tie(m.channel_id, m.job_id, m.future_job, m.version, m.version_rolling_allowed,
                    m.merkle_path, m.coinbase_tx_prefix, m.coinbase_tx_suffix);
  }
};

struct SetNewPrevHash {
  static constexpr MessageType kType = MessageType::SetNewPrevHash;
  std::uint32_t channel_id{0};
  std::uint32_t job_id{0};
  U256 prev_hash{};
  std::uint32_t min_ntime{0};
  std::uint32_t nbits{0};

  template <class Self>
  static auto fields(Self& m) {
    return std::tie(m.channel_id, m.job_id, m.prev_hash, m.min_ntime, m.nbits);
  }
};

struct SetTarget {
  static constexpr MessageType kType = MessageType::SetTarget;
  std::uint32_t channel_id{0};
  U256 maximum_target{};

  template <class Self>
  static auto fields(Self& m) { return std::tie(m.channel_id, m.maximum_target); }
};

struct SetCustomMiningJob {
  static constexpr MessageType kType = MessageType::SetCustomMiningJob;
  std::uint32_t channel_id{0};
  std::uint32_t request_id{0};
  B0_255 mining_job_token;
  std::uint32_t version{0};
  U256 prev_hash{};
  std::uint32_t min_ntime{0};
  std::uint32_t nbits{0};
  std::uint32_t coinbase_tx_version{0};
  B0_255 coinbase_prefix;
  std::uint32_t coinbase_tx_input_n_sequence{0};
  std::uint64_t coinbase_tx_value_remaining{0};
  B0_64K coinbase_tx_outputs;
  std::uint32_t coinbase_tx_locktime{0};
  Seq0_255<U256> merkle_path;
  std::uint16_t extranonce_size{0};

  template <class Self>
  static auto fields(Self& m) {
    return std::tie(m.channel_id, m.request_id, m.mining_job_token, m.version, m.prev_hash,
                    m.min_ntime, m.nbits, m.coinbase_tx_version, m.coinbase_prefix,
                    m.coinbase_tx_input_n_sequence, m.coinbase_tx_value_remaining,
                    m.coinbase_tx_outputs, m.coinbase_tx_locktime, m.merkle_path,
                    m.extranonce_size);
  }
};

struct SetCustomMiningJobSuccess {
  static constexpr MessageType kType = MessageType::SetCustomMiningJobSuccess;
  std::uint32_t channel_id{0};
  std::uint32_t request_id{0};
  std::uint32_t job_id{0};

  template <class Self>
  static auto fields(Self& m) { return std::tie(m.channel_id, m.request_id, m.job_id); }
};

struct SetCustomMiningJobError {
  static constexpr MessageType kType = MessageType::SetCustomMiningJobError;
  std::uint32_t channel_id{0};
  std::uint32_t request_id{0};
  Str0_255 error_code;

  template <class Self>
  static auto fields(Self& m) { return std::tie(m.channel_id, m.request_id, m.error_code); }
};

struct Reconnect {
  static constexpr MessageType kType = MessageType::Reconnect;
  Str0_255 new_host;
  std::uint16_t new_port{0};

  template <class Self>
  static auto fields(Self& m) { return std::tie(m.new_host, m.new_port); }
};

struct SetGroupChannel {
  static constexpr MessageType kType = MessageType::SetGroupChannel;
  std::uint32_t group_channel_id{0};
  Seq0_64K<std::uint32_t> channel_ids;

  template <class Self>
  static auto fields(Self& m) { return std::tie(m.group_channel_id, m.channel_ids); }
};

// ------------------------------ variant + dispatch ------------------------------

using Message = std::variant<
    SetupConnection, SetupConnectionSuccess, SetupConnectionError, ChannelEndpointChanged,
    OpenStandardMiningChannel, OpenStandardMiningChannelSuccess, OpenStandardMiningChannelError,
    OpenExtendedMiningChannel, OpenExtendedMiningChannelSuccess, OpenExtendedMiningChannelError,
    UpdateChannel, UpdateChannelError, CloseChannel, SetExtranoncePrefix,
    SubmitSharesStandard, SubmitSharesExtended, SubmitSharesSuccess, SubmitSharesError,
    NewMiningJob, NewExtendedMiningJob, SetNewPrevHash, SetTarget,
    SetCustomMiningJob, SetCustomMiningJobSuccess, SetCustomMiningJobError,
    Reconnect, SetGroupChannel>;

template <class M, class = void>
struct is_message : std::false_type {};
template <class M>
struct is_message<M, std::void_t<decltype(M::kType)>> : std::true_type {};

template <class M, class = std::enable_if_t<is_message<M>::value>>
bool operator==(const M& a, const M& b) {
  return M::fields(a) == M::fields(b);
}
template <class M, class = std::enable_if_t<is_message<M>::value>>
bool operator!=(const M& a, const M& b) {
  return !(a == b);
}

// A well-formed frame this catalog does not cover (unknown code or a
// non-zero extension). Callers may ignore it or pass it through.
struct UnsupportedMessage {
  std::uint16_t extension_type{0};
  std::uint8_t message_type{0};
  Bytes payload;
};

using DecodedMessage = std::variant<Message, UnsupportedMessage>;

MessageType message_type(const Message& m);

// SetupConnection and SetupConnectionError carry cross-field rules. Throws
// Error(MalformedMessage) naming the message type.
void validate(const SetupConnection& m);
void validate(const SetupConnectionError& m);

template <class M>
void validate(const M&) {}

template <class M, class = std::enable_if_t<is_message<M>::value>>
Bytes serialize(const M& m) {
  validate(m);
  ByteWriter w;
  std::apply(w, M::fields(m));
  return w.take();
}

Bytes serialize(const Message& m);

// Frame with extension 0 and the channel bit set for channel messages
Frame to_frame(const Message& m);

// Decodes one payload as M. Any field failure or trailing byte throws
// Error(MalformedMessage) naming M.
template <class M>
M deserialize_as(const std::uint8_t* payload, std::size_t len) {
  M m;
  try {
    ByteCursor cur(payload, len);
    std::apply(cur, M::fields(m));
    cur.expect_end();
  } catch (const Error& e) {
    throw Error(ErrorCode::MalformedMessage, (std::uint8_t)M::kType,
                std::string(message_name(M::kType)) + ": " + e.what());
  }
  validate(m);
  return m;
}

template <class M>
M deserialize_as(const Bytes& payload) {
  return deserialize_as<M>(payload.data(), payload.size());
}

DecodedMessage deserialize(std::uint16_t extension_type, std::uint8_t message_type,
                           const std::uint8_t* payload, std::size_t len);
DecodedMessage deserialize(std::uint16_t extension_type, std::uint8_t message_type,
                           const Bytes& payload);
DecodedMessage from_frame(const Frame& f);

// A SetupConnection frame whose protocol byte names no known subprotocol.
// from_frame rejects it as malformed; a responder answers unsupported-protocol.
bool has_unknown_protocol(const Frame& f);

} // namespace sv2
