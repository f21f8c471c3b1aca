#include "sv2/protocol.hpp"
#include "sv2/util.hpp"

namespace sv2 {

std::optional<MessageType> message_type_from_code(std::uint8_t code) {
  if (code <= 0x03 || (code >= 0x10 && code <= 0x26)) return (MessageType)code;
  return std::nullopt;
}

const char* message_name(MessageType t) noexcept {
  switch (t) {
    case MessageType::SetupConnection:                  return "SetupConnection";
    case MessageType::SetupConnectionSuccess:           return "SetupConnectionSuccess";
    case MessageType::SetupConnectionError:             return "SetupConnectionError";
    case MessageType::ChannelEndpointChanged:           return "ChannelEndpointChanged";
    case MessageType::OpenStandardMiningChannel:        return "OpenStandardMiningChannel";
    case MessageType::OpenStandardMiningChannelSuccess: return "OpenStandardMiningChannelSuccess";
    case MessageType::OpenStandardMiningChannelError:   return "OpenStandardMiningChannelError";
    case MessageType::OpenExtendedMiningChannel:        return "OpenExtendedMiningChannel";
    case MessageType::OpenExtendedMiningChannelSuccess: return "OpenExtendedMiningChannelSuccess";
    case MessageType::OpenExtendedMiningChannelError:   return "OpenExtendedMiningChannelError";
    case MessageType::UpdateChannel:                    return "UpdateChannel";
    case MessageType::UpdateChannelError:               return "UpdateChannelError";
    case MessageType::CloseChannel:                     return "CloseChannel";
    case MessageType::SetExtranoncePrefix:              return "SetExtranoncePrefix";
    case MessageType::SubmitSharesStandard:             return "SubmitSharesStandard";
    case MessageType::SubmitSharesExtended:             return "SubmitSharesExtended";
    case MessageType::SubmitSharesSuccess:              return "SubmitSharesSuccess";
    case MessageType::SubmitSharesError:                return "SubmitSharesError";
    case MessageType::NewMiningJob:                     return "NewMiningJob";
    case MessageType::NewExtendedMiningJob:             return "NewExtendedMiningJob";
    case MessageType::SetNewPrevHash:                   return "SetNewPrevHash";
    case MessageType::SetTarget:                        return "SetTarget";
    case MessageType::SetCustomMiningJob:               return "SetCustomMiningJob";
    case MessageType::SetCustomMiningJobSuccess:        return "SetCustomMiningJobSuccess";
    case MessageType::SetCustomMiningJobError:          return "SetCustomMiningJobError";
    case MessageType::Reconnect:                        return "Reconnect";
    case MessageType::SetGroupChannel:                  return "SetGroupChannel";
  }
  return "Unknown";
}

bool is_channel_message(MessageType t) noexcept {
  switch (t) {
    case MessageType::ChannelEndpointChanged:
    case MessageType::UpdateChannel:
    case MessageType::UpdateChannelError:
    case MessageType::CloseChannel:
    case MessageType::SetExtranoncePrefix:
    case MessageType::SubmitSharesStandard:
    case MessageType::SubmitSharesExtended:
    case MessageType::SubmitSharesSuccess:
    case MessageType::SubmitSharesError:
    case MessageType::NewMiningJob:
    case MessageType::NewExtendedMiningJob:
    case MessageType::SetNewPrevHash:
    case MessageType::SetTarget:
      return true;
    default:
      return false;
  }
}

const char* protocol_name(Protocol p) noexcept {
  switch (p) {
    case Protocol::Mining:               return "Mining";
    case Protocol::JobNegotiation:       return "JobNegotiation";
    case Protocol::TemplateDistribution: return "TemplateDistribution";
    case Protocol::JobDistribution:      return "JobDistribution";
  }
  return "Unknown";
}

bool is_known_protocol(std::uint8_t p) noexcept {
  return p <= (std::uint8_t)Protocol::JobDistribution;
}

std::uint32_t new_channel_id() {
  std::uint8_t b[4];
  rand_bytes(b, sizeof(b));
  return (std::uint32_t)b[0] | ((std::uint32_t)b[1] << 8) |
         ((std::uint32_t)b[2] << 16) | ((std::uint32_t)b[3] << 24);
}

} // namespace sv2
