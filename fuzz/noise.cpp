#include "sv2/certificate.hpp"
#include "sv2/noise.hpp"

#include <cstddef>
#include <cstdint>

// Feeds the input as handshake messages to fresh responders and initiators
extern "C" int LLVMFuzzerTestOneInput(const std::uint8_t* data, std::size_t size) {
  static const sv2::AuthorityKeyPair authority = sv2::AuthorityKeyPair::generate();

  try {
    sv2::SignatureNoiseMessage::parse(data, size);
  } catch (const sv2::Error&) {
  }

  try {
    sv2::StaticKeyPair s = sv2::StaticKeyPair::generate();
    auto cert = sv2::issue_certificate(authority, s.pub, sv2::CertificateConfig{},
                                       sv2::system_clock_unix());
    sv2::NoiseResponder responder(std::move(s), cert);
    responder.respond(data, size);
  } catch (const sv2::Error&) {
  }

  try {
    sv2::NoiseInitiator initiator(authority.pub);
    initiator.write_first_message();
    initiator.read_second_message(data, size);
  } catch (const sv2::Error&) {
  }
  return 0;
}
