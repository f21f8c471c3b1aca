#include "sv2/encryptor.hpp"

#include <cstddef>
#include <cstdint>
#include <variant>

// Fresh session per input; the input is fed as ciphertext
static sv2::ConnectionEncryptor make_receiver() {
  auto authority = sv2::AuthorityKeyPair::generate();
  auto s = sv2::StaticKeyPair::generate();
  auto cert = sv2::issue_certificate(authority, s.pub, sv2::CertificateConfig{},
                                     sv2::system_clock_unix());
  sv2::NoiseInitiator initiator(authority.pub);
  sv2::NoiseResponder responder(std::move(s), cert);
  initiator.read_second_message(responder.respond(initiator.write_first_message()));
  sv2::EncryptorConfig cfg;
  cfg.max_payload_len = 1 << 16;
  return responder.into_encryptor(cfg);
}

extern "C" int LLVMFuzzerTestOneInput(const std::uint8_t* data, std::size_t size) {
  sv2::ConnectionEncryptor receiver = make_receiver();
  try {
    receiver.read(data, size);
  } catch (const sv2::Error&) {
  }
  return 0;
}
