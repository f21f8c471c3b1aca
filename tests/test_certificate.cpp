#include "sv2/certificate.hpp"
#include "sv2/log.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

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

bool test_signed_bytes_layout() {
  sv2::PublicKey key{};
  key.fill(0x42);
  sv2::SignedCertificate cert(0, 0x01020304, 0x05060708, key);
  sv2::Bytes b = cert.serialize();
  if (b.size() != sv2::SignedCertificate::kSerializedLen) return false;
  if (b[0] != 0x00 || b[1] != 0x00) return false;
  if (b[2] != 0x04 || b[5] != 0x01) return false;
  if (b[6] != 0x08 || b[9] != 0x05) return false;
  return b[10] == 0x42 && b[41] == 0x42;
}

bool test_empty_window_rejected() {
  sv2::PublicKey key{};
  return throws_code(sv2::ErrorCode::InvalidArgument,
                     [&] { sv2::SignedCertificate c(0, 100, 100, key); });
}

bool test_validity_window_bounds() {
  sv2::PublicKey key{};
  sv2::SignedCertificate cert(0, 100, 200, key);
  if (cert.is_valid_at(99)) return false;
  if (!cert.is_valid_at(100)) return false;
  if (!cert.is_valid_at(199)) return false;
  return !cert.is_valid_at(200);
}

bool test_issue_and_verify() {
  auto authority = sv2::AuthorityKeyPair::generate();
  auto static_keys = sv2::StaticKeyPair::generate();
  sv2::CertificateConfig cfg;
  cfg.validity_secs = 3600;

  auto msg = sv2::issue_certificate(authority, static_keys.pub, cfg, 1000);
  if (msg.valid_from != 1000 || msg.not_valid_after != 4600) return false;

  sv2::SignedCertificate cert = sv2::verify_certificate(authority.pub, static_keys.pub, msg, 2000);
  if (cert.static_public_key() != static_keys.pub) return false;

  // Outside the window
  if (!throws_code(sv2::ErrorCode::AuthenticationFailed, [&] {
        sv2::verify_certificate(authority.pub, static_keys.pub, msg, 4600);
      })) {
    return false;
  }
  if (!throws_code(sv2::ErrorCode::AuthenticationFailed, [&] {
        sv2::verify_certificate(authority.pub, static_keys.pub, msg, 999);
      })) {
    return false;
  }

  // Signed for a different static key
  auto other = sv2::StaticKeyPair::generate();
  if (!throws_code(sv2::ErrorCode::AuthenticationFailed, [&] {
        sv2::verify_certificate(authority.pub, other.pub, msg, 2000);
      })) {
    return false;
  }

  // Wrong authority
  auto other_authority = sv2::AuthorityKeyPair::generate();
  return throws_code(sv2::ErrorCode::AuthenticationFailed, [&] {
    sv2::verify_certificate(other_authority.pub, static_keys.pub, msg, 2000);
  });
}

bool test_tampered_fields_fail() {
  auto authority = sv2::AuthorityKeyPair::generate();
  auto static_keys = sv2::StaticKeyPair::generate();
  auto msg = sv2::issue_certificate(authority, static_keys.pub, sv2::CertificateConfig{}, 1000);

  auto longer = msg;
  longer.not_valid_after += 1;
  if (!throws_code(sv2::ErrorCode::AuthenticationFailed, [&] {
        sv2::verify_certificate(authority.pub, static_keys.pub, longer, 2000);
      })) {
    return false;
  }

  auto sig = msg;
  sig.signature[10] ^= 0x01;
  if (!throws_code(sv2::ErrorCode::AuthenticationFailed, [&] {
        sv2::verify_certificate(authority.pub, static_keys.pub, sig, 2000);
      })) {
    return false;
  }

  auto empty = msg;
  empty.not_valid_after = empty.valid_from;
  return throws_code(sv2::ErrorCode::AuthenticationFailed, [&] {
    sv2::verify_certificate(authority.pub, static_keys.pub, empty, 2000);
  });
}

bool test_issue_saturates_expiry() {
  auto authority = sv2::AuthorityKeyPair::generate();
  auto static_keys = sv2::StaticKeyPair::generate();
  sv2::CertificateConfig cfg;
  cfg.validity_secs = 100;
  auto msg = sv2::issue_certificate(authority, static_keys.pub, cfg, 0xFFFFFFF0u);
  return msg.not_valid_after == 0xFFFFFFFFu;
}

bool test_signature_noise_message_codec() {
  sv2::SignatureNoiseMessage m;
  m.version = 1;
  m.valid_from = 2;
  m.not_valid_after = 3;
  m.signature.fill(0x77);
  sv2::Bytes b = m.serialize();
  if (b.size() != sv2::SignatureNoiseMessage::kSerializedLen) return false;

  auto back = sv2::SignatureNoiseMessage::parse(b.data(), b.size());
  if (back.version != 1 || back.valid_from != 2 || back.not_valid_after != 3) return false;
  if (back.signature != m.signature) return false;

  if (!throws_code(sv2::ErrorCode::Truncated,
                   [&] { sv2::SignatureNoiseMessage::parse(b.data(), b.size() - 1); })) {
    return false;
  }
  b.push_back(0);
  return throws_code(sv2::ErrorCode::TooLong,
                     [&] { sv2::SignatureNoiseMessage::parse(b.data(), b.size()); });
}

bool test_static_key_rejects_zero() {
  return throws_code(sv2::ErrorCode::InvalidArgument,
                     [] { sv2::StaticKeyPair::from_private(sv2::SecureBytes(sv2::kKeyLen)); });
}

bool test_key_files() {
  char dir_tmpl[] = "/tmp/sv2-keys-XXXXXX";
  if (!::mkdtemp(dir_tmpl)) return false;
  const std::string dir = dir_tmpl;
  const std::string priv_path = dir + "/authority-key.priv";
  const std::string pub_path = dir + "/authority-key.pub";

  auto kp = sv2::AuthorityKeyPair::generate();
  // A world-readable file left at the secret path is narrowed on save
  bool ok = sv2::write_file(priv_path, sv2::Bytes{'x'}) &&
            ::chmod(priv_path.c_str(), 0644) == 0;
  sv2::save_secret_key(priv_path, kp.priv);
  sv2::save_key(pub_path, kp.pub.bytes.data(), kp.pub.bytes.size());

  struct stat st{};
  ok = ok && ::stat(priv_path.c_str(), &st) == 0 && (st.st_mode & 0777) == 0600;

  auto loaded = sv2::AuthorityKeyPair::from_private(sv2::load_secret_key(priv_path));
  ok = ok && loaded.pub.bytes == kp.pub.bytes && sv2::load_public_key(pub_path) == kp.pub.bytes;

  ok = ok && throws_code(sv2::ErrorCode::IoError,
                         [&] { sv2::load_public_key(dir + "/missing.pub"); });

  // Too short to be a key
  const std::string short_path = dir + "/short.pub";
  sv2::Bytes one = {'2', '\n'};
  ok = ok && sv2::write_file(short_path, one);
  ok = ok && throws_code(sv2::ErrorCode::InvalidArgument,
                         [&] { sv2::load_public_key(short_path); });

  ::unlink(priv_path.c_str());
  ::unlink(pub_path.c_str());
  ::unlink(short_path.c_str());
  ::rmdir(dir.c_str());
  return ok;
}

} // namespace

int main() {
  // Rejections are expected here; keep the output to failures
  sv2::set_log_level(spdlog::level::err);

  if (!test_signed_bytes_layout()) {
    std::printf("test_signed_bytes_layout failed\n");
    return EXIT_FAILURE;
  }
  if (!test_empty_window_rejected()) {
    std::printf("test_empty_window_rejected failed\n");
    return EXIT_FAILURE;
  }
  if (!test_validity_window_bounds()) {
    std::printf("test_validity_window_bounds failed\n");
    return EXIT_FAILURE;
  }
  if (!test_issue_and_verify()) {
    std::printf("test_issue_and_verify failed\n");
    return EXIT_FAILURE;
  }
  if (!test_tampered_fields_fail()) {
    std::printf("test_tampered_fields_fail failed\n");
    return EXIT_FAILURE;
  }
  if (!test_issue_saturates_expiry()) {
    std::printf("test_issue_saturates_expiry failed\n");
    return EXIT_FAILURE;
  }
  if (!test_signature_noise_message_codec()) {
    std::printf("test_signature_noise_message_codec failed\n");
    return EXIT_FAILURE;
  }
  if (!test_static_key_rejects_zero()) {
    std::printf("test_static_key_rejects_zero failed\n");
    return EXIT_FAILURE;
  }
  if (!test_key_files()) {
    std::printf("test_key_files failed\n");
    return EXIT_FAILURE;
  }

  std::printf("All certificate tests passed\n");
  return EXIT_SUCCESS;
}
