#include "sv2/certificate.hpp"
#include "sv2/config.hpp"
#include "sv2/encryptor.hpp"
#include "sv2/log.hpp"
#include "sv2/messages.hpp"
#include "sv2/noise.hpp"
#include "sv2/transport.hpp"
#include "sv2/util.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <sys/stat.h>

using namespace sv2;

static bool file_exists(const std::string& path) {
  struct stat st{};
  return ::stat(path.c_str(), &st) == 0;
}

// keys_dir/static-key.{priv,pub} are created on first start
static StaticKeyPair load_or_create_static_key(const std::string& keys_dir) {
  const std::string priv_path = keys_dir + "/static-key.priv";
  const std::string pub_path = keys_dir + "/static-key.pub";
  if (!file_exists(priv_path)) {
    StaticKeyPair kp = StaticKeyPair::generate();
    save_secret_key(priv_path, kp.priv);
    save_key(pub_path, kp.pub.data(), kp.pub.size());
    logger()->info("generated static key {}", encode_base58(kp.pub.data(), kp.pub.size()));
    return kp;
  }
  return StaticKeyPair::from_private(load_secret_key(priv_path));
}

static Message answer_setup(const SetupConnection& m) {
  logger()->info("SetupConnection: {} v{}-{} from {} {} ({})",
                 protocol_name((Protocol)m.protocol), m.min_version, m.max_version,
                 m.vendor.str(), m.firmware.str(), m.endpoint_host.str());
  if (m.protocol != (std::uint8_t)Protocol::Mining) {
    return SetupConnectionError{0, error_codes::kUnsupportedProtocol};
  }
  if (m.min_version > kProtocolVersion || m.max_version < kProtocolVersion) {
    return SetupConnectionError{0, error_codes::kProtocolVersionMismatch};
  }
  // Only version-rolling is negotiable here
  std::uint32_t unsupported = m.flags & ~(setup_flags::kRequiresStandardJobs |
                                          setup_flags::kRequiresVersionRolling);
  if (unsupported) {
    return SetupConnectionError{unsupported, error_codes::kUnsupportedFeatureFlags};
  }
  return SetupConnectionSuccess{kProtocolVersion, 0};
}

static B0_32 random_extranonce_prefix() {
  Bytes prefix(4);
  rand_bytes(prefix.data(), prefix.size());
  return B0_32(std::move(prefix));
}

// Reply to one decoded message, if it calls for one
static std::optional<Message> handle(const Message& msg, bool& setup_done) {
  if (auto* m = std::get_if<SetupConnection>(&msg)) {
    Message reply = answer_setup(*m);
    setup_done = std::holds_alternative<SetupConnectionSuccess>(reply);
    return reply;
  }
  if (!setup_done) {
    logger()->warn("{} before SetupConnection, ignored", message_name(message_type(msg)));
    return std::nullopt;
  }
  if (auto* m = std::get_if<OpenStandardMiningChannel>(&msg)) {
    if (m->user_identity.empty()) {
      return OpenStandardMiningChannelError{m->request_id, error_codes::kUnknownUser};
    }
    OpenStandardMiningChannelSuccess ok;
    ok.request_id = m->request_id;
    ok.channel_id = new_channel_id();
    ok.target = m->max_target;
    ok.extranonce_prefix = random_extranonce_prefix();
    logger()->info("opened standard channel {} for {}", ok.channel_id, m->user_identity.str());
    return ok;
  }
  if (auto* m = std::get_if<OpenExtendedMiningChannel>(&msg)) {
    if (m->user_identity.empty()) {
      return OpenExtendedMiningChannelError{m->request_id, error_codes::kUnknownUser};
    }
    OpenExtendedMiningChannelSuccess ok;
    ok.request_id = m->request_id;
    ok.channel_id = new_channel_id();
    ok.target = m->max_target;
    ok.extranonce_size = m->min_extranonce_size;
    ok.extranonce_prefix = random_extranonce_prefix();
    logger()->info("opened extended channel {} for {}", ok.channel_id, m->user_identity.str());
    return ok;
  }
  logger()->info("received {}", message_name(message_type(msg)));
  return std::nullopt;
}

int main(int argc, char** argv) {
  if (argc != 4 && argc != 5) {
    std::cerr << "Usage: sv2-pool <bind_host> <port> <keys_dir> [validity_secs]\n";
    std::cerr << "Where keys_dir contains:\n";
    std::cerr << "  authority-key.priv   (from sv2-keygen authority)\n";
    std::cerr << "  static-key.priv      (created when missing)\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  sv2-pool 0.0.0.0 3336 pool_keys 86400\n";
    return 1;
  }

  try {
    PoolConfig cfg;
    cfg.bind_host = argv[1];
    cfg.port = parse_port(argv[2]);
    cfg.keys_dir = argv[3];
    if (argc == 5) cfg.certificate.validity_secs = parse_validity_secs(argv[4]);
    validate_config(cfg);

    AuthorityKeyPair authority =
        AuthorityKeyPair::from_private(load_secret_key(cfg.keys_dir + "/authority-key.priv"));
    StaticKeyPair static_keys = load_or_create_static_key(cfg.keys_dir);
    SignatureNoiseMessage cert =
        issue_certificate(authority, static_keys.pub, cfg.certificate, system_clock_unix());

    TcpTransport t = TcpTransport::accept_one(cfg.bind_host, cfg.port);

    NoiseResponder responder(std::move(static_keys), cert);
    t.send_handshake_message(responder.respond(t.recv_handshake_message()));
    ConnectionEncryptor enc = responder.into_encryptor(cfg.encryptor);

    bool setup_done = false;
    for (;;) {
      Frame f = t.recv_frame(enc);
      if (has_unknown_protocol(f)) {
        logger()->info("SetupConnection for unknown protocol {}", f.payload()[0]);
        t.send_frame(enc, to_frame(SetupConnectionError{0, error_codes::kUnsupportedProtocol}));
        continue;
      }
      try {
        DecodedMessage decoded = from_frame(f);
        if (auto* u = std::get_if<UnsupportedMessage>(&decoded)) {
          logger()->info("ignoring unsupported message ext={:#06x} type={:#04x}",
                         u->extension_type, u->message_type);
          continue;
        }
        auto reply = handle(std::get<Message>(decoded), setup_done);
        if (reply) t.send_frame(enc, to_frame(*reply));
      } catch (const Error& e) {
        if (e.code() != ErrorCode::MalformedMessage) throw;
        logger()->warn("dropped frame: {}", e.what());
      }
    }
  } catch (const Error& e) {
    if (e.code() == ErrorCode::IoError) {
      logger()->info("connection closed: {}", e.what());
      return 0;
    }
    logger()->error("pool error: {}", e.what());
    return 1;
  } catch (const std::exception& e) {
    logger()->error("pool error: {}", e.what());
    return 1;
  }
}
