#include "sv2/certificate.hpp"
#include "sv2/config.hpp"
#include "sv2/encryptor.hpp"
#include "sv2/log.hpp"
#include "sv2/messages.hpp"
#include "sv2/noise.hpp"
#include "sv2/transport.hpp"
#include "sv2/util.hpp"

#include <iostream>
#include <string>

using namespace sv2;

static void usage() {
  std::cerr << "Usage:\n";
  std::cerr << "  sv2-miner <host> <port> <authority_pub_file> <user_identity>\n\n";
  std::cerr << "Connects, verifies the pool certificate against the authority key,\n";
  std::cerr << "sends SetupConnection and OpenStandardMiningChannel and logs the replies.\n\n";
  std::cerr << "Example:\n";
  std::cerr << "  sv2-miner 127.0.0.1 3336 authority-key.pub worker1\n";
}

static void log_reply(const Frame& f) {
  DecodedMessage decoded = from_frame(f);
  if (auto* u = std::get_if<UnsupportedMessage>(&decoded)) {
    logger()->info("reply: unsupported message type={:#04x}", u->message_type);
    return;
  }
  const Message& msg = std::get<Message>(decoded);
  if (auto* m = std::get_if<SetupConnectionSuccess>(&msg)) {
    logger()->info("reply: SetupConnectionSuccess used_version={} flags={:#x}",
                   m->used_version, m->flags);
  } else if (auto* m = std::get_if<SetupConnectionError>(&msg)) {
    logger()->warn("reply: SetupConnectionError {} flags={:#x}", m->error_code.str(), m->flags);
  } else if (auto* m = std::get_if<OpenStandardMiningChannelSuccess>(&msg)) {
    logger()->info("reply: channel {} opened, extranonce_prefix {} bytes",
                   m->channel_id, m->extranonce_prefix.size());
  } else if (auto* m = std::get_if<OpenStandardMiningChannelError>(&msg)) {
    logger()->warn("reply: OpenStandardMiningChannelError {}", m->error_code.str());
  } else {
    logger()->info("reply: {}", message_name(message_type(msg)));
  }
}

int main(int argc, char** argv) {
  if (argc != 5) {
    usage();
    return 1;
  }

  try {
    MinerConfig cfg;
    cfg.host = argv[1];
    cfg.port = parse_port(argv[2]);
    cfg.authority_pub_path = argv[3];
    cfg.user_identity = argv[4];
    validate_config(cfg);

    AuthorityPublicKey authority{load_public_key(cfg.authority_pub_path)};

    TcpTransport t = TcpTransport::connect(cfg.host, cfg.port);

    NoiseInitiator initiator(authority);
    t.send_handshake_message(initiator.write_first_message());
    initiator.read_second_message(t.recv_handshake_message());
    logger()->info("pool static key {} certified until {}",
                   encode_base58(initiator.remote_static_key().data(), kKeyLen),
                   initiator.certificate().not_valid_after());
    ConnectionEncryptor enc = initiator.into_encryptor(cfg.encryptor);

    SetupConnection setup;
    setup.protocol = (std::uint8_t)Protocol::Mining;
    setup.flags = setup_flags::kRequiresStandardJobs;
    setup.endpoint_host = cfg.host;
    setup.endpoint_port = cfg.port;
    setup.vendor = "sv2";
    setup.hardware_version = "generic";
    setup.firmware = "sv2-miner";
    t.send_frame(enc, to_frame(setup));
    log_reply(t.recv_frame(enc));

    OpenStandardMiningChannel open;
    open.request_id = 1;
    open.user_identity = cfg.user_identity;
    open.nominal_hash_rate = cfg.nominal_hash_rate;
    open.max_target.fill(0xFF);
    t.send_frame(enc, to_frame(open));
    log_reply(t.recv_frame(enc));

    t.close();
    return 0;
  } catch (const std::exception& e) {
    logger()->error("miner error: {}", e.what());
    return 1;
  }
}
