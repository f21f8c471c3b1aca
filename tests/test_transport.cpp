#include "sv2/transport.hpp"
#include "sv2/log.hpp"
#include "sv2/messages.hpp"

#include <cstdio>
#include <cstdlib>
#include <optional>
#include <utility>
#include <variant>

#include <sys/socket.h>
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

// Connected pair over a local stream socket
struct Link {
  sv2::TcpTransport miner;
  sv2::TcpTransport pool;
};

std::optional<Link> make_link() {
  int fds[2];
  if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) return std::nullopt;
  return Link{sv2::TcpTransport(fds[0]), sv2::TcpTransport(fds[1])};
}

struct Session {
  sv2::ConnectionEncryptor miner;
  sv2::ConnectionEncryptor pool;
};

// Runs the Noise handshake across the link, as the apps do
Session handshake(Link& l) {
  auto authority = sv2::AuthorityKeyPair::generate();
  auto static_keys = sv2::StaticKeyPair::generate();
  auto cert = sv2::issue_certificate(authority, static_keys.pub, sv2::CertificateConfig{}, 1000);
  sv2::NoiseInitiator initiator(authority.pub, [] { return 2000u; });
  sv2::NoiseResponder responder(std::move(static_keys), cert);

  l.miner.send_handshake_message(initiator.write_first_message());
  l.pool.send_handshake_message(responder.respond(l.pool.recv_handshake_message()));
  initiator.read_second_message(l.miner.recv_handshake_message());
  return Session{initiator.into_encryptor(sv2::EncryptorConfig{}),
                 responder.into_encryptor(sv2::EncryptorConfig{})};
}

bool test_handshake_messages_back_to_back() {
  auto l = make_link();
  if (!l) return false;
  const sv2::Bytes a = {1, 2, 3};
  const sv2::Bytes empty;
  const sv2::Bytes b(300, 0x42);
  l->miner.send_handshake_message(a);
  l->miner.send_handshake_message(empty);
  l->miner.send_handshake_message(b);

  // The first read buffers all three
  if (l->pool.recv_handshake_message() != a) return false;
  if (l->pool.buffered() != 2 + 2 + b.size()) return false;
  if (!l->pool.recv_handshake_message().empty()) return false;
  return l->pool.recv_handshake_message() == b && l->pool.buffered() == 0;
}

bool test_handshake_message_too_large() {
  auto l = make_link();
  if (!l) return false;
  sv2::Bytes big(sv2::kMaxNoiseMessageLen + 1);
  return throws_code(sv2::ErrorCode::HandshakeFailed,
                     [&] { l->miner.send_handshake_message(big); });
}

bool test_frames_over_link() {
  auto l = make_link();
  if (!l) return false;
  Session s = handshake(*l);

  sv2::SetupConnection setup;
  setup.endpoint_host = "pool.example";
  setup.endpoint_port = 3336;
  setup.vendor = "sv2";
  setup.firmware = "test";
  l->miner.send_frame(s.miner, sv2::to_frame(setup));

  sv2::Frame got = l->pool.recv_frame(s.pool);
  auto decoded = sv2::from_frame(got);
  auto* back = std::get_if<sv2::SetupConnection>(&std::get<sv2::Message>(decoded));
  if (!back || *back != setup) return false;

  sv2::Frame reply = sv2::to_frame(sv2::SetupConnectionSuccess{2, 0});
  l->pool.send_frame(s.pool, reply);
  return l->miner.recv_frame(s.miner) == reply;
}

// Several frames written before any read, one spanning two payload chunks
bool test_pipelined_frames() {
  auto l = make_link();
  if (!l) return false;
  Session s = handshake(*l);

  sv2::Frame a(0, 0x1c, sv2::Bytes(20, 0x01));
  sv2::Frame b(0, 0x1f, sv2::Bytes(sv2::kMaxChunkPlaintextLen + 500, 0x02));
  sv2::Frame c(0, 0x21, {});
  l->miner.send_frame(s.miner, a);
  l->miner.send_frame(s.miner, b);
  l->miner.send_frame(s.miner, c);

  if (l->pool.recv_frame(s.pool) != a) return false;
  if (l->pool.recv_frame(s.pool) != b) return false;
  if (l->pool.recv_frame(s.pool) != c) return false;
  return l->pool.buffered() == 0;
}

bool test_peer_close() {
  auto l = make_link();
  if (!l) return false;
  l->miner.send_handshake_message(sv2::Bytes{7});
  l->miner.close();
  if (l->miner.is_open()) return false;

  // Data sent before the close is still delivered
  if (l->pool.recv_handshake_message() != sv2::Bytes{7}) return false;
  if (!throws_code(sv2::ErrorCode::IoError, [&] { l->pool.recv_handshake_message(); })) {
    return false;
  }
  return throws_code(sv2::ErrorCode::IoError,
                     [&] { l->miner.send_handshake_message(sv2::Bytes{1}); });
}

bool test_truncated_frame_then_close() {
  int fds[2];
  if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) return false;
  sv2::TcpTransport pool(fds[1]);

  // Encryptors from an in-memory handshake; the miner side writes raw bytes
  auto authority = sv2::AuthorityKeyPair::generate();
  auto static_keys = sv2::StaticKeyPair::generate();
  auto cert = sv2::issue_certificate(authority, static_keys.pub, sv2::CertificateConfig{}, 1000);
  sv2::NoiseInitiator initiator(authority.pub, [] { return 2000u; });
  sv2::NoiseResponder responder(std::move(static_keys), cert);
  initiator.read_second_message(responder.respond(initiator.write_first_message()));
  auto miner_enc = initiator.into_encryptor(sv2::EncryptorConfig{});
  auto pool_enc = responder.into_encryptor(sv2::EncryptorConfig{});

  sv2::Bytes ct = miner_enc.encrypt(sv2::Frame(0, 0x1c, sv2::Bytes(40, 0x03)));
  std::size_t half = ct.size() / 2;
  bool ok = ::write(fds[0], ct.data(), half) == (ssize_t)half;
  ::close(fds[0]);
  ok = ok && throws_code(sv2::ErrorCode::IoError, [&] { pool.recv_frame(pool_enc); });
  return ok;
}

bool test_move_keeps_buffer() {
  auto l = make_link();
  if (!l) return false;
  l->miner.send_handshake_message(sv2::Bytes{1});
  l->miner.send_handshake_message(sv2::Bytes{2});
  if (l->pool.recv_handshake_message() != sv2::Bytes{1}) return false;

  sv2::TcpTransport moved = std::move(l->pool);
  if (l->pool.is_open() || !moved.is_open()) return false;
  return moved.recv_handshake_message() == sv2::Bytes{2};
}

} // namespace

int main() {
  sv2::set_log_level(spdlog::level::err);

  if (!test_handshake_messages_back_to_back()) {
    std::printf("test_handshake_messages_back_to_back failed\n");
    return EXIT_FAILURE;
  }
  if (!test_handshake_message_too_large()) {
    std::printf("test_handshake_message_too_large failed\n");
    return EXIT_FAILURE;
  }
  if (!test_frames_over_link()) {
    std::printf("test_frames_over_link failed\n");
    return EXIT_FAILURE;
  }
  if (!test_pipelined_frames()) {
    std::printf("test_pipelined_frames failed\n");
    return EXIT_FAILURE;
  }
  if (!test_peer_close()) {
    std::printf("test_peer_close failed\n");
    return EXIT_FAILURE;
  }
  if (!test_truncated_frame_then_close()) {
    std::printf("test_truncated_frame_then_close failed\n");
    return EXIT_FAILURE;
  }
  if (!test_move_keeps_buffer()) {
    std::printf("test_move_keeps_buffer failed\n");
    return EXIT_FAILURE;
  }

  std::printf("All transport tests passed\n");
  return EXIT_SUCCESS;
}
