#include "sv2/transport.hpp"
#include "sv2/error.hpp"
#include "sv2/noise.hpp"

#include <variant>

namespace sv2 {

// ---- handshake ----

void TcpTransport::send_handshake_message(const Bytes& msg) {
  ensure(msg.size() <= kMaxNoiseMessageLen, ErrorCode::HandshakeFailed,
         "handshake message too large");
  Bytes out;
  out.reserve(2 + msg.size());
  out.push_back((std::uint8_t)(msg.size() & 0xFF));
  out.push_back((std::uint8_t)(msg.size() >> 8));
  out.insert(out.end(), msg.begin(), msg.end());
  send_all(out.data(), out.size());
}

Bytes TcpTransport::recv_handshake_message() {
  fill(2);
  std::size_t n = (std::size_t)unread()[0] | ((std::size_t)unread()[1] << 8);
  fill(2 + n);
  Bytes msg(unread() + 2, unread() + 2 + n);
  consume(2 + n);
  return msg;
}

// ---- encrypted frames ----

void TcpTransport::send_frame(ConnectionEncryptor& enc, const Frame& f) {
  Bytes ct = enc.encrypt(f);
  send_all(ct.data(), ct.size());
}

Frame TcpTransport::recv_frame(ConnectionEncryptor& enc) {
  for (;;) {
    EncryptedReadResult r = enc.read(unread(), buffered());
    if (auto* done = std::get_if<DecryptedFrame>(&r)) {
      consume(done->consumed);
      return std::move(done->frame);
    }
    fill(buffered() + std::get<Incomplete>(r).needed);
  }
}

void TcpTransport::consume(std::size_t n) {
  start_ += n;
  if (start_ == rbuf_.size()) {
    rbuf_.clear();
    start_ = 0;
  }
}

} // namespace sv2
