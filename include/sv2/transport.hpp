#pragma once
#include "sv2.hpp"
#include "encryptor.hpp"
#include "framing.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace sv2 {

// One Stratum V2 connection over a stream socket: length-prefixed Noise
// handshake messages first, encrypted frames after. Received bytes are
// buffered, so a read may already hold the start of the next message.
// Socket failures and peer shutdown throw Error(IoError).
class TcpTransport {
public:
  // Adopts a connected stream socket
  explicit TcpTransport(int fd);
  ~TcpTransport();

  TcpTransport(TcpTransport&& o) noexcept;
  TcpTransport& operator=(TcpTransport&& o) noexcept;
  TcpTransport(const TcpTransport&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;

  static TcpTransport connect(const std::string& host, std::uint16_t port);

  // Binds, accepts one peer and closes the listening socket
  static TcpTransport accept_one(const std::string& bind_host, std::uint16_t port);

  // [u16 LE length][message]; over kMaxNoiseMessageLen throws HandshakeFailed
  void send_handshake_message(const Bytes& msg);
  Bytes recv_handshake_message();

  void send_frame(ConnectionEncryptor& enc, const Frame& f);

  // Exactly one frame; bytes past it stay buffered for the next call
  Frame recv_frame(ConnectionEncryptor& enc);

  std::size_t buffered() const { return rbuf_.size() - start_; }
  bool is_open() const { return fd_ >= 0; }
  void close() noexcept;

private:
  void send_all(const std::uint8_t* data, std::size_t n);
  // Blocks until at least n unconsumed bytes are buffered
  void fill(std::size_t n);
  void consume(std::size_t n);
  const std::uint8_t* unread() const { return rbuf_.data() + start_; }

  int fd_{-1};
  Bytes rbuf_;
  std::size_t start_{0};
};

} // namespace sv2
