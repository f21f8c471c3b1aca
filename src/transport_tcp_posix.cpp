#include "sv2/transport.hpp"
#include "sv2/error.hpp"
#include "sv2/log.hpp"

#include <cerrno>
#include <cstddef>
#include <memory>
#include <string>

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace sv2 {

#ifdef MSG_NOSIGNAL
static constexpr int kSendFlags = MSG_NOSIGNAL;
#else
static constexpr int kSendFlags = 0;
#endif

// Socket reads pull at least this much when more input is needed
static constexpr std::size_t kReadChunk = 16 * 1024;

using AddrInfoPtr = std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)>;

static AddrInfoPtr resolve(const std::string& host, std::uint16_t port, bool passive) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  if (passive) hints.ai_flags = AI_PASSIVE;

  addrinfo* res = nullptr;
  const std::string service = std::to_string(port);
  int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &res);
  if (rc != 0 || !res) {
    throw Error(ErrorCode::IoError,
                "cannot resolve " + host + ":" + service + ": " + ::gai_strerror(rc));
  }
  return AddrInfoPtr(res, ::freeaddrinfo);
}

// Frames are small and latency bound
static void set_nodelay(int fd) {
  int one = 1;
  if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) != 0) {
    logger()->warn("TCP_NODELAY not set (errno {})", errno);
  }
}

static std::string peer_name(const sockaddr* addr, socklen_t len) {
  char host[NI_MAXHOST];
  char serv[NI_MAXSERV];
  if (::getnameinfo(addr, len, host, sizeof(host), serv, sizeof(serv),
                    NI_NUMERICHOST | NI_NUMERICSERV) != 0) {
    return "?";
  }
  return std::string(host) + ":" + serv;
}

TcpTransport::TcpTransport(int fd) : fd_(fd) {
  ensure(fd_ >= 0, ErrorCode::IoError, "invalid socket");
}

TcpTransport::~TcpTransport() { close(); }

TcpTransport::TcpTransport(TcpTransport&& o) noexcept
    : fd_(o.fd_), rbuf_(std::move(o.rbuf_)), start_(o.start_) {
  o.fd_ = -1;
  o.start_ = 0;
}

TcpTransport& TcpTransport::operator=(TcpTransport&& o) noexcept {
  if (this != &o) {
    close();
    fd_ = o.fd_;
    rbuf_ = std::move(o.rbuf_);
    start_ = o.start_;
    o.fd_ = -1;
    o.start_ = 0;
  }
  return *this;
}

TcpTransport TcpTransport::connect(const std::string& host, std::uint16_t port) {
  AddrInfoPtr res = resolve(host, port, false);
  int last_errno = 0;
  for (addrinfo* p = res.get(); p; p = p->ai_next) {
    int fd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (fd < 0) {
      last_errno = errno;
      continue;
    }
    if (::connect(fd, p->ai_addr, p->ai_addrlen) == 0) {
      set_nodelay(fd);
      logger()->info("connected to {}", peer_name(p->ai_addr, p->ai_addrlen));
      return TcpTransport(fd);
    }
    last_errno = errno;
    ::close(fd);
  }
  throw Error(ErrorCode::IoError, "cannot connect to " + host + ":" + std::to_string(port) +
                                      " (errno " + std::to_string(last_errno) + ")");
}

TcpTransport TcpTransport::accept_one(const std::string& bind_host, std::uint16_t port) {
  AddrInfoPtr res = resolve(bind_host, port, true);
  int lfd = -1;
  for (addrinfo* p = res.get(); p && lfd < 0; p = p->ai_next) {
    lfd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (lfd < 0) continue;
    int one = 1;
    if (::setsockopt(lfd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) != 0 ||
        ::bind(lfd, p->ai_addr, p->ai_addrlen) != 0 || ::listen(lfd, 1) != 0) {
      ::close(lfd);
      lfd = -1;
    }
  }
  ensure(lfd >= 0, ErrorCode::IoError, "cannot listen");
  logger()->info("listening on {}:{}", bind_host, port);

  sockaddr_storage peer{};
  socklen_t peer_len = sizeof(peer);
  int fd;
  do {
    peer_len = sizeof(peer);
    fd = ::accept(lfd, (sockaddr*)&peer, &peer_len);
  } while (fd < 0 && errno == EINTR);
  ::close(lfd);
  ensure(fd >= 0, ErrorCode::IoError, "accept failed");

  set_nodelay(fd);
  logger()->info("accepted {}", peer_name((const sockaddr*)&peer, peer_len));
  return TcpTransport(fd);
}

void TcpTransport::send_all(const std::uint8_t* data, std::size_t n) {
  ensure(fd_ >= 0, ErrorCode::IoError, "send on closed transport");
  while (n > 0) {
    ssize_t w = ::send(fd_, data, n, kSendFlags);
    if (w < 0 && errno == EINTR) continue;
    ensure(w > 0, ErrorCode::IoError, "send failed");
    data += w;
    n -= (std::size_t)w;
  }
}

void TcpTransport::fill(std::size_t n) {
  ensure(fd_ >= 0, ErrorCode::IoError, "recv on closed transport");
  if (start_ > 0 && buffered() < n) {
    rbuf_.erase(rbuf_.begin(), rbuf_.begin() + (std::ptrdiff_t)start_);
    start_ = 0;
  }
  while (buffered() < n) {
    std::size_t have = rbuf_.size();
    std::size_t want = n - buffered();
    if (want < kReadChunk) want = kReadChunk;
    rbuf_.resize(have + want);
    ssize_t r = ::recv(fd_, rbuf_.data() + have, want, 0);
    int err = errno;
    rbuf_.resize(have + (r > 0 ? (std::size_t)r : 0));
    if (r < 0 && err == EINTR) continue;
    ensure(r != 0, ErrorCode::IoError, "peer closed the connection");
    ensure(r > 0, ErrorCode::IoError, "recv failed");
  }
}

void TcpTransport::close() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  rbuf_.clear();
  start_ = 0;
}

} // namespace sv2
