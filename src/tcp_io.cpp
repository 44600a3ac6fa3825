// ============================================================================
// tcp_io.cpp — implementation for tcp_io.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "eomacca/tcp_io.hpp"
#include "eomacca/slip.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>

namespace eomacca {

const char* read_result_name(ReadResult r) {
  switch (r) {
    case ReadResult::Frame:   return "frame";
    case ReadResult::Timeout: return "timeout";
    case ReadResult::Closed:  return "closed";
    case ReadResult::Error:   return "error";
  }
  return "unknown";
}

static std::string errno_text(const char* what) {
  std::string s(what);
  s += ": ";
  s += std::strerror(errno);
  return s;
}

// ---------------------------------------------------------------------------
// open_listener()
// ---------------------------------------------------------------------------
int open_listener(const std::string& host, uint16_t port, int backlog, std::string& err) {
  err.clear();

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (host.empty() || host == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    err = "invalid listen address: " + host;
    return -1;
  }

  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) { err = errno_text("socket"); return -1; }

  int one = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) != 0) {
    err = errno_text("setsockopt");
    ::close(fd);
    return -1;
  }

  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    err = errno_text("bind");
    ::close(fd);
    return -1;
  }
  if (::listen(fd, backlog) != 0) {
    err = errno_text("listen");
    ::close(fd);
    return -1;
  }
  return fd;
}

// ---------------------------------------------------------------------------
// accept_client()
// ---------------------------------------------------------------------------
int accept_client(int listen_fd, int timeout_ms, std::string& peer, std::string& err) {
  err.clear();
  peer.clear();

  pollfd pfd{listen_fd, POLLIN, 0};
  int pr = ::poll(&pfd, 1, timeout_ms);
  if (pr == 0) return -1;                       // timeout, not an error
  if (pr < 0) {
    if (errno == EINTR) return -1;              // signal: let the caller check its flag
    err = errno_text("poll");
    return -1;
  }

  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  int fd = ::accept(listen_fd, reinterpret_cast<sockaddr*>(&addr), &len);
  if (fd < 0) {
    if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) return -1;
    err = errno_text("accept");
    return -1;
  }

  char ip[INET_ADDRSTRLEN] = {0};
  ::inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
  peer = ip;
  peer += ':';
  peer += std::to_string(ntohs(addr.sin_port));
  return fd;
}

// ---------------------------------------------------------------------------
// connect_to()
// ------------
// Non-blocking connect + poll for the deadline, then back to blocking mode.
// ---------------------------------------------------------------------------
int connect_to(const std::string& host, uint16_t port, int timeout_ms, std::string& err) {
  err.clear();

  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* res = nullptr;
  const std::string service = std::to_string(port);
  int gai = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
  if (gai != 0 || !res) {
    err = "resolve " + host + ": " + ::gai_strerror(gai);
    return -1;
  }

  int fd = ::socket(res->ai_family, res->ai_socktype, res->ai_protocol);
  if (fd < 0) {
    err = errno_text("socket");
    ::freeaddrinfo(res);
    return -1;
  }

  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    err = errno_text("fcntl");
    ::freeaddrinfo(res);
    ::close(fd);
    return -1;
  }

  int rc = ::connect(fd, res->ai_addr, res->ai_addrlen);
  ::freeaddrinfo(res);

  if (rc != 0 && errno != EINPROGRESS) {
    err = errno_text("connect");
    ::close(fd);
    return -1;
  }

  if (rc != 0) {
    pollfd pfd{fd, POLLOUT, 0};
    int pr = ::poll(&pfd, 1, timeout_ms);
    if (pr <= 0) {
      err = pr == 0 ? "connect: timed out" : errno_text("poll");
      ::close(fd);
      return -1;
    }
    int so_err = 0;
    socklen_t len = sizeof(so_err);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_err, &len) < 0) {
      err = errno_text("getsockopt");
      ::close(fd);
      return -1;
    }
    if (so_err != 0) {
      err = std::string("connect: ") + std::strerror(so_err);
      ::close(fd);
      return -1;
    }
  }

  if (::fcntl(fd, F_SETFL, flags) < 0) {
    err = errno_text("fcntl");
    ::close(fd);
    return -1;
  }
  int one = 1;
  if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) < 0) {
    err = errno_text("setsockopt");
    ::close(fd);
    return -1;
  }
  return fd;
}

// ---------------------------------------------------------------------------
// write_frame()
// ---------------------------------------------------------------------------
bool write_frame(int fd, const Bytes& payload) {
  Bytes out;
  slip::encode(payload, out);

  size_t off = 0;
  while (off < out.size()) {
    ssize_t n = ::send(fd, out.data() + off, out.size() - off, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    off += static_cast<size_t>(n);
  }
  return true;
}

// ---------------------------------------------------------------------------
// read_frame()
// ------------
// Reads in blocks and feeds the decoder byte by byte. The deadline covers the
// whole frame, not each poll.
// ---------------------------------------------------------------------------
ReadResult read_frame(int fd, Bytes& out, int timeout_ms) {
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);

  slip::decoder dec;
  out.clear();
  uint8_t block[4096];
  pollfd pfd{fd, POLLIN, 0};

  while (true) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - clock::now()).count();
    if (left <= 0) return ReadResult::Timeout;

    int pr = ::poll(&pfd, 1, static_cast<int>(left));
    if (pr == 0) return ReadResult::Timeout;
    if (pr < 0) {
      if (errno == EINTR) continue;
      return ReadResult::Error;
    }

    ssize_t n = ::recv(fd, block, sizeof(block), 0);
    if (n == 0) return ReadResult::Closed;
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      return ReadResult::Error;
    }
    for (ssize_t i = 0; i < n; ++i) {
      if (dec.feed(block[i], out)) return ReadResult::Frame;
    }
  }
}

void close_socket(int fd) {
  if (fd >= 0) ::close(fd);
}

} // namespace eomacca
