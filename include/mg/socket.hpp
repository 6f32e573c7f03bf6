/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file socket.hpp
 * @brief POSIX TCP socket RAII wrappers with timeout-bounded connect.
 *
 * TcpSocket owns one fd (move-only, idempotent Close()). ConnectTimeout()
 * performs a non-blocking connect(2) and waits for completion with poll(2),
 * so session setup can never hang on an unreachable radio node.
 * TcpListener is the passive side, used for loopback peers.
 *
 * All errors are returned via mg::expected<V, SocketError>.
 */

#ifndef MG_SOCKET_HPP_
#define MG_SOCKET_HPP_

#include "mg/platform.hpp"
#include "mg/vocabulary.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace mg {

constexpr int32_t kDefaultBacklog = 16;

enum class SocketError : uint8_t {
  kInvalidFd = 0,
  kResolveFailed,
  kConnectFailed,
  kConnectTimeout,
  kBindFailed,
  kListenFailed,
  kAcceptFailed,
  kSendFailed,
  kRecvFailed,
  kSetOptFailed,
  kWouldBlock,  ///< EAGAIN/EWOULDBLOCK; transient.
  kShutdownFailed,
};

inline const char* SocketErrorName(SocketError e) noexcept {
  switch (e) {
    case SocketError::kInvalidFd:
      return "invalid fd";
    case SocketError::kResolveFailed:
      return "resolve failed";
    case SocketError::kConnectFailed:
      return "connect failed";
    case SocketError::kConnectTimeout:
      return "connect timeout";
    case SocketError::kBindFailed:
      return "bind failed";
    case SocketError::kListenFailed:
      return "listen failed";
    case SocketError::kAcceptFailed:
      return "accept failed";
    case SocketError::kSendFailed:
      return "send failed";
    case SocketError::kRecvFailed:
      return "recv failed";
    case SocketError::kSetOptFailed:
      return "setsockopt failed";
    case SocketError::kWouldBlock:
      return "would block";
    case SocketError::kShutdownFailed:
      return "shutdown failed";
    default:
      return "unknown";
  }
}

// ============================================================================
// SocketAddress
// ============================================================================

/** @brief IPv4 endpoint (sockaddr_in). */
class SocketAddress {
 public:
  SocketAddress() noexcept { std::memset(&addr_, 0, sizeof(addr_)); }

  static expected<SocketAddress, SocketError> FromIpv4(const char* ip,
                                                       uint16_t port) noexcept {
    SocketAddress sa;
    sa.addr_.sin_family = AF_INET;
    sa.addr_.sin_port = htons(port);
    if (::inet_pton(AF_INET, ip, &sa.addr_.sin_addr) != 1) {
      return expected<SocketAddress, SocketError>::error(SocketError::kResolveFailed);
    }
    return expected<SocketAddress, SocketError>::success(sa);
  }

  /**
   * @brief Resolve a host name or dotted quad to its first IPv4 address.
   *
   * Numeric hosts never touch the resolver. Names block in getaddrinfo(3),
   * whose duration is bounded only by the resolver configuration
   * (resolv.conf timeout/attempts); callers that need a hard setup bound
   * charge the elapsed time against their budget.
   */
  static expected<SocketAddress, SocketError> Resolve(const char* host,
                                                      uint16_t port) noexcept {
    auto numeric = FromIpv4(host, port);
    if (numeric.has_value()) {
      return numeric;
    }
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* res = nullptr;
    if (::getaddrinfo(host, nullptr, &hints, &res) != 0 || res == nullptr) {
      return expected<SocketAddress, SocketError>::error(SocketError::kResolveFailed);
    }
    SocketAddress sa;
    std::memcpy(&sa.addr_, res->ai_addr, sizeof(sa.addr_));
    sa.addr_.sin_port = htons(port);
    ::freeaddrinfo(res);
    return expected<SocketAddress, SocketError>::success(sa);
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast) -- POSIX sockaddr cast
  const sockaddr* Raw() const noexcept { return reinterpret_cast<const sockaddr*>(&addr_); }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast) -- POSIX sockaddr cast
  sockaddr* RawMut() noexcept { return reinterpret_cast<sockaddr*>(&addr_); }

  socklen_t Size() const noexcept { return static_cast<socklen_t>(sizeof(addr_)); }

  uint16_t Port() const noexcept { return ntohs(addr_.sin_port); }

 private:
  sockaddr_in addr_;
};

// ============================================================================
// TcpSocket
// ============================================================================

class TcpSocket {
 public:
  TcpSocket() noexcept : fd_(-1) {}
  ~TcpSocket() { Close(); }

  TcpSocket(TcpSocket&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

  TcpSocket& operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  TcpSocket(const TcpSocket&) = delete;
  TcpSocket& operator=(const TcpSocket&) = delete;

  static expected<TcpSocket, SocketError> Create() noexcept {
    int32_t fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
      return expected<TcpSocket, SocketError>::error(SocketError::kInvalidFd);
    }
    return expected<TcpSocket, SocketError>::success(TcpSocket(fd));
  }

  /**
   * @brief Connect, giving up after @p timeout_ms.
   *
   * The socket is left in blocking mode on success.
   */
  expected<void, SocketError> ConnectTimeout(const SocketAddress& addr,
                                             uint32_t timeout_ms) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (!SetNonBlocking(true).has_value()) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }

    if (::connect(fd_, addr.Raw(), addr.Size()) < 0) {
      if (errno != EINPROGRESS) {
        return expected<void, SocketError>::error(SocketError::kConnectFailed);
      }
      struct pollfd pfd;
      pfd.fd = fd_;
      pfd.events = POLLOUT;
      const uint64_t deadline = SteadyNowMs() + timeout_ms;
      int pr;
      for (;;) {
        const uint64_t now = SteadyNowMs();
        const int left = (now < deadline) ? static_cast<int>(deadline - now) : 0;
        pfd.revents = 0;
        pr = ::poll(&pfd, 1, left);
        if (pr >= 0 || errno != EINTR) {
          break;
        }
      }
      if (pr == 0) {
        return expected<void, SocketError>::error(SocketError::kConnectTimeout);
      }
      int so_error = 0;
      socklen_t len = static_cast<socklen_t>(sizeof(so_error));
      if (pr < 0 || ::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 ||
          so_error != 0) {
        return expected<void, SocketError>::error(SocketError::kConnectFailed);
      }
    }

    if (!SetNonBlocking(false).has_value()) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<int32_t, SocketError> Send(const void* data, size_t len) noexcept {
    if (fd_ < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    auto n = ::send(fd_, data, len, MSG_NOSIGNAL);
    if (n < 0) {
      return expected<int32_t, SocketError>::error(
          (errno == EAGAIN || errno == EWOULDBLOCK) ? SocketError::kWouldBlock
                                                    : SocketError::kSendFailed);
    }
    return expected<int32_t, SocketError>::success(static_cast<int32_t>(n));
  }

  expected<void, SocketError> SetNonBlocking(bool enable) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    int32_t flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (::fcntl(fd_, F_SETFL, flags) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  expected<void, SocketError> SetNoDelay(bool enable) noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    int32_t opt = enable ? 1 : 0;
    if (::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &opt,
                     static_cast<socklen_t>(sizeof(opt))) < 0) {
      return expected<void, SocketError>::error(SocketError::kSetOptFailed);
    }
    return expected<void, SocketError>::success();
  }

  /**
   * @brief shutdown(2) both directions without releasing the fd.
   *
   * Safe to call from another thread while a reader is blocked in poll/recv
   * on this socket: the reader wakes up with EOF. A peer that is already
   * gone (ENOTCONN) counts as success.
   */
  expected<void, SocketError> Shutdown() noexcept {
    if (fd_ < 0) {
      return expected<void, SocketError>::error(SocketError::kInvalidFd);
    }
    if (::shutdown(fd_, SHUT_RDWR) != 0 && errno != ENOTCONN) {
      return expected<void, SocketError>::error(SocketError::kShutdownFailed);
    }
    return expected<void, SocketError>::success();
  }

  /** @brief Close the socket. Idempotent. */
  void Close() noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int32_t Fd() const noexcept { return fd_; }
  bool IsValid() const noexcept { return fd_ >= 0; }

 private:
  friend class TcpListener;

  explicit TcpSocket(int32_t fd) noexcept : fd_(fd) {}

  int32_t fd_;
};

// ============================================================================
// TcpListener
// ============================================================================

class TcpListener {
 public:
  TcpListener() noexcept : fd_(-1) {}
  ~TcpListener() { Close(); }

  TcpListener(TcpListener&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

  TcpListener& operator=(TcpListener&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  TcpListener(const TcpListener&) = delete;
  TcpListener& operator=(const TcpListener&) = delete;

  /**
   * @brief Create, bind and listen in one step.
   *
   * Port 0 picks an ephemeral port; read it back with LocalPort().
   */
  static expected<TcpListener, SocketError> Listen(const SocketAddress& addr,
                                                   int32_t backlog = kDefaultBacklog) noexcept {
    int32_t fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
      return expected<TcpListener, SocketError>::error(SocketError::kInvalidFd);
    }
    TcpListener l(fd);
    int32_t opt = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, static_cast<socklen_t>(sizeof(opt))) <
        0) {
      return expected<TcpListener, SocketError>::error(SocketError::kSetOptFailed);
    }
    if (::bind(fd, addr.Raw(), addr.Size()) < 0) {
      return expected<TcpListener, SocketError>::error(SocketError::kBindFailed);
    }
    if (::listen(fd, backlog) < 0) {
      return expected<TcpListener, SocketError>::error(SocketError::kListenFailed);
    }
    return expected<TcpListener, SocketError>::success(static_cast<TcpListener&&>(l));
  }

  expected<TcpSocket, SocketError> Accept() noexcept {
    if (fd_ < 0) {
      return expected<TcpSocket, SocketError>::error(SocketError::kInvalidFd);
    }
    int32_t client = ::accept(fd_, nullptr, nullptr);
    if (client < 0) {
      return expected<TcpSocket, SocketError>::error(SocketError::kAcceptFailed);
    }
    return expected<TcpSocket, SocketError>::success(TcpSocket(client));
  }

  uint16_t LocalPort() const noexcept {
    SocketAddress sa;
    socklen_t len = sa.Size();
    if (fd_ < 0 || ::getsockname(fd_, sa.RawMut(), &len) < 0) {
      return 0;
    }
    return sa.Port();
  }

  void Close() noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int32_t Fd() const noexcept { return fd_; }
  bool IsValid() const noexcept { return fd_ >= 0; }

 private:
  explicit TcpListener(int32_t fd) noexcept : fd_(fd) {}

  int32_t fd_;
};

}  // namespace mg

#endif  // MG_SOCKET_HPP_
