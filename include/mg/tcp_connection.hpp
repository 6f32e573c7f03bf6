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
 * @file tcp_connection.hpp
 * @brief Time-bounded TCP sessions to a network-attached radio node.
 *
 * A BoundedTcpConnection is guaranteed to be torn down within a fixed time
 * budget: connect is poll-bounded, and a one-shot safety timer shuts the
 * socket down if the owner still holds it after setup_timeout * 2.
 * Every open connection is tracked in an injected TcpConnectionRegistry so
 * TcpLeakMonitor can force-close stragglers.
 *
 * Force-close from another thread uses shutdown(2), never close(2): the
 * owner may still be blocked in poll/recv on the fd, and only the owner
 * releases it.
 */

#ifndef MG_TCP_CONNECTION_HPP_
#define MG_TCP_CONNECTION_HPP_

#include "mg/log.hpp"
#include "mg/platform.hpp"
#include "mg/socket.hpp"
#include "mg/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

#include <poll.h>
#include <sys/socket.h>

namespace mg {

class BoundedTcpConnection;

// ============================================================================
// TcpConnectionRegistry
// ============================================================================

/**
 * @brief Set of currently open BoundedTcpConnections.
 *
 * Not a singleton: the owner creates one and passes it to Open() and to
 * TcpLeakMonitor.
 */
class TcpConnectionRegistry {
 public:
  TcpConnectionRegistry() = default;
  TcpConnectionRegistry(const TcpConnectionRegistry&) = delete;
  TcpConnectionRegistry& operator=(const TcpConnectionRegistry&) = delete;

  void Register(BoundedTcpConnection* conn) {
    std::lock_guard<std::mutex> lock(mtx_);
    conns_.insert(conn);
  }

  void Unregister(BoundedTcpConnection* conn) {
    std::lock_guard<std::mutex> lock(mtx_);
    conns_.erase(conn);
  }

  uint32_t Size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return static_cast<uint32_t>(conns_.size());
  }

  /**
   * @brief Force-close every tracked connection and forget them.
   * @return Number of connections that were shut down successfully.
   */
  inline uint32_t CloseAll();

 private:
  mutable std::mutex mtx_;
  std::unordered_set<BoundedTcpConnection*> conns_;
};

// ============================================================================
// EfficientSocketReader
// ============================================================================

/**
 * @brief One readiness wait, then at most one recv(2).
 *
 * No data within the timeout is not an error: Read() returns 0 and the
 * caller decides whether to try again.
 */
class EfficientSocketReader {
 public:
  explicit EfficientSocketReader(uint32_t read_timeout_ms) noexcept
      : read_timeout_ms_(read_timeout_ms) {}

  /// @return Bytes read, or 0 on timeout, poll error or peer close.
  int32_t Read(int fd, void* buf, size_t len) {
    if (fd < 0 || len == 0U) {
      return 0;
    }
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int pr = ::poll(&pfd, 1, static_cast<int>(read_timeout_ms_));
    if (pr == 0) {
      return 0;
    }
    if (pr < 0) {
      if (errno != EINTR) {
        MG_LOG_WARN("Tcp", "poll on fd %d failed: errno=%d", fd, errno);
      }
      return 0;
    }
    if ((pfd.revents & POLLNVAL) != 0) {
      MG_LOG_WARN("Tcp", "poll on fd %d: invalid descriptor", fd);
      return 0;
    }

    ssize_t n = ::recv(fd, buf, len, MSG_DONTWAIT);
    if (n == 0) {
      peer_closed_ = true;
      return 0;
    }
    if (n < 0) {
      if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
        MG_LOG_WARN("Tcp", "recv on fd %d failed: errno=%d", fd, errno);
      }
      return 0;
    }
    return static_cast<int32_t>(n);
  }

  std::string Read(int fd, size_t max_len = 4096U) {
    std::string out(max_len, '\0');
    int32_t n = Read(fd, &out[0], max_len);
    out.resize(static_cast<size_t>(n));
    return out;
  }

  /// Sticky: set once a readable socket returned EOF.
  bool PeerClosed() const noexcept { return peer_closed_; }

  uint32_t ReadTimeoutMs() const noexcept { return read_timeout_ms_; }

 private:
  uint32_t read_timeout_ms_;
  bool peer_closed_ = false;
};

// ============================================================================
// BoundedTcpConnection
// ============================================================================

class BoundedTcpConnection {
 public:
  static constexpr uint32_t kSafetyTimeoutFactor = 2U;

  using OpenResult = expected<std::unique_ptr<BoundedTcpConnection>, SocketError>;

  /**
   * @brief Resolve and connect within @p setup_timeout_ms, register, arm timer.
   *
   * @param registry         Tracks the connection until Close().
   * @param host             Host name or dotted quad (IPv4).
   * @param setup_timeout_ms Connect bound; the safety timer fires at twice
   *                         this value.
   * @param read_timeout_ms  Readiness wait used by Read().
   */
  static OpenResult Open(TcpConnectionRegistry& registry, const char* host, uint16_t port,
                         uint32_t setup_timeout_ms, uint32_t read_timeout_ms) {
    MG_ASSERT(host != nullptr);
    const uint64_t start = SteadyNowMs();
    auto addr = SocketAddress::Resolve(host, port);
    if (!addr.has_value()) {
      MG_LOG_WARN("Tcp", "cannot resolve %s", host);
      return OpenResult::error(addr.get_error());
    }
    // Resolution and connect share one setup budget.
    const uint64_t resolve_ms = SteadyNowMs() - start;
    if (resolve_ms >= setup_timeout_ms) {
      MG_LOG_WARN("Tcp", "resolving %s took %llu ms, setup budget %u ms exhausted", host,
                  static_cast<unsigned long long>(resolve_ms), setup_timeout_ms);
      return OpenResult::error(SocketError::kConnectTimeout);
    }
    const uint32_t connect_budget_ms = setup_timeout_ms - static_cast<uint32_t>(resolve_ms);

    auto sock = TcpSocket::Create();
    if (!sock.has_value()) {
      return OpenResult::error(sock.get_error());
    }

    auto cr = sock.value().ConnectTimeout(addr.value(), connect_budget_ms);
    if (!cr.has_value()) {
      MG_LOG_WARN("Tcp", "connect to %s:%u failed: %s", host, static_cast<unsigned>(port),
                  SocketErrorName(cr.get_error()));
      return OpenResult::error(cr.get_error());
    }
    (void)sock.value().SetNoDelay(true);

    std::unique_ptr<BoundedTcpConnection> conn(new BoundedTcpConnection(
        registry, static_cast<TcpSocket&&>(sock.value()), host, port, read_timeout_ms));
    registry.Register(conn.get());
    conn->ArmSafetyTimer(setup_timeout_ms * kSafetyTimeoutFactor);
    MG_LOG_INFO("Tcp", "connected to %s:%u (fd %d)", host, static_cast<unsigned>(port),
                conn->Fd());
    return OpenResult::success(static_cast<std::unique_ptr<BoundedTcpConnection>&&>(conn));
  }

  ~BoundedTcpConnection() { Close(); }

  BoundedTcpConnection(const BoundedTcpConnection&) = delete;
  BoundedTcpConnection& operator=(const BoundedTcpConnection&) = delete;

  /// Cancel the timer, unregister, release the fd. Idempotent.
  void Close() {
    CancelTimer();
    registry_.Unregister(this);

    std::lock_guard<std::mutex> lock(sock_mtx_);
    if (!sock_.IsValid()) {
      return;
    }
    sock_.Close();
    const double elapsed_s = static_cast<double>(SteadyNowNs() - opened_at_ns_) / 1e9;
    MG_LOG_INFO("Tcp", "connection to %s:%u closed after %.2f s", host_.c_str(),
                static_cast<unsigned>(port_), elapsed_s);
  }

  /// Stop the safety timer without closing the connection.
  void CancelTimer() {
    {
      std::lock_guard<std::mutex> lk(timer_mtx_);
      timer_cancelled_ = true;
    }
    timer_cv_.notify_all();
    if (timer_.joinable() && timer_.get_id() != std::this_thread::get_id()) {
      timer_.join();
    }
  }

  /**
   * @brief shutdown(SHUT_RDWR) without releasing the fd.
   *
   * Used by the safety timer and by TcpConnectionRegistry::CloseAll().
   * @return false if the socket was already gone or shutdown(2) failed.
   */
  bool ForceShutdown() {
    std::lock_guard<std::mutex> lock(sock_mtx_);
    if (!sock_.IsValid()) {
      return false;
    }
    force_closed_.store(true);
    if (!sock_.Shutdown().has_value()) {
      MG_LOG_WARN("Tcp", "shutdown of %s:%u failed: errno=%d", host_.c_str(),
                  static_cast<unsigned>(port_), errno);
      return false;
    }
    return true;
  }

  /**
   * @brief Non-blocking liveness probe.
   *
   * A readable socket whose MSG_PEEK returns 0 bytes has been closed by the
   * peer; pending data or no readiness at all both mean alive.
   */
  bool IsPeerAlive() const {
    std::lock_guard<std::mutex> lock(sock_mtx_);
    if (!sock_.IsValid() || force_closed_.load()) {
      return false;
    }
    struct pollfd pfd;
    pfd.fd = sock_.Fd();
    pfd.events = POLLIN;
    pfd.revents = 0;
    int pr = ::poll(&pfd, 1, 0);
    if (pr < 0) {
      return errno == EINTR;
    }
    if (pr == 0) {
      return true;
    }
    if ((pfd.revents & (POLLERR | POLLNVAL)) != 0) {
      return false;
    }
    char probe;
    ssize_t n = ::recv(sock_.Fd(), &probe, 1, MSG_PEEK | MSG_DONTWAIT);
    if (n > 0) {
      return true;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      return true;
    }
    return false;
  }

  expected<int32_t, SocketError> Send(const void* data, size_t len) {
    std::lock_guard<std::mutex> lock(sock_mtx_);
    return sock_.Send(data, len);
  }

  /// See EfficientSocketReader::Read().
  int32_t Read(void* buf, size_t len) { return reader_.Read(Fd(), buf, len); }

  bool PeerClosed() const noexcept { return reader_.PeerClosed(); }

  bool IsOpen() const {
    std::lock_guard<std::mutex> lock(sock_mtx_);
    return sock_.IsValid();
  }

  /// True once the safety timer or CloseAll() shut the socket down.
  bool WasForceClosed() const noexcept { return force_closed_.load(); }

  int Fd() const {
    std::lock_guard<std::mutex> lock(sock_mtx_);
    return sock_.Fd();
  }

  const char* Host() const noexcept { return host_.c_str(); }
  uint16_t Port() const noexcept { return port_; }

 private:
  BoundedTcpConnection(TcpConnectionRegistry& registry, TcpSocket&& sock, const char* host,
                       uint16_t port, uint32_t read_timeout_ms)
      : registry_(registry),
        sock_(static_cast<TcpSocket&&>(sock)),
        host_(TruncateToCapacity, host),
        port_(port),
        opened_at_ns_(SteadyNowNs()),
        reader_(read_timeout_ms) {}

  void ArmSafetyTimer(uint32_t timeout_ms) {
    timer_ = std::thread([this, timeout_ms] {
      std::unique_lock<std::mutex> lk(timer_mtx_);
      bool cancelled = timer_cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms),
                                          [this] { return timer_cancelled_; });
      lk.unlock();
      if (!cancelled && ForceShutdown()) {
        MG_LOG_WARN("Tcp", "%s:%u still open after %u ms, forced shutdown", host_.c_str(),
                    static_cast<unsigned>(port_), timeout_ms);
      }
    });
  }

  TcpConnectionRegistry& registry_;

  mutable std::mutex sock_mtx_;
  TcpSocket sock_;
  FixedString<64> host_;
  uint16_t port_;
  uint64_t opened_at_ns_;
  std::atomic<bool> force_closed_{false};

  EfficientSocketReader reader_;

  std::mutex timer_mtx_;
  std::condition_variable timer_cv_;
  bool timer_cancelled_ = false;
  std::thread timer_;
};

inline uint32_t TcpConnectionRegistry::CloseAll() {
  std::lock_guard<std::mutex> lock(mtx_);
  uint32_t closed = 0;
  for (BoundedTcpConnection* conn : conns_) {
    if (conn->ForceShutdown()) {
      ++closed;
    } else {
      MG_LOG_WARN("TcpReg", "could not close connection to %s:%u", conn->Host(),
                  static_cast<unsigned>(conn->Port()));
    }
  }
  conns_.clear();
  return closed;
}

// ============================================================================
// ScopedTcpConnection
// ============================================================================

/**
 * @brief Closes and unregisters a connection on every exit path.
 *
 * @code
 *   auto r = mg::BoundedTcpConnection::Open(reg, "10.0.0.7", 4403, 10000, 2000);
 *   if (!r.has_value()) return;
 *   mg::ScopedTcpConnection conn(std::move(r.value()));
 *   conn->Send(buf, len);
 * @endcode
 */
class ScopedTcpConnection {
 public:
  explicit ScopedTcpConnection(std::unique_ptr<BoundedTcpConnection> conn) noexcept
      : conn_(static_cast<std::unique_ptr<BoundedTcpConnection>&&>(conn)) {}

  ~ScopedTcpConnection() {
    if (conn_ != nullptr) {
      conn_->Close();
    }
  }

  ScopedTcpConnection(const ScopedTcpConnection&) = delete;
  ScopedTcpConnection& operator=(const ScopedTcpConnection&) = delete;

  BoundedTcpConnection* operator->() const noexcept { return conn_.get(); }
  BoundedTcpConnection* get() const noexcept { return conn_.get(); }

  /// Give up ownership; the caller becomes responsible for Close().
  std::unique_ptr<BoundedTcpConnection> Release() noexcept {
    return static_cast<std::unique_ptr<BoundedTcpConnection>&&>(conn_);
  }

 private:
  std::unique_ptr<BoundedTcpConnection> conn_;
};

// ============================================================================
// TcpLeakMonitor
// ============================================================================

struct TcpLeakMonitorConfig {
  uint32_t initial_delay_ms = 30000U;
  uint32_t interval_ms = 60000U;
  uint32_t max_connections = 3U;
  uint32_t join_timeout_ms = 2000U;
};

/// Periodically force-closes everything when too many sessions are open.
class TcpLeakMonitor {
 public:
  TcpLeakMonitor(TcpConnectionRegistry& registry,
                 const TcpLeakMonitorConfig& cfg = TcpLeakMonitorConfig{}) noexcept
      : registry_(registry), cfg_(cfg) {}

  ~TcpLeakMonitor() {
    Stop();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  TcpLeakMonitor(const TcpLeakMonitor&) = delete;
  TcpLeakMonitor& operator=(const TcpLeakMonitor&) = delete;

  void Start() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (thread_.joinable()) {
      return;
    }
    stop_ = false;
    exited_ = false;
    thread_ = std::thread([this] { Run(); });
  }

  /// @return false if the thread did not exit within join_timeout_ms.
  bool Stop() {
    std::unique_lock<std::mutex> lk(mtx_);
    if (!thread_.joinable()) {
      return true;
    }
    stop_ = true;
    cv_.notify_all();
    if (!cv_.wait_for(lk, std::chrono::milliseconds(cfg_.join_timeout_ms),
                      [this] { return exited_; })) {
      MG_LOG_WARN("TcpLeak", "monitor did not stop within %u ms", cfg_.join_timeout_ms);
      return false;
    }
    lk.unlock();
    thread_.join();
    return true;
  }

  /// @return Connections closed by this check (0 when under the limit).
  uint32_t CheckOnce() {
    const uint32_t open = registry_.Size();
    if (open <= cfg_.max_connections) {
      return 0U;
    }
    MG_LOG_WARN("TcpLeak", "%u open TCP connections (limit %u), closing all", open,
                cfg_.max_connections);
    const uint32_t closed = registry_.CloseAll();
    MG_LOG_INFO("TcpLeak", "closed %u of %u connections", closed, open);
    return closed;
  }

  bool IsRunning() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return thread_.joinable() && !exited_;
  }

 private:
  bool WaitStop(uint32_t ms) {
    std::unique_lock<std::mutex> lk(mtx_);
    return !cv_.wait_for(lk, std::chrono::milliseconds(ms), [this] { return stop_; });
  }

  void Run() {
    if (WaitStop(cfg_.initial_delay_ms)) {
      do {
        (void)CheckOnce();
      } while (WaitStop(cfg_.interval_ms));
    }
    {
      std::lock_guard<std::mutex> lk(mtx_);
      exited_ = true;
    }
    cv_.notify_all();
  }

  TcpConnectionRegistry& registry_;
  TcpLeakMonitorConfig cfg_;

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  bool stop_ = false;
  bool exited_ = false;
  std::thread thread_;
};

}  // namespace mg

#endif  // MG_TCP_CONNECTION_HPP_
