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
 * @file serial_connection.hpp
 * @brief Lifecycle owner for one serial device connection.
 *
 * SerialConnectionManager opens a device through an injected DeviceFactory,
 * verifies it, hands it out, and keeps it alive:
 *
 *   - Port contention: waits (bounded) for other processes to release the
 *     advisory lock; detects and force-resolves locks held by this process.
 *   - Open retries: EINTR is retried transparently, hard failures are
 *     retried with a linear, capped delay.
 *   - Liveness: handle, stream, device node and protocol are checked in that
 *     order; IsConnected() caches the verdict for liveness_cache_ms.
 *   - Monitor thread: reconnects with exponential backoff after a loss and
 *     logs the downtime once the device is back.
 *   - Disconnect events from the protocol layer are ignored while a
 *     (re)connect is running and during the post-connect grace period.
 *
 * Every state transition happens under one recursive mutex. Every sleep is a
 * condition-variable wait on the stop flag, so Close() never waits for a
 * full backoff interval. IsConnected() and Close() never block on a
 * (re)connect that is in progress.
 */

#ifndef MG_SERIAL_CONNECTION_HPP_
#define MG_SERIAL_CONNECTION_HPP_

#include "mg/log.hpp"
#include "mg/platform.hpp"
#include "mg/port_lock.hpp"
#include "mg/serial_device.hpp"
#include "mg/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <ctime>
#include <memory>
#include <mutex>
#include <thread>

#include <sys/stat.h>
#include <unistd.h>

namespace mg {

// ============================================================================
// State / errors / config
// ============================================================================

enum class ConnectionState : uint8_t {
  kDisconnected = 0,
  kConnecting,
  kConnected,
  kReconnecting,
  kSelfLocked,
};

inline const char* ConnectionStateName(ConnectionState s) noexcept {
  switch (s) {
    case ConnectionState::kDisconnected:
      return "disconnected";
    case ConnectionState::kConnecting:
      return "connecting";
    case ConnectionState::kConnected:
      return "connected";
    case ConnectionState::kReconnecting:
      return "reconnecting";
    case ConnectionState::kSelfLocked:
      return "self-locked";
    default:
      return "unknown";
  }
}

/// Cause of the most recent Connect() failure.
enum class SerialError : uint8_t {
  kNone = 0,
  kPortLocked,        ///< Held by another process past the lock wait.
  kSelfLocked,        ///< Still locked after force-closing our own handle.
  kInterrupted,       ///< EINTR persisted past the transparent retries.
  kDeviceOpenFailed,  ///< Factory kept failing until retries ran out.
  kLivenessFailed,    ///< Opened, but the liveness check did not pass.
  kStopped,           ///< Close() interrupted the attempt.
};

struct SerialManagerConfig {
  char port[64] = "/dev/ttyACM0";

  uint32_t max_retries = 5U;
  uint32_t retry_delay_ms = 5000U;
  uint32_t max_retry_delay_ms = 60000U;
  bool auto_reconnect = true;

  uint32_t port_lock_wait_ms = 30000U;
  uint32_t lock_poll_interval_ms = 1000U;
  uint32_t self_lock_release_ms = 3000U;  ///< Time for the OS to drop our flock.

  uint32_t interrupt_retries = 3U;
  uint32_t interrupt_retry_delay_ms = 100U;

  uint32_t stabilization_ms = 3000U;
  uint32_t grace_period_ms = 5000U;
  uint32_t liveness_cache_ms = 1000U;

  uint32_t monitor_interval_ms = 5000U;
  uint32_t join_timeout_ms = 2000U;
};

struct SerialConnectionStats {
  ConnectionState state = ConnectionState::kDisconnected;
  SerialError last_error = SerialError::kNone;
  time_t connected_at = 0;  ///< Wall clock of the last successful connect.
  uint32_t total_connects = 0;
  uint32_t total_reconnects = 0;  ///< Connects made by the monitor.
  uint32_t failed_attempts = 0;   ///< Open attempts that did not yield a live handle.
  uint32_t self_lock_resolutions = 0;
  uint32_t monitor_retries = 0;   ///< Current consecutive monitor cycles.
};

// ============================================================================
// SerialConnectionManager
// ============================================================================

class SerialConnectionManager {
 public:
  static constexpr uint32_t kMaxBackoffExponent = 5U;

  SerialConnectionManager(const SerialManagerConfig& cfg, DeviceFactory& factory,
                          PortLockInspector& inspector) noexcept
      : cfg_(cfg), factory_(factory), inspector_(inspector) {}

  ~SerialConnectionManager() {
    Close();
    if (monitor_.joinable()) {
      monitor_.join();
      std::lock_guard<std::recursive_timed_mutex> lock(mtx_);
      ReleaseHandle();
      state_.store(ConnectionState::kDisconnected);
    }
  }

  SerialConnectionManager(const SerialConnectionManager&) = delete;
  SerialConnectionManager& operator=(const SerialConnectionManager&) = delete;

  // --------------------------------------------------------------------------
  // Backoff helpers
  // --------------------------------------------------------------------------

  /// Delay after failed attempt @p attempt (1-based): base * attempt, capped.
  static uint32_t ComputeRetryDelayMs(uint32_t attempt, uint32_t base_ms,
                                      uint32_t max_ms) noexcept {
    const uint64_t d = static_cast<uint64_t>(base_ms) * attempt;
    return (d > max_ms) ? max_ms : static_cast<uint32_t>(d);
  }

  /// Monitor backoff: base * 2^min(retries, 5), capped.
  static uint32_t ComputeBackoffDelayMs(uint32_t retries, uint32_t base_ms,
                                        uint32_t max_ms) noexcept {
    const uint32_t exp = (retries < kMaxBackoffExponent) ? retries : kMaxBackoffExponent;
    const uint64_t d = static_cast<uint64_t>(base_ms) << exp;
    return (d > max_ms) ? max_ms : static_cast<uint32_t>(d);
  }

  // --------------------------------------------------------------------------
  // Connect
  // --------------------------------------------------------------------------

  /**
   * @brief Establish (or confirm) a live connection.
   *
   * Idempotent. Blocks for at most the lock wait plus the retry schedule.
   * Concurrent callers serialize on the manager lock.
   */
  bool Connect() {
    std::lock_guard<std::recursive_timed_mutex> lock(mtx_);

    if (state_.load() == ConnectionState::kConnected) {
      if (VerifyAliveLocked()) {
        return true;
      }
      MarkLost();
    }
    if (StopRequested()) {
      last_error_ = SerialError::kStopped;
      return false;
    }

    const bool reconnect = (stats_.total_connects > 0U);
    state_.store(reconnect ? ConnectionState::kReconnecting : ConnectionState::kConnecting);
    MG_LOG_INFO("Serial", "%s %s (max %u attempts)", reconnect ? "reconnecting" : "connecting",
                cfg_.port, cfg_.max_retries);

    for (uint32_t attempt = 1U; attempt <= cfg_.max_retries; ++attempt) {
      if (attempt > 1U) {
        const uint32_t delay =
            ComputeRetryDelayMs(attempt - 1U, cfg_.retry_delay_ms, cfg_.max_retry_delay_ms);
        MG_LOG_INFO("Serial", "retry %u/%u for %s in %u ms", attempt, cfg_.max_retries,
                    cfg_.port, delay);
        if (!WaitStop(delay)) {
          return FailConnect(SerialError::kStopped);
        }
      }

      SerialError lock_err = ResolvePortLock();
      if (lock_err != SerialError::kNone) {
        return FailConnect(lock_err);
      }

      DeviceResult opened = OpenDevice();
      if (!opened.has_value()) {
        ++stats_.failed_attempts;
        last_error_ = (opened.get_error() == DeviceOpenError::kInterrupted)
                          ? SerialError::kInterrupted
                          : SerialError::kDeviceOpenFailed;
        MG_LOG_WARN("Serial", "attempt %u/%u: cannot open %s: %s", attempt, cfg_.max_retries,
                    cfg_.port, DeviceOpenErrorName(opened.get_error()));
        continue;
      }

      ReleaseHandle();
      handle_ = std::move(opened.value());

      if (!WaitStop(cfg_.stabilization_ms)) {
        ReleaseHandle();
        return FailConnect(SerialError::kStopped);
      }

      if (!VerifyAliveLocked()) {
        ++stats_.failed_attempts;
        last_error_ = SerialError::kLivenessFailed;
        MG_LOG_WARN("Serial", "attempt %u/%u: %s opened but liveness check failed", attempt,
                    cfg_.max_retries, cfg_.port);
        ReleaseHandle();
        continue;
      }

      OnConnected();
      return true;
    }

    MG_LOG_ERROR("Serial", "giving up on %s after %u attempts", cfg_.port, cfg_.max_retries);
    return FailConnect(last_error_ == SerialError::kNone ? SerialError::kDeviceOpenFailed
                                                         : last_error_);
  }

  // --------------------------------------------------------------------------
  // Liveness / access
  // --------------------------------------------------------------------------

  /// Handle present, stream open, device node present, protocol connected.
  bool VerifyAlive() {
    std::lock_guard<std::recursive_timed_mutex> lock(mtx_);
    return VerifyAliveLocked();
  }

  /**
   * @brief Cheap connected check.
   *
   * Re-runs VerifyAlive() at most once per liveness_cache_ms; a failing
   * check downgrades the state to kDisconnected. Never waits for the
   * manager lock: while another thread holds it the current state is
   * reported without re-validation.
   */
  bool IsConnected() {
    if (state_.load() != ConnectionState::kConnected) {
      return false;
    }
    std::unique_lock<std::recursive_timed_mutex> lock(mtx_, std::try_to_lock);
    if (!lock.owns_lock()) {
      return state_.load() == ConnectionState::kConnected;
    }
    if (state_.load() != ConnectionState::kConnected) {
      return false;
    }
    const uint64_t now = SteadyNowMs();
    if (now - last_liveness_ms_ < cfg_.liveness_cache_ms) {
      return true;
    }
    last_liveness_ms_ = now;
    if (VerifyAliveLocked()) {
      return true;
    }
    MG_LOG_WARN("Serial", "liveness check failed on %s", cfg_.port);
    last_error_ = SerialError::kLivenessFailed;
    MarkLost();
    return false;
  }

  /**
   * @brief Live handle, reconnecting first if needed.
   *
   * The handle stays owned by the manager and is invalidated by the next
   * reconnect or Close(). Returns nullptr when no connection can be made.
   */
  DeviceHandle* GetHandle() {
    std::lock_guard<std::recursive_timed_mutex> lock(mtx_);
    if (IsConnected() || Connect()) {
      return handle_.get();
    }
    return nullptr;
  }

  // --------------------------------------------------------------------------
  // Disconnect notifications
  // --------------------------------------------------------------------------

  /**
   * @brief Report a "connection lost" event from the protocol layer.
   *
   * Ignored while a (re)connect is in flight, inside the grace period, or
   * after Close(). Otherwise drops the state to kDisconnected at once.
   */
  void NotifyConnectionLost() {
    const ConnectionState s = state_.load();
    if (s == ConnectionState::kConnecting || s == ConnectionState::kReconnecting ||
        s == ConnectionState::kSelfLocked) {
      MG_LOG_DEBUG("Serial", "disconnect event ignored: %s in progress", ConnectionStateName(s));
      return;
    }
    if (!IsDisconnectArmed()) {
      MG_LOG_DEBUG("Serial", "disconnect event ignored: grace period or not subscribed");
      return;
    }

    std::lock_guard<std::recursive_timed_mutex> lock(mtx_);
    if (state_.load() != ConnectionState::kConnected) {
      return;
    }
    MG_LOG_WARN("Serial", "disconnect event received for %s", cfg_.port);
    self_lock_resolved_ = false;
    MarkLost();
  }

  /// True once the post-connect grace period has elapsed and until Close().
  bool IsDisconnectArmed() const noexcept {
    return subscribed_.load() && SteadyNowMs() >= grace_deadline_ms_.load();
  }

  // --------------------------------------------------------------------------
  // Close
  // --------------------------------------------------------------------------

  /**
   * @brief Stop the monitor, unsubscribe, close the handle. Idempotent.
   *
   * Returns within join_timeout_ms. A monitor or a Connect() caller that
   * is still busy (e.g. inside the device factory) sees the stop flag and
   * drops its handle itself; the destructor joins the monitor. Until a
   * later Close() finds the manager idle, Connect() keeps failing with
   * kStopped.
   */
  void Close() {
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(cfg_.join_timeout_ms);
    {
      std::lock_guard<std::mutex> lk(stop_mtx_);
      stop_requested_ = true;
    }
    stop_cv_.notify_all();
    subscribed_.store(false);

    const bool monitor_done = JoinMonitor(deadline);

    {
      std::unique_lock<std::recursive_timed_mutex> lock(mtx_, std::defer_lock);
      if (!lock.try_lock_until(deadline)) {
        MG_LOG_WARN("Serial", "%s busy in connect, handle left to the connecting thread",
                    cfg_.port);
        state_.store(ConnectionState::kDisconnected);
        return;
      }
      if (handle_ != nullptr) {
        MG_LOG_INFO("Serial", "closing %s", cfg_.port);
      }
      ReleaseHandle();
      state_.store(ConnectionState::kDisconnected);
      if (monitor_done) {
        monitor_started_ = false;
      }
    }

    if (monitor_done) {
      std::lock_guard<std::mutex> lk(stop_mtx_);
      stop_requested_ = false;
    }
  }

  // --------------------------------------------------------------------------
  // Introspection
  // --------------------------------------------------------------------------

  ConnectionState State() const noexcept { return state_.load(); }

  SerialError LastError() const {
    std::lock_guard<std::recursive_timed_mutex> lock(mtx_);
    return last_error_;
  }

  bool SelfLockResolved() const {
    std::lock_guard<std::recursive_timed_mutex> lock(mtx_);
    return self_lock_resolved_;
  }

  bool MonitorRunning() const noexcept { return monitor_running_.load(); }

  SerialConnectionStats GetStatistics() const {
    std::lock_guard<std::recursive_timed_mutex> lock(mtx_);
    SerialConnectionStats s = stats_;
    s.state = state_.load();
    s.last_error = last_error_;
    s.monitor_retries = monitor_retries_.load();
    return s;
  }

  const SerialManagerConfig& GetConfig() const noexcept { return cfg_; }

 private:
  // --------------------------------------------------------------------------
  // Connect helpers (mtx_ held)
  // --------------------------------------------------------------------------

  bool VerifyAliveLocked() const {
    if (handle_ == nullptr) {
      return false;
    }
    if (!handle_->IsStreamOpen()) {
      return false;
    }
    struct stat st;
    if (::stat(cfg_.port, &st) != 0) {
      return false;
    }
    return handle_->IsProtocolConnected();
  }

  /// Returns kNone when the port is free (or was freed) for an open attempt.
  SerialError ResolvePortLock() {
    if (!inspector_.IsLocked(cfg_.port).is_locked) {
      return SerialError::kNone;
    }

    optional<HolderInfo> holder = inspector_.IdentifyHolder(cfg_.port);
    if (holder.has_value() && holder.value().pid == ::getpid()) {
      return ResolveSelfLock();
    }
    return WaitForExternalRelease(holder);
  }

  SerialError ResolveSelfLock() {
    const ConnectionState prev = state_.load();
    state_.store(ConnectionState::kSelfLocked);
    MG_LOG_WARN("Serial", "%s is locked by this process (pid %d), forcing close of stale handle",
                cfg_.port, static_cast<int>(::getpid()));

    ReleaseHandle();
    const bool waited = WaitStop(cfg_.self_lock_release_ms);
    state_.store(ConnectionState::kDisconnected);
    if (!waited) {
      return SerialError::kStopped;
    }

    if (inspector_.IsLocked(cfg_.port).is_locked) {
      MG_LOG_ERROR("Serial", "%s still locked after forced close", cfg_.port);
      return SerialError::kSelfLocked;
    }

    ++stats_.self_lock_resolutions;
    self_lock_resolved_ = true;
    state_.store(prev);
    MG_LOG_INFO("Serial", "self-lock on %s resolved", cfg_.port);
    return SerialError::kNone;
  }

  SerialError WaitForExternalRelease(const optional<HolderInfo>& holder) {
    const char* cmd = holder.has_value() ? holder.value().command.c_str() : "unknown";
    const int pid = holder.has_value() ? static_cast<int>(holder.value().pid) : -1;
    MG_LOG_WARN("Serial", "%s locked by '%s' (pid %d), waiting up to %u ms", cfg_.port, cmd, pid,
                cfg_.port_lock_wait_ms);

    const uint64_t start = SteadyNowMs();
    const uint64_t deadline = start + cfg_.port_lock_wait_ms;
    uint64_t next_progress = start + kProgressLogIntervalMs;
    for (;;) {
      const uint64_t now = SteadyNowMs();
      if (now >= deadline) {
        break;
      }
      const uint64_t left = deadline - now;
      const uint32_t step = (left < cfg_.lock_poll_interval_ms) ? static_cast<uint32_t>(left)
                                                                : cfg_.lock_poll_interval_ms;
      if (!WaitStop(step)) {
        return SerialError::kStopped;
      }
      if (!inspector_.IsLocked(cfg_.port).is_locked) {
        MG_LOG_INFO("Serial", "%s released after %llu ms", cfg_.port,
                    static_cast<unsigned long long>(SteadyNowMs() - start));
        return SerialError::kNone;
      }
      if (SteadyNowMs() >= next_progress) {
        MG_LOG_INFO("Serial", "still waiting for '%s' to release %s (%llu/%u ms)", cmd, cfg_.port,
                    static_cast<unsigned long long>(SteadyNowMs() - start),
                    cfg_.port_lock_wait_ms);
        next_progress += kProgressLogIntervalMs;
      }
    }

    MG_LOG_ERROR("Serial", "%s still locked by '%s' (pid %d) after %u ms", cfg_.port, cmd, pid,
                 cfg_.port_lock_wait_ms);
    return SerialError::kPortLocked;
  }

  /// One open attempt; EINTR is retried up to interrupt_retries more times.
  DeviceResult OpenDevice() {
    for (uint32_t retry = 0U;; ++retry) {
      DeviceResult r = factory_.Open(cfg_.port);
      if (r.has_value() || r.get_error() != DeviceOpenError::kInterrupted) {
        return r;
      }
      if (retry >= cfg_.interrupt_retries) {
        return r;
      }
      MG_LOG_WARN("Serial", "open %s interrupted (EINTR), retry %u/%u", cfg_.port, retry + 1U,
                  cfg_.interrupt_retries);
      if (!WaitStop(cfg_.interrupt_retry_delay_ms)) {
        return r;
      }
    }
  }

  void OnConnected() {
    state_.store(ConnectionState::kConnected);
    last_error_ = SerialError::kNone;
    last_liveness_ms_ = SteadyNowMs();
    ++stats_.total_connects;
    stats_.connected_at = std::time(nullptr);
    grace_deadline_ms_.store(SteadyNowMs() + cfg_.grace_period_ms);
    subscribed_.store(true);
    const uint64_t lost = lost_at_ms_.exchange(0U);
    last_downtime_ms_ = (lost != 0U) ? SteadyNowMs() - lost : 0U;
    MG_LOG_INFO("Serial", "connected to %s (disconnect events armed in %u ms)", cfg_.port,
                cfg_.grace_period_ms);

    if (cfg_.auto_reconnect && !monitor_started_) {
      StartMonitor();
    }
  }

  bool FailConnect(SerialError err) {
    last_error_ = err;
    if (state_.load() != ConnectionState::kConnected) {
      state_.store(ConnectionState::kDisconnected);
    }
    return false;
  }

  void MarkLost() {
    state_.store(ConnectionState::kDisconnected);
    uint64_t expected_zero = 0;
    (void)lost_at_ms_.compare_exchange_strong(expected_zero, SteadyNowMs());
  }

  void ReleaseHandle() noexcept {
    if (handle_ != nullptr) {
      handle_->Close();
      handle_.reset();
    }
  }

  // --------------------------------------------------------------------------
  // Stop flag
  // --------------------------------------------------------------------------

  /// Sleeps @p ms unless Close() is requested; returns false when stopping.
  bool WaitStop(uint32_t ms) {
    std::unique_lock<std::mutex> lk(stop_mtx_);
    return !stop_cv_.wait_for(lk, std::chrono::milliseconds(ms),
                              [this] { return stop_requested_; });
  }

  bool StopRequested() {
    std::lock_guard<std::mutex> lk(stop_mtx_);
    return stop_requested_;
  }

  // --------------------------------------------------------------------------
  // Monitor thread
  // --------------------------------------------------------------------------

  void StartMonitor() {
    monitor_started_ = true;
    {
      std::lock_guard<std::mutex> lk(stop_mtx_);
      monitor_exited_ = false;
    }
    monitor_running_.store(true);
    monitor_ = std::thread([this] { MonitorLoop(); });
  }

  bool JoinMonitor(std::chrono::steady_clock::time_point deadline) {
    if (!monitor_.joinable()) {
      return true;
    }
    bool exited = false;
    {
      std::unique_lock<std::mutex> lk(stop_mtx_);
      exited = stop_cv_.wait_until(lk, deadline, [this] { return monitor_exited_; });
    }
    if (!exited) {
      MG_LOG_WARN("SerialMon", "monitor did not stop within %u ms", cfg_.join_timeout_ms);
      return false;
    }
    monitor_.join();
    return true;
  }

  void MonitorLoop() {
    MG_LOG_INFO("SerialMon", "monitoring %s every %u ms", cfg_.port, cfg_.monitor_interval_ms);

    while (WaitStop(cfg_.monitor_interval_ms)) {
      if (IsConnected()) {
        continue;
      }

      const uint32_t retries = monitor_retries_.fetch_add(1U) + 1U;
      uint64_t never_lost = 0U;
      (void)lost_at_ms_.compare_exchange_strong(never_lost, SteadyNowMs());
      MG_LOG_WARN("SerialMon", "%s not connected, reconnect cycle #%u", cfg_.port, retries);

      if (Connect()) {
        std::lock_guard<std::recursive_timed_mutex> lock(mtx_);
        MG_LOG_INFO("SerialMon", "%s back after %u cycle(s), downtime %.1f s", cfg_.port,
                    retries, static_cast<double>(last_downtime_ms_) / 1000.0);
        monitor_retries_.store(0U);
        ++stats_.total_reconnects;
        continue;
      }

      // The loop head waits monitor_interval_ms on top of this.
      const uint32_t delay =
          ComputeBackoffDelayMs(retries, cfg_.retry_delay_ms, cfg_.max_retry_delay_ms);
      const uint32_t extra =
          (delay > cfg_.monitor_interval_ms) ? delay - cfg_.monitor_interval_ms : 0U;
      MG_LOG_WARN("SerialMon", "reconnect cycle #%u failed, next try in %u ms", retries,
                  extra + cfg_.monitor_interval_ms);
      if (!WaitStop(extra)) {
        break;
      }
    }

    monitor_running_.store(false);
    MG_LOG_DEBUG("SerialMon", "monitor for %s stopped", cfg_.port);
    {
      std::lock_guard<std::mutex> lk(stop_mtx_);
      monitor_exited_ = true;
    }
    stop_cv_.notify_all();
  }

  static constexpr uint64_t kProgressLogIntervalMs = 5000U;

  SerialManagerConfig cfg_;
  DeviceFactory& factory_;
  PortLockInspector& inspector_;

  mutable std::recursive_timed_mutex mtx_;
  std::unique_ptr<DeviceHandle> handle_;
  std::atomic<ConnectionState> state_{ConnectionState::kDisconnected};
  SerialError last_error_ = SerialError::kNone;
  SerialConnectionStats stats_;
  bool self_lock_resolved_ = false;
  bool monitor_started_ = false;
  uint64_t last_liveness_ms_ = 0;
  uint64_t last_downtime_ms_ = 0;

  std::atomic<bool> subscribed_{false};
  std::atomic<uint64_t> grace_deadline_ms_{0};
  std::atomic<uint64_t> lost_at_ms_{0};
  std::atomic<uint32_t> monitor_retries_{0};

  std::mutex stop_mtx_;
  std::condition_variable stop_cv_;
  bool stop_requested_ = false;
  bool monitor_exited_ = false;
  std::atomic<bool> monitor_running_{false};
  std::thread monitor_;
};

}  // namespace mg

#endif  // MG_SERIAL_CONNECTION_HPP_
