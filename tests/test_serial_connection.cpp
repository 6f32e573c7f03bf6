/**
 * @file test_serial_connection.cpp
 * @brief Tests for serial_connection.hpp and serial_device.hpp.
 *
 * Device contention is reproduced with flock(2) on temp files: locks taken
 * through separate open() calls conflict even inside one process. A PTY
 * pair stands in for a real tty.
 */

#include "mg/serial_connection.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <fcntl.h>
#include <pty.h>
#include <sys/file.h>
#include <unistd.h>

namespace {

// ============================================================================
// Fakes
// ============================================================================

class FakeHandle final : public mg::DeviceHandle {
 public:
  FakeHandle(int fd, std::shared_ptr<std::atomic<bool>> alive)
      : fd_(fd), alive_(std::move(alive)) {}
  ~FakeHandle() override { Close(); }

  void Close() noexcept override {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }
  bool IsStreamOpen() const noexcept override { return fd_ >= 0; }
  bool IsProtocolConnected() const noexcept override { return alive_->load(); }
  int Fd() const noexcept override { return fd_; }

 private:
  int fd_;
  std::shared_ptr<std::atomic<bool>> alive_;
};

/// Opens the path for real (optionally taking the flock) or fails on demand.
class FakeFactory final : public mg::DeviceFactory {
 public:
  mg::DeviceResult Open(const char* path) override {
    const int n = ++opens;
    const uint32_t delay = open_delay_ms.load();
    if (delay > 0U) {
      std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    }
    if (n <= fail_first || fail_always) {
      return mg::DeviceResult::error(fail_with);
    }
    int fd = ::open(path, O_RDONLY);
    if (fd < 0) {
      return mg::DeviceResult::error(mg::DeviceOpenError::kNotFound);
    }
    if (take_lock && ::flock(fd, LOCK_EX | LOCK_NB) != 0) {
      ::close(fd);
      return mg::DeviceResult::error(mg::DeviceOpenError::kPortLocked);
    }
    auto alive = std::make_shared<std::atomic<bool>>(protocol_ok.load());
    {
      std::lock_guard<std::mutex> lk(mtx_);
      current_ = alive;
    }
    return mg::DeviceResult::success(std::unique_ptr<mg::DeviceHandle>(new FakeHandle(fd, alive)));
  }

  /// Protocol layer of the most recent handle reports "disconnected".
  void KillCurrent() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (current_) current_->store(false);
  }

  std::atomic<int> opens{0};
  std::atomic<uint32_t> open_delay_ms{0};  ///< Simulates a device that is slow to open.
  int fail_first = 0;
  std::atomic<bool> fail_always{false};
  mg::DeviceOpenError fail_with = mg::DeviceOpenError::kOpenFailed;
  bool take_lock = false;
  std::atomic<bool> protocol_ok{true};

 private:
  std::mutex mtx_;
  std::shared_ptr<std::atomic<bool>> current_;
};

class FixedLookup final : public mg::HolderLookup {
 public:
  FixedLookup(pid_t pid, const char* cmd) : pid_(pid), cmd_(cmd) {}
  mg::optional<mg::HolderInfo> Lookup(const char*) override {
    mg::HolderInfo h;
    h.pid = pid_;
    h.command.assign(mg::TruncateToCapacity, cmd_);
    return mg::optional<mg::HolderInfo>(h);
  }

 private:
  pid_t pid_;
  const char* cmd_;
};

class TempDevice {
 public:
  TempDevice() {
    char tmpl[] = "/tmp/mg_tty_XXXXXX";
    int fd = ::mkstemp(tmpl);
    REQUIRE(fd >= 0);
    ::close(fd);
    path_ = tmpl;
  }
  ~TempDevice() { ::unlink(path_.c_str()); }
  const char* path() const { return path_.c_str(); }

 private:
  std::string path_;
};

/// Holds an external flock on a path until released.
class ExternalLock {
 public:
  explicit ExternalLock(const char* path) : fd_(::open(path, O_RDONLY)) {
    REQUIRE(fd_ >= 0);
    REQUIRE(::flock(fd_, LOCK_EX | LOCK_NB) == 0);
  }
  ~ExternalLock() { Release(); }
  void Release() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_;
};

mg::SerialManagerConfig FastConfig(const char* path) {
  mg::SerialManagerConfig cfg;
  std::strncpy(cfg.port, path, sizeof(cfg.port) - 1);
  cfg.max_retries = 3U;
  cfg.retry_delay_ms = 10U;
  cfg.max_retry_delay_ms = 50U;
  cfg.auto_reconnect = false;
  cfg.port_lock_wait_ms = 300U;
  cfg.lock_poll_interval_ms = 20U;
  cfg.self_lock_release_ms = 20U;
  cfg.interrupt_retries = 3U;
  cfg.interrupt_retry_delay_ms = 1U;
  cfg.stabilization_ms = 0U;
  cfg.grace_period_ms = 0U;
  cfg.liveness_cache_ms = 0U;
  cfg.monitor_interval_ms = 20U;
  cfg.join_timeout_ms = 1000U;
  return cfg;
}

template <typename Pred>
bool WaitFor(Pred pred, uint32_t timeout_ms) {
  const uint64_t deadline = mg::SteadyNowMs() + timeout_ms;
  while (mg::SteadyNowMs() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

}  // namespace

// ============================================================================
// Backoff helpers
// ============================================================================

TEST_CASE("serial - retry delay is linear, monotonic and capped", "[serial][backoff]") {
  using M = mg::SerialConnectionManager;
  REQUIRE(M::ComputeRetryDelayMs(1U, 5000U, 60000U) == 5000U);
  REQUIRE(M::ComputeRetryDelayMs(3U, 5000U, 60000U) == 15000U);
  REQUIRE(M::ComputeRetryDelayMs(20U, 5000U, 60000U) == 60000U);

  uint32_t prev = 0;
  for (uint32_t a = 1U; a <= 50U; ++a) {
    uint32_t d = M::ComputeRetryDelayMs(a, 5000U, 60000U);
    REQUIRE(d >= prev);
    REQUIRE(d <= 60000U);
    prev = d;
  }
}

TEST_CASE("serial - monitor backoff doubles up to the cap", "[serial][backoff]") {
  using M = mg::SerialConnectionManager;
  REQUIRE(M::ComputeBackoffDelayMs(0U, 1000U, 60000U) == 1000U);
  REQUIRE(M::ComputeBackoffDelayMs(1U, 1000U, 60000U) == 2000U);
  REQUIRE(M::ComputeBackoffDelayMs(5U, 1000U, 60000U) == 32000U);
  REQUIRE(M::ComputeBackoffDelayMs(6U, 1000U, 60000U) == 32000U);
  REQUIRE(M::ComputeBackoffDelayMs(5U, 5000U, 60000U) == 60000U);

  uint32_t prev = 0;
  for (uint32_t r = 0U; r <= 40U; ++r) {
    uint32_t d = M::ComputeBackoffDelayMs(r, 5000U, 60000U);
    REQUIRE(d >= prev);
    REQUIRE(d <= 60000U);
    prev = d;
  }
}

// ============================================================================
// Connect
// ============================================================================

TEST_CASE("serial - connect succeeds and is idempotent", "[serial]") {
  TempDevice dev;
  FakeFactory factory;
  mg::PortLockInspector inspector;
  mg::SerialConnectionManager mgr(FastConfig(dev.path()), factory, inspector);

  REQUIRE(mgr.Connect());
  REQUIRE(mgr.State() == mg::ConnectionState::kConnected);
  REQUIRE(mgr.Connect());
  REQUIRE(factory.opens.load() == 1);
  REQUIRE(mgr.GetHandle() != nullptr);

  auto stats = mgr.GetStatistics();
  REQUIRE(stats.total_connects == 1U);
  REQUIRE(stats.connected_at != 0);
  REQUIRE(stats.last_error == mg::SerialError::kNone);
}

TEST_CASE("serial - always-failing open makes exactly max_retries attempts", "[serial]") {
  TempDevice dev;
  for (uint32_t n = 1U; n <= 4U; ++n) {
    FakeFactory factory;
    factory.fail_always = true;
    mg::PortLockInspector inspector;
    auto cfg = FastConfig(dev.path());
    cfg.max_retries = n;
    mg::SerialConnectionManager mgr(cfg, factory, inspector);

    REQUIRE(!mgr.Connect());
    REQUIRE(factory.opens.load() == static_cast<int>(n));
    REQUIRE(mgr.State() == mg::ConnectionState::kDisconnected);
    REQUIRE(mgr.LastError() == mg::SerialError::kDeviceOpenFailed);
    REQUIRE(mgr.GetStatistics().failed_attempts == n);
  }
}

TEST_CASE("serial - EINTR is retried inside one attempt", "[serial]") {
  TempDevice dev;
  FakeFactory factory;
  factory.fail_first = 2;
  factory.fail_with = mg::DeviceOpenError::kInterrupted;
  mg::PortLockInspector inspector;
  mg::SerialConnectionManager mgr(FastConfig(dev.path()), factory, inspector);

  REQUIRE(mgr.Connect());
  REQUIRE(factory.opens.load() == 3);
  REQUIRE(mgr.GetStatistics().failed_attempts == 0U);
}

TEST_CASE("serial - persistent EINTR counts as a hard failure", "[serial]") {
  TempDevice dev;
  FakeFactory factory;
  factory.fail_always = true;
  factory.fail_with = mg::DeviceOpenError::kInterrupted;
  mg::PortLockInspector inspector;
  auto cfg = FastConfig(dev.path());
  cfg.max_retries = 2U;
  mg::SerialConnectionManager mgr(cfg, factory, inspector);

  REQUIRE(!mgr.Connect());
  // 1 try + 3 EINTR retries, per attempt.
  REQUIRE(factory.opens.load() == 8);
  REQUIRE(mgr.LastError() == mg::SerialError::kInterrupted);
}

TEST_CASE("serial - failed liveness after open is a failed attempt", "[serial]") {
  TempDevice dev;
  FakeFactory factory;
  factory.protocol_ok.store(false);
  mg::PortLockInspector inspector;
  mg::SerialConnectionManager mgr(FastConfig(dev.path()), factory, inspector);

  REQUIRE(!mgr.Connect());
  REQUIRE(factory.opens.load() == 3);
  REQUIRE(mgr.LastError() == mg::SerialError::kLivenessFailed);
}

// ============================================================================
// Port contention
// ============================================================================

TEST_CASE("serial - port held by another process times out", "[serial][lock]") {
  TempDevice dev;
  ExternalLock held(dev.path());
  FixedLookup lookup(4321, "minicom");
  mg::PortLockInspector inspector(&lookup);
  FakeFactory factory;
  mg::SerialConnectionManager mgr(FastConfig(dev.path()), factory, inspector);

  const uint64_t t0 = mg::SteadyNowMs();
  REQUIRE(!mgr.Connect());
  const uint64_t elapsed = mg::SteadyNowMs() - t0;

  REQUIRE(elapsed >= 300U);
  REQUIRE(elapsed < 3000U);
  REQUIRE(factory.opens.load() == 0);
  REQUIRE(mgr.LastError() == mg::SerialError::kPortLocked);
  REQUIRE(mgr.State() == mg::ConnectionState::kDisconnected);
}

TEST_CASE("serial - connect proceeds once the holder releases", "[serial][lock]") {
  TempDevice dev;
  ExternalLock held(dev.path());
  FixedLookup lookup(4321, "minicom");
  mg::PortLockInspector inspector(&lookup);
  FakeFactory factory;
  auto cfg = FastConfig(dev.path());
  cfg.port_lock_wait_ms = 5000U;
  mg::SerialConnectionManager mgr(cfg, factory, inspector);

  std::thread releaser([&held] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    held.Release();
  });
  const uint64_t t0 = mg::SteadyNowMs();
  REQUIRE(mgr.Connect());
  REQUIRE(mg::SteadyNowMs() - t0 < 4000U);
  releaser.join();
}

TEST_CASE("serial - self-lock is force-closed and reconnect succeeds", "[serial][lock]") {
  TempDevice dev;
  FixedLookup lookup(::getpid(), "meshguard");
  mg::PortLockInspector inspector(&lookup);
  FakeFactory factory;
  factory.take_lock = true;
  auto cfg = FastConfig(dev.path());
  cfg.port_lock_wait_ms = 30000U;
  cfg.self_lock_release_ms = 50U;
  mg::SerialConnectionManager mgr(cfg, factory, inspector);

  REQUIRE(mgr.Connect());
  // Our own handle now holds the lock; the protocol layer reports a drop.
  mgr.NotifyConnectionLost();
  REQUIRE(mgr.State() == mg::ConnectionState::kDisconnected);

  const uint64_t t0 = mg::SteadyNowMs();
  REQUIRE(mgr.Connect());
  const uint64_t elapsed = mg::SteadyNowMs() - t0;

  REQUIRE(elapsed >= 50U);
  REQUIRE(elapsed < 5000U);
  REQUIRE(mgr.SelfLockResolved());
  REQUIRE(mgr.GetStatistics().self_lock_resolutions == 1U);
  REQUIRE(factory.opens.load() == 2);
}

TEST_CASE("serial - self-lock that survives the forced close fails", "[serial][lock]") {
  TempDevice dev;
  ExternalLock stray(dev.path());
  FixedLookup lookup(::getpid(), "meshguard");
  mg::PortLockInspector inspector(&lookup);
  FakeFactory factory;
  mg::SerialConnectionManager mgr(FastConfig(dev.path()), factory, inspector);

  REQUIRE(!mgr.Connect());
  REQUIRE(mgr.LastError() == mg::SerialError::kSelfLocked);
  REQUIRE(mgr.State() == mg::ConnectionState::kDisconnected);
  REQUIRE(factory.opens.load() == 0);
}

// ============================================================================
// Liveness
// ============================================================================

TEST_CASE("serial - VerifyAlive checks the device node", "[serial][liveness]") {
  TempDevice dev;
  FakeFactory factory;
  mg::PortLockInspector inspector;
  mg::SerialConnectionManager mgr(FastConfig(dev.path()), factory, inspector);

  REQUIRE(!mgr.VerifyAlive());
  REQUIRE(mgr.Connect());
  REQUIRE(mgr.VerifyAlive());

  ::unlink(dev.path());
  REQUIRE(!mgr.VerifyAlive());
  REQUIRE(!mgr.IsConnected());
  REQUIRE(mgr.State() == mg::ConnectionState::kDisconnected);
}

TEST_CASE("serial - IsConnected caches the liveness verdict", "[serial][liveness]") {
  TempDevice dev;
  FakeFactory factory;
  mg::PortLockInspector inspector;
  auto cfg = FastConfig(dev.path());
  cfg.liveness_cache_ms = 60000U;
  mg::SerialConnectionManager mgr(cfg, factory, inspector);

  REQUIRE(mgr.Connect());
  factory.KillCurrent();
  REQUIRE(mgr.IsConnected());
  REQUIRE(!mgr.VerifyAlive());
}

TEST_CASE("serial - IsConnected does not wait behind a connect in progress", "[serial][liveness]") {
  TempDevice dev;
  ExternalLock held(dev.path());
  FixedLookup lookup(4321, "minicom");
  mg::PortLockInspector inspector(&lookup);
  FakeFactory factory;
  auto cfg = FastConfig(dev.path());
  cfg.port_lock_wait_ms = 3000U;
  mg::SerialConnectionManager mgr(cfg, factory, inspector);

  std::thread connector([&mgr] { (void)mgr.Connect(); });
  REQUIRE(WaitFor([&] { return mgr.State() == mg::ConnectionState::kConnecting; }, 1000U));

  const uint64_t t0 = mg::SteadyNowMs();
  const bool connected = mgr.IsConnected();
  const uint64_t elapsed = mg::SteadyNowMs() - t0;
  REQUIRE(!connected);
  REQUIRE(elapsed < 200U);

  held.Release();
  connector.join();
  REQUIRE(mgr.IsConnected());
}

TEST_CASE("serial - GetHandle reconnects transparently", "[serial][liveness]") {
  TempDevice dev;
  FakeFactory factory;
  mg::PortLockInspector inspector;
  mg::SerialConnectionManager mgr(FastConfig(dev.path()), factory, inspector);

  REQUIRE(mgr.GetHandle() != nullptr);
  factory.KillCurrent();
  mg::DeviceHandle* h = mgr.GetHandle();
  REQUIRE(h != nullptr);
  REQUIRE(h->IsProtocolConnected());
  REQUIRE(factory.opens.load() == 2);
}

// ============================================================================
// Disconnect notifications
// ============================================================================

TEST_CASE("serial - disconnect events are ignored during the grace period", "[serial][events]") {
  TempDevice dev;
  FakeFactory factory;
  mg::PortLockInspector inspector;
  auto cfg = FastConfig(dev.path());
  cfg.grace_period_ms = 60000U;
  mg::SerialConnectionManager mgr(cfg, factory, inspector);

  REQUIRE(!mgr.IsDisconnectArmed());
  REQUIRE(mgr.Connect());
  REQUIRE(!mgr.IsDisconnectArmed());
  mgr.NotifyConnectionLost();
  REQUIRE(mgr.State() == mg::ConnectionState::kConnected);
}

TEST_CASE("serial - disconnect event after grace drops the connection", "[serial][events]") {
  TempDevice dev;
  FakeFactory factory;
  mg::PortLockInspector inspector;
  auto cfg = FastConfig(dev.path());
  cfg.grace_period_ms = 30U;
  mg::SerialConnectionManager mgr(cfg, factory, inspector);

  REQUIRE(mgr.Connect());
  REQUIRE(WaitFor([&] { return mgr.IsDisconnectArmed(); }, 1000U));
  mgr.NotifyConnectionLost();
  REQUIRE(mgr.State() == mg::ConnectionState::kDisconnected);

  mgr.Close();
  REQUIRE(!mgr.IsDisconnectArmed());
}

// ============================================================================
// Monitor / Close
// ============================================================================

TEST_CASE("serial - monitor reconnects after a loss", "[serial][monitor]") {
  TempDevice dev;
  FakeFactory factory;
  mg::PortLockInspector inspector;
  auto cfg = FastConfig(dev.path());
  cfg.auto_reconnect = true;
  mg::SerialConnectionManager mgr(cfg, factory, inspector);

  REQUIRE(mgr.Connect());
  REQUIRE(WaitFor([&] { return mgr.MonitorRunning(); }, 1000U));

  factory.KillCurrent();
  REQUIRE(WaitFor([&] { return mgr.GetStatistics().total_reconnects >= 1U; }, 3000U));
  REQUIRE(mgr.State() == mg::ConnectionState::kConnected);
  REQUIRE(mgr.GetStatistics().monitor_retries == 0U);
  REQUIRE(factory.opens.load() >= 2);

  const uint64_t t0 = mg::SteadyNowMs();
  mgr.Close();
  REQUIRE(mg::SteadyNowMs() - t0 < 2000U);
  REQUIRE(!mgr.MonitorRunning());
  REQUIRE(mgr.State() == mg::ConnectionState::kDisconnected);
}

TEST_CASE("serial - monitor keeps retrying while the device is gone", "[serial][monitor]") {
  TempDevice dev;
  FakeFactory factory;
  mg::PortLockInspector inspector;
  auto cfg = FastConfig(dev.path());
  cfg.auto_reconnect = true;
  cfg.max_retries = 1U;
  mg::SerialConnectionManager mgr(cfg, factory, inspector);

  REQUIRE(mgr.Connect());
  factory.fail_always = true;
  factory.KillCurrent();
  REQUIRE(WaitFor([&] { return mgr.GetStatistics().monitor_retries >= 2U; }, 3000U));
  REQUIRE(mgr.State() == mg::ConnectionState::kDisconnected);

  mgr.Close();
  REQUIRE(!mgr.MonitorRunning());
}

TEST_CASE("serial - failed monitor cycles are spaced by the backoff delay", "[serial][monitor]") {
  TempDevice dev;
  FakeFactory factory;
  mg::PortLockInspector inspector;
  auto cfg = FastConfig(dev.path());
  cfg.auto_reconnect = true;
  cfg.max_retries = 1U;
  cfg.monitor_interval_ms = 200U;
  cfg.retry_delay_ms = 250U;
  cfg.max_retry_delay_ms = 250U;
  mg::SerialConnectionManager mgr(cfg, factory, inspector);

  REQUIRE(mgr.Connect());
  factory.fail_always = true;
  factory.KillCurrent();
  REQUIRE(WaitFor([&] { return mgr.GetStatistics().monitor_retries >= 1U; }, 3000U));

  // Two more cycles: 2 x 250 ms, not 2 x (250 + 200) ms.
  const uint64_t t0 = mg::SteadyNowMs();
  REQUIRE(WaitFor([&] { return mgr.GetStatistics().monitor_retries >= 3U; }, 3000U));
  const uint64_t elapsed = mg::SteadyNowMs() - t0;
  REQUIRE(elapsed >= 400U);
  REQUIRE(elapsed < 800U);

  mgr.Close();
}

TEST_CASE("serial - Close returns in time while the monitor is inside a slow open", "[serial][monitor]") {
  TempDevice dev;
  FakeFactory factory;
  mg::PortLockInspector inspector;
  auto cfg = FastConfig(dev.path());
  cfg.auto_reconnect = true;
  cfg.max_retries = 1U;
  cfg.join_timeout_ms = 200U;
  mg::SerialConnectionManager mgr(cfg, factory, inspector);

  REQUIRE(mgr.Connect());
  REQUIRE(WaitFor([&] { return mgr.MonitorRunning(); }, 1000U));
  const int before = factory.opens.load();
  factory.open_delay_ms = 1500U;
  factory.KillCurrent();
  REQUIRE(WaitFor([&] { return factory.opens.load() > before; }, 3000U));

  const uint64_t t0 = mg::SteadyNowMs();
  mgr.Close();
  const uint64_t elapsed = mg::SteadyNowMs() - t0;
  REQUIRE(elapsed < 1000U);
  REQUIRE(mgr.State() == mg::ConnectionState::kDisconnected);
  REQUIRE(!mgr.IsConnected());
}

TEST_CASE("serial - Close is idempotent and the manager can reconnect afterwards", "[serial][monitor]") {
  TempDevice dev;
  FakeFactory factory;
  mg::PortLockInspector inspector;
  mg::SerialConnectionManager mgr(FastConfig(dev.path()), factory, inspector);

  mgr.Close();
  mgr.Close();
  REQUIRE(mgr.State() == mg::ConnectionState::kDisconnected);

  REQUIRE(mgr.Connect());
  mgr.Close();
  REQUIRE(mgr.GetHandle() != nullptr);
}

// ============================================================================
// PosixSerialDeviceFactory over a PTY
// ============================================================================

TEST_CASE("serial - POSIX factory opens a tty and locks it", "[serial][pty]") {
  int master = -1;
  int slave = -1;
  char name[128];
  REQUIRE(::openpty(&master, &slave, name, nullptr, nullptr) == 0);

  mg::PosixSerialDeviceFactory factory;
  auto first = factory.Open(name);
  REQUIRE(first.has_value());
  REQUIRE(first.value()->IsStreamOpen());
  REQUIRE(first.value()->Fd() >= 0);

  auto second = factory.Open(name);
  REQUIRE(!second.has_value());
  REQUIRE(second.get_error() == mg::DeviceOpenError::kPortLocked);

  mg::PortLockInspector inspector;
  REQUIRE(inspector.IsLocked(name).is_locked);

  first.value()->Close();
  REQUIRE(!first.value()->IsStreamOpen());
  REQUIRE(!inspector.IsLocked(name).is_locked);

  ::close(slave);
  ::close(master);
}

TEST_CASE("serial - POSIX factory reports a missing device", "[serial][pty]") {
  mg::PosixSerialDeviceFactory factory;
  auto r = factory.Open("/dev/ttyMG_does_not_exist");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == mg::DeviceOpenError::kNotFound);
}

TEST_CASE("serial - manager connects to a PTY end to end", "[serial][pty]") {
  int master = -1;
  int slave = -1;
  char name[128];
  REQUIRE(::openpty(&master, &slave, name, nullptr, nullptr) == 0);

  mg::SerialLineConfig line;
  line.baud_rate = 9600U;
  mg::PosixSerialDeviceFactory factory(line);
  mg::PortLockInspector inspector;
  mg::SerialConnectionManager mgr(FastConfig(name), factory, inspector);

  REQUIRE(mgr.Connect());
  mg::DeviceHandle* h = mgr.GetHandle();
  REQUIRE(h != nullptr);
  REQUIRE(::write(h->Fd(), "ping", 4) == 4);

  char buf[8] = {};
  REQUIRE(::read(master, buf, sizeof(buf)) == 4);
  REQUIRE(std::memcmp(buf, "ping", 4) == 0);

  mgr.Close();
  REQUIRE(!inspector.IsLocked(name).is_locked);
  ::close(slave);
  ::close(master);
}
