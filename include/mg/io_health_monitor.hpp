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
 * @file io_health_monitor.hpp
 * @brief Periodic filesystem + storage verification with escalation.
 *
 * Each RunCheck() performs, in order:
 *   1. a scratch-file round trip (write, fsync, read back, unlink),
 *   2. StorageProbe::CheckIntegrity(),
 *   3. StorageProbe::CheckWritable().
 *
 * Only consecutive failures count toward escalation; one clean run resets
 * the streak. A cooldown keeps the checks cheap when called after every
 * write.
 *
 * Usage:
 * @code
 *   mg::SqliteStorageProbe probe("/var/lib/meshguard/traffic.db");
 *   mg::RebootSignalFile reboot;
 *   mg::IoHealthMonitor mon(mg::IoHealthConfig{}, &probe, &reboot);
 *   if (mon.ShouldRunCheck()) {
 *     mon.RunCheck();
 *     mon.TriggerEscalationIfNeeded();
 *   }
 * @endcode
 */

#ifndef MG_IO_HEALTH_MONITOR_HPP_
#define MG_IO_HEALTH_MONITOR_HPP_

#include "mg/log.hpp"
#include "mg/reboot_escalation.hpp"
#include "mg/storage_probe.hpp"
#include "mg/vocabulary.hpp"

#include <cerrno>
#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <mutex>

#include <fcntl.h>
#include <unistd.h>

namespace mg {

// ============================================================================
// Config / results
// ============================================================================

struct IoHealthConfig {
  bool enabled = true;
  uint32_t failure_threshold = 3U;
  uint32_t cooldown_ms = 900U * 1000U;  ///< 0 runs every check (test mode).
  char scratch_path[128] = "/dev/shm/meshguard_io_test";
  char db_path[256] = "";  ///< Used by callers to build a SqliteStorageProbe.
};

struct HealthCheckOutcome {
  static constexpr uint32_t kMaxChecks = 3U;

  bool all_passed = true;
  bool skipped = false;  ///< Disabled or cooling down; nothing was run.
  FixedString<191> failed_checks[kMaxChecks];
  uint32_t failed_count = 0;
  uint32_t consecutive_failures = 0;
};

struct IoHealthStats {
  bool enabled = false;
  uint32_t total_checks = 0;
  uint32_t total_failures = 0;
  uint32_t consecutive_failures = 0;
  uint32_t failure_threshold = 0;
  uint32_t cooldown_ms = 0;
  uint32_t escalations = 0;
  optional<uint64_t> since_last_check_ms;
  optional<uint64_t> since_last_failure_ms;
};

// ============================================================================
// IoHealthMonitor
// ============================================================================

class IoHealthMonitor {
 public:
  using FsProbeFn = ProbeResult (*)(void* ctx);
  using StatusText = FixedString<511>;

  /// @param probe, port  Optional; borrowed, must outlive the monitor.
  explicit IoHealthMonitor(const IoHealthConfig& cfg, StorageProbe* probe = nullptr,
                           RebootEscalationPort* port = nullptr) noexcept
      : cfg_(cfg), probe_(probe), port_(port) {
    MG_LOG_DEBUG("IoHealth", "initialized: enabled=%d threshold=%u cooldown=%u ms",
                 cfg_.enabled ? 1 : 0, cfg_.failure_threshold, cfg_.cooldown_ms);
  }

  IoHealthMonitor(const IoHealthMonitor&) = delete;
  IoHealthMonitor& operator=(const IoHealthMonitor&) = delete;

  /// Replace the scratch-file round trip. Pass nullptr to restore it.
  void SetFilesystemProbeOverride(FsProbeFn fn, void* ctx) {
    std::lock_guard<std::mutex> lock(mtx_);
    fs_override_ = fn;
    fs_override_ctx_ = ctx;
  }

  bool ShouldRunCheck() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return ShouldRunLocked(SteadyNowMs());
  }

  HealthCheckOutcome RunCheck() {
    std::lock_guard<std::mutex> lock(mtx_);
    HealthCheckOutcome out;
    const uint64_t now = SteadyNowMs();
    if (!ShouldRunLocked(now)) {
      out.skipped = true;
      out.consecutive_failures = consecutive_failures_;
      return out;
    }

    last_check_ms_ = now;
    checked_once_ = true;
    ++total_checks_;
    MG_LOG_DEBUG("IoHealth", "running I/O health check #%u", total_checks_);

    Record(&out, "Filesystem write",
           (fs_override_ != nullptr) ? fs_override_(fs_override_ctx_) : ProbeFilesystem());
    if (probe_ != nullptr) {
      Record(&out, "Database integrity", probe_->CheckIntegrity());
      Record(&out, "Database writable", probe_->CheckWritable());
    }

    if (out.all_passed) {
      if (consecutive_failures_ > 0U) {
        MG_LOG_INFO("IoHealth", "I/O health restored after %u failure(s)",
                    consecutive_failures_);
      }
      consecutive_failures_ = 0U;
    } else {
      ++consecutive_failures_;
      ++total_failures_;
      last_failure_ms_ = SteadyNowMs();
      failed_once_ = true;
      MG_LOG_ERROR("IoHealth", "health check failed (%u/%u), %u check(s) failing",
                   consecutive_failures_, cfg_.failure_threshold, out.failed_count);
    }
    out.consecutive_failures = consecutive_failures_;
    return out;
  }

  EscalationDecision ShouldEscalate() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return DecideLocked();
  }

  /**
   * @brief Ask the escalation port for a reboot if the threshold is reached.
   * @return true when a request was made and accepted.
   */
  bool TriggerEscalationIfNeeded() {
    EscalationDecision d;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      d = DecideLocked();
    }
    if (!d.should_escalate) {
      return false;
    }
    MG_LOG_ERROR("IoHealth", "ESCALATION: %s", d.reason.c_str());
    if (port_ == nullptr) {
      MG_LOG_ERROR("IoHealth", "no reboot port configured, escalation logged only");
      return false;
    }
    const bool accepted = port_->RequestReboot(d.reason.c_str());
    if (accepted) {
      std::lock_guard<std::mutex> lock(mtx_);
      ++escalations_;
    } else {
      MG_LOG_ERROR("IoHealth", "reboot request was rejected");
    }
    return accepted;
  }

  IoHealthStats GetStatistics() const {
    std::lock_guard<std::mutex> lock(mtx_);
    IoHealthStats s;
    const uint64_t now = SteadyNowMs();
    s.enabled = cfg_.enabled;
    s.total_checks = total_checks_;
    s.total_failures = total_failures_;
    s.consecutive_failures = consecutive_failures_;
    s.failure_threshold = cfg_.failure_threshold;
    s.cooldown_ms = cfg_.cooldown_ms;
    s.escalations = escalations_;
    if (checked_once_) {
      s.since_last_check_ms = now - last_check_ms_;
    }
    if (failed_once_) {
      s.since_last_failure_ms = now - last_failure_ms_;
    }
    return s;
  }

  StatusText StatusReport(bool compact = false) const {
    const IoHealthStats s = GetStatistics();
    char buf[StatusText::capacity() + 1];
    if (compact) {
      char state[32];
      if (s.consecutive_failures == 0U) {
        std::snprintf(state, sizeof(state), "OK");
      } else {
        std::snprintf(state, sizeof(state), "%u failures", s.consecutive_failures);
      }
      std::snprintf(buf, sizeof(buf), "I/O Health: %s (%u checks, %u total failures)", state,
                    s.total_checks, s.total_failures);
      return StatusText(TruncateToCapacity, buf);
    }

    char last_check[32];
    char last_failure[32];
    FormatAge(s.since_last_check_ms, last_check, sizeof(last_check));
    FormatAge(s.since_last_failure_ms, last_failure, sizeof(last_failure));
    std::snprintf(buf, sizeof(buf),
                  "I/O Health Monitor Status\n"
                  "  Enabled: %s\n"
                  "  Total checks: %u\n"
                  "  Total failures: %u\n"
                  "  Consecutive failures: %u/%u\n"
                  "  Cooldown: %us\n"
                  "  Last check: %s\n"
                  "  Last failure: %s",
                  s.enabled ? "yes" : "no", s.total_checks, s.total_failures,
                  s.consecutive_failures, s.failure_threshold, s.cooldown_ms / 1000U,
                  last_check, last_failure);
    return StatusText(TruncateToCapacity, buf);
  }

  const IoHealthConfig& GetConfig() const noexcept { return cfg_; }

 private:
  bool ShouldRunLocked(uint64_t now) const {
    if (!cfg_.enabled) {
      return false;
    }
    return !checked_once_ || (now - last_check_ms_) >= cfg_.cooldown_ms;
  }

  EscalationDecision DecideLocked() const {
    EscalationDecision d;
    if (!cfg_.enabled || consecutive_failures_ < cfg_.failure_threshold) {
      return d;
    }
    char buf[128];
    std::snprintf(buf, sizeof(buf),
                  "I/O health check failed %u consecutive times. Storage may be unreliable.",
                  consecutive_failures_);
    d.should_escalate = true;
    d.reason.assign(TruncateToCapacity, buf);
    return d;
  }

  static void Record(HealthCheckOutcome* out, const char* name, const ProbeResult& r) {
    if (r.has_value()) {
      MG_LOG_DEBUG("IoHealth", "%s: ok", name);
      return;
    }
    out->all_passed = false;
    const ProbeFailure f = r.get_error();
    MG_LOG_ERROR("IoHealth", "%s failed: %s", name, f.reason.c_str());
    if (out->failed_count < HealthCheckOutcome::kMaxChecks) {
      FixedString<191>& slot = out->failed_checks[out->failed_count++];
      slot.assign(TruncateToCapacity, name);
      slot.append(TruncateToCapacity, ": ");
      slot.append(TruncateToCapacity, f.reason.c_str());
    }
  }

  static void FormatAge(const optional<uint64_t>& age_ms, char* buf, size_t size) {
    if (!age_ms.has_value()) {
      std::snprintf(buf, size, "Never");
    } else {
      std::snprintf(buf, size, "%" PRIu64 "s ago", age_ms.value() / 1000U);
    }
  }

  /// Write, fsync, read back, compare, unlink.
  ProbeResult ProbeFilesystem() const {
    char data[64];
    int len = std::snprintf(data, sizeof(data), "health_check_%" PRIu64 "\n", SteadyNowNs());

    int fd = ::open(cfg_.scratch_path, O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, 0644);
    if (fd < 0) {
      return FsError("open for write");
    }
    FILE* wf = ::fdopen(fd, "w");
    if (wf == nullptr) {
      ::close(fd);
      return FsError("fdopen");
    }
    bool ok = std::fwrite(data, 1, static_cast<size_t>(len), wf) == static_cast<size_t>(len) &&
              std::fflush(wf) == 0 && ::fsync(fd) == 0;
    const int write_errno = errno;
    if (std::fclose(wf) != 0) {
      ok = false;
    }
    if (!ok) {
      errno = write_errno;
      return FsError("write");
    }

    char back[64];
    FILE* rf = std::fopen(cfg_.scratch_path, "r");
    if (rf == nullptr) {
      return FsError("open for read");
    }
    size_t n = std::fread(back, 1, sizeof(back) - 1, rf);
    std::fclose(rf);
    back[n] = '\0';
    if (n != static_cast<size_t>(len) || std::memcmp(back, data, n) != 0) {
      return ProbeFail(ProbeError::kMismatch, "Data mismatch after write/read");
    }

    if (::unlink(cfg_.scratch_path) != 0) {
      return FsError("unlink");
    }
    return ProbeResult::success();
  }

  static ProbeResult FsError(const char* step) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "Filesystem %s error: %s", step, std::strerror(errno));
    return ProbeFail(ProbeError::kIoFailed, buf);
  }

  IoHealthConfig cfg_;
  StorageProbe* probe_;
  RebootEscalationPort* port_;

  FsProbeFn fs_override_ = nullptr;
  void* fs_override_ctx_ = nullptr;

  mutable std::mutex mtx_;
  uint32_t consecutive_failures_ = 0;
  uint32_t total_checks_ = 0;
  uint32_t total_failures_ = 0;
  uint32_t escalations_ = 0;
  uint64_t last_check_ms_ = 0;
  uint64_t last_failure_ms_ = 0;
  bool checked_once_ = false;
  bool failed_once_ = false;
};

}  // namespace mg

#endif  // MG_IO_HEALTH_MONITOR_HPP_
