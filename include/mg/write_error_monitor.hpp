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
 * @file write_error_monitor.hpp
 * @brief Sliding-window write-failure counter that escalates to a reboot.
 *
 * Failures go into a fixed-capacity ring (oldest evicted). After every
 * RecordFailure() the records inside [now - window, now] are counted; on
 * reaching the threshold the monitor requests a reboot exactly once until
 * Reset().
 */

#ifndef MG_WRITE_ERROR_MONITOR_HPP_
#define MG_WRITE_ERROR_MONITOR_HPP_

#include "mg/log.hpp"
#include "mg/platform.hpp"
#include "mg/reboot_escalation.hpp"
#include "mg/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <ctime>
#include <memory>
#include <mutex>

namespace mg {

struct WriteErrorConfig {
  bool enabled = true;
  uint32_t window_ms = 300U * 1000U;
  uint32_t error_threshold = 10U;
  uint32_t max_stored_failures = 100U;
};

/// One failed write. Immutable once stored.
struct FailureRecord {
  uint64_t timestamp_ns = 0;  ///< Monotonic, for window math.
  time_t wall_time = 0;       ///< For reports.
  FixedString<47> operation;
  FixedString<47> error_kind;
};

struct WriteErrorStats {
  bool enabled = false;
  uint32_t window_ms = 0;
  uint32_t error_threshold = 0;
  uint32_t total_errors = 0;
  uint32_t errors_in_window = 0;
  uint32_t stored = 0;
  bool escalation_triggered = false;
  uint32_t total_reboots = 0;
  optional<uint64_t> since_trigger_ms;
};

class WriteErrorMonitor {
 public:
  using StatusText = FixedString<511>;

  static constexpr uint32_t kMaxErrorKinds = 8U;

  explicit WriteErrorMonitor(const WriteErrorConfig& cfg,
                             RebootEscalationPort* port = nullptr)
      : cfg_(cfg),
        capacity_(cfg.max_stored_failures > 0U ? cfg.max_stored_failures : 1U),
        ring_(new FailureRecord[capacity_]),
        port_(port) {
    if (cfg_.enabled) {
      MG_LOG_DEBUG("WriteErr", "initialized: window=%u ms threshold=%u", cfg_.window_ms,
                   cfg_.error_threshold);
      if (cfg_.error_threshold > capacity_) {
        MG_LOG_WARN("WriteErr", "threshold %u exceeds ring capacity %u, escalation disabled",
                    cfg_.error_threshold, capacity_);
      }
    } else {
      MG_LOG_DEBUG("WriteErr", "disabled");
    }
  }

  WriteErrorMonitor(const WriteErrorMonitor&) = delete;
  WriteErrorMonitor& operator=(const WriteErrorMonitor&) = delete;

  /**
   * @brief Record a failed write and escalate if the window is full.
   * @param operation  What was being written (e.g. "save_packet").
   * @param error_kind Failure class used in the breakdown (e.g. "disk I/O").
   */
  void RecordFailure(const char* operation, const char* error_kind) {
    MG_ASSERT(operation != nullptr && error_kind != nullptr);
    if (!cfg_.enabled) {
      return;
    }
    std::unique_lock<std::mutex> lock(mtx_);
    FailureRecord& rec = ring_[head_];
    rec.timestamp_ns = SteadyNowNs();
    rec.wall_time = ::time(nullptr);
    rec.operation.assign(TruncateToCapacity, operation);
    rec.error_kind.assign(TruncateToCapacity, error_kind);
    head_ = (head_ + 1U) % capacity_;
    if (count_ < capacity_) {
      ++count_;
    }
    ++total_errors_;
    MG_LOG_WARN("WriteErr", "write failure recorded: %s (%s)", rec.operation.c_str(),
                rec.error_kind.c_str());

    if (triggered_) {
      return;
    }
    const uint32_t in_window = CountInWindowLocked(rec.timestamp_ns);
    MG_LOG_DEBUG("WriteErr", "failures in window: %u/%u", in_window, cfg_.error_threshold);
    if (in_window < cfg_.error_threshold) {
      return;
    }

    triggered_ = true;
    trigger_ns_ = rec.timestamp_ns;
    char reason[160];
    std::snprintf(reason, sizeof(reason),
                  "%u write failures within %u s (threshold %u). Storage may be unreliable.",
                  in_window, cfg_.window_ms / 1000U, cfg_.error_threshold);
    MG_LOG_ERROR("WriteErr", "ESCALATION: %s", reason);
    LogBreakdownLocked(rec.timestamp_ns);

    RebootEscalationPort* port = port_;
    lock.unlock();
    if (port == nullptr) {
      MG_LOG_ERROR("WriteErr", "no reboot port configured, escalation logged only");
      return;
    }
    if (port->RequestReboot(reason)) {
      std::lock_guard<std::mutex> relock(mtx_);
      ++total_reboots_;
      MG_LOG_INFO("WriteErr", "reboot request accepted");
    } else {
      MG_LOG_ERROR("WriteErr", "reboot request was rejected");
    }
  }

  /// Clear records, the one-shot trigger, and lifetime counters.
  void Reset() {
    std::lock_guard<std::mutex> lock(mtx_);
    head_ = 0U;
    count_ = 0U;
    triggered_ = false;
    trigger_ns_ = 0U;
    total_errors_ = 0U;
    total_reboots_ = 0U;
    MG_LOG_INFO("WriteErr", "monitor reset");
  }

  uint32_t ErrorsInWindow() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return CountInWindowLocked(SteadyNowNs());
  }

  bool EscalationTriggered() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return triggered_;
  }

  WriteErrorStats GetStatistics() const {
    std::lock_guard<std::mutex> lock(mtx_);
    const uint64_t now = SteadyNowNs();
    WriteErrorStats s;
    s.enabled = cfg_.enabled;
    s.window_ms = cfg_.window_ms;
    s.error_threshold = cfg_.error_threshold;
    s.total_errors = total_errors_;
    s.errors_in_window = CountInWindowLocked(now);
    s.stored = count_;
    s.escalation_triggered = triggered_;
    s.total_reboots = total_reboots_;
    if (triggered_) {
      s.since_trigger_ms = (now - trigger_ns_) / 1000000ULL;
    }
    return s;
  }

  StatusText StatusReport(bool compact = false) const {
    const WriteErrorStats s = GetStatistics();
    char buf[StatusText::capacity() + 1];
    if (!s.enabled) {
      return StatusText(TruncateToCapacity, compact ? "Write monitor: disabled"
                                                    : "Write Error Monitor\n  State: disabled");
    }
    if (compact) {
      std::snprintf(buf, sizeof(buf), "Write monitor %s: %u/%u (%us), total %u err, %u reboot",
                    s.escalation_triggered ? "TRIGGERED" : "OK", s.errors_in_window,
                    s.error_threshold, s.window_ms / 1000U, s.total_errors, s.total_reboots);
      return StatusText(TruncateToCapacity, buf);
    }
    char last[32];
    if (s.since_trigger_ms.has_value()) {
      std::snprintf(last, sizeof(last), "%us ago",
                    static_cast<uint32_t>(s.since_trigger_ms.value() / 1000U));
    } else {
      std::snprintf(last, sizeof(last), "Never");
    }
    std::snprintf(buf, sizeof(buf),
                  "Write Error Monitor\n"
                  "  State: %s\n"
                  "  Window: %us\n"
                  "  Threshold: %u errors\n"
                  "  Errors (window): %u/%u\n"
                  "  Errors (total): %u\n"
                  "  Reboots requested: %u\n"
                  "  Last escalation: %s",
                  s.escalation_triggered ? "escalated" : "active", s.window_ms / 1000U,
                  s.error_threshold, s.errors_in_window, s.error_threshold, s.total_errors,
                  s.total_reboots, last);
    return StatusText(TruncateToCapacity, buf);
  }

  const WriteErrorConfig& GetConfig() const noexcept { return cfg_; }

 private:
  /// Iterate stored records oldest-first.
  template <typename Fn>
  void ForEachLocked(Fn&& fn) const {
    const uint32_t start = (head_ + capacity_ - count_) % capacity_;
    for (uint32_t i = 0; i < count_; ++i) {
      fn(ring_[(start + i) % capacity_]);
    }
  }

  bool InWindow(const FailureRecord& r, uint64_t now_ns) const noexcept {
    const uint64_t window_ns = static_cast<uint64_t>(cfg_.window_ms) * 1000000ULL;
    const uint64_t start = (now_ns > window_ns) ? now_ns - window_ns : 0U;
    return r.timestamp_ns >= start && r.timestamp_ns <= now_ns;
  }

  uint32_t CountInWindowLocked(uint64_t now_ns) const {
    uint32_t n = 0;
    ForEachLocked([&](const FailureRecord& r) {
      if (InWindow(r, now_ns)) ++n;
    });
    return n;
  }

  void LogBreakdownLocked(uint64_t now_ns) const {
    const FixedString<47>* kinds[kMaxErrorKinds] = {};
    uint32_t counts[kMaxErrorKinds] = {};
    uint32_t distinct = 0;
    uint32_t other = 0;
    ForEachLocked([&](const FailureRecord& r) {
      if (!InWindow(r, now_ns)) return;
      for (uint32_t k = 0; k < distinct; ++k) {
        if (*kinds[k] == r.error_kind) {
          ++counts[k];
          return;
        }
      }
      if (distinct < kMaxErrorKinds) {
        kinds[distinct] = &r.error_kind;
        counts[distinct++] = 1U;
      } else {
        ++other;
      }
    });
    MG_LOG_ERROR("WriteErr", "error breakdown:");
    for (uint32_t k = 0; k < distinct; ++k) {
      MG_LOG_ERROR("WriteErr", "  %s: %u", kinds[k]->c_str(), counts[k]);
    }
    if (other > 0U) {
      MG_LOG_ERROR("WriteErr", "  (other): %u", other);
    }
  }

  WriteErrorConfig cfg_;
  uint32_t capacity_;
  std::unique_ptr<FailureRecord[]> ring_;
  RebootEscalationPort* port_;

  mutable std::mutex mtx_;
  uint32_t head_ = 0;
  uint32_t count_ = 0;
  uint32_t total_errors_ = 0;
  uint32_t total_reboots_ = 0;
  bool triggered_ = false;
  uint64_t trigger_ns_ = 0;
};

}  // namespace mg

#endif  // MG_WRITE_ERROR_MONITOR_HPP_
