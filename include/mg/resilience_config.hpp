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
 * @file resilience_config.hpp
 * @brief Typed view of the [serial], [io_health], [write_errors], [tcp]
 *        configuration sections.
 *
 * Option values are given in seconds in the file and stored in
 * milliseconds in the structs. Missing keys keep their defaults; keys that
 * are present must parse and be in range.
 */

#ifndef MG_RESILIENCE_CONFIG_HPP_
#define MG_RESILIENCE_CONFIG_HPP_

#include "mg/config.hpp"
#include "mg/io_health_monitor.hpp"
#include "mg/log.hpp"
#include "mg/serial_connection.hpp"
#include "mg/vocabulary.hpp"
#include "mg/write_error_monitor.hpp"

#include <cstdint>
#include <cstring>

namespace mg {

struct TcpConfig {
  char host[64] = "";  ///< Empty: no TCP node configured.
  uint16_t port = 4403U;
  uint32_t setup_timeout_ms = 10000U;
  uint32_t read_timeout_ms = 2000U;
  uint32_t leak_threshold = 3U;
};

struct ResilienceConfig {
  SerialManagerConfig serial;
  SerialLineConfig line;
  IoHealthConfig io_health;
  WriteErrorConfig write_errors;
  TcpConfig tcp;
};

namespace detail {

class OptionReader {
 public:
  explicit OptionReader(const ConfigStore& store) noexcept : store_(store) {}

  bool ok() const noexcept { return ok_; }

  /// Non-negative seconds, stored as milliseconds.
  void Seconds(const char* section, const char* key, uint32_t* out_ms) {
    uint32_t sec = 0;
    if (Read(section, key, 0U, kMaxSeconds, &sec)) {
      *out_ms = sec * 1000U;
    }
  }

  void Count(const char* section, const char* key, uint32_t min, uint32_t* out) {
    (void)Read(section, key, min, UINT32_MAX, out);
  }

  void Port(const char* section, const char* key, uint16_t* out) {
    uint32_t v = 0;
    if (Read(section, key, 1U, 65535U, &v)) {
      *out = static_cast<uint16_t>(v);
    }
  }

  void Flag(const char* section, const char* key, bool* out) {
    if (!store_.HasKey(section, key)) return;
    optional<bool> v = store_.FindBool(section, key);
    if (!v.has_value()) {
      Reject(section, key);
      return;
    }
    *out = v.value();
  }

  void Text(const char* section, const char* key, char* out, size_t size) {
    if (!store_.HasKey(section, key)) return;
    const char* v = store_.GetString(section, key);
    if (std::strlen(v) >= size) {
      Reject(section, key);
      return;
    }
    std::memcpy(out, v, std::strlen(v) + 1U);
  }

 private:
  static constexpr uint32_t kMaxSeconds = UINT32_MAX / 1000U;

  bool Read(const char* section, const char* key, uint32_t min, uint32_t max, uint32_t* out) {
    if (!store_.HasKey(section, key)) return false;
    optional<int32_t> v = store_.FindInt(section, key);
    if (!v.has_value() || v.value() < 0 || static_cast<uint32_t>(v.value()) < min ||
        static_cast<uint32_t>(v.value()) > max) {
      Reject(section, key);
      return false;
    }
    *out = static_cast<uint32_t>(v.value());
    return true;
  }

  void Reject(const char* section, const char* key) {
    MG_LOG_ERROR("Config", "[%s] %s = '%s' is out of range", section, key,
                 store_.GetString(section, key));
    ok_ = false;
  }

  const ConfigStore& store_;
  bool ok_ = true;
};

}  // namespace detail

/**
 * @brief Build typed options from a loaded store.
 *
 * Every invalid key is logged before the error is returned, so one run
 * reports all mistakes at once.
 */
inline expected<ResilienceConfig, ConfigError> LoadResilienceConfig(const ConfigStore& store) {
  ResilienceConfig rc;
  detail::OptionReader r(store);

  // [serial]
  r.Text("serial", "port", rc.serial.port, sizeof(rc.serial.port));
  r.Count("serial", "baud_rate", 1U, &rc.line.baud_rate);
  r.Count("serial", "max_retries", 1U, &rc.serial.max_retries);
  r.Seconds("serial", "retry_delay_seconds", &rc.serial.retry_delay_ms);
  r.Seconds("serial", "max_retry_delay_seconds", &rc.serial.max_retry_delay_ms);
  r.Flag("serial", "auto_reconnect", &rc.serial.auto_reconnect);
  r.Seconds("serial", "port_lock_wait_seconds", &rc.serial.port_lock_wait_ms);
  r.Seconds("serial", "grace_period_seconds", &rc.serial.grace_period_ms);

  // [io_health]
  r.Flag("io_health", "enabled", &rc.io_health.enabled);
  r.Count("io_health", "failure_threshold", 1U, &rc.io_health.failure_threshold);
  r.Seconds("io_health", "cooldown_seconds", &rc.io_health.cooldown_ms);
  r.Text("io_health", "scratch_path", rc.io_health.scratch_path,
         sizeof(rc.io_health.scratch_path));
  r.Text("io_health", "db_path", rc.io_health.db_path, sizeof(rc.io_health.db_path));

  // [write_errors]
  r.Flag("write_errors", "enabled", &rc.write_errors.enabled);
  r.Seconds("write_errors", "window_seconds", &rc.write_errors.window_ms);
  r.Count("write_errors", "error_threshold", 1U, &rc.write_errors.error_threshold);
  r.Count("write_errors", "max_stored_failures", 1U, &rc.write_errors.max_stored_failures);

  // [tcp]
  r.Text("tcp", "host", rc.tcp.host, sizeof(rc.tcp.host));
  r.Port("tcp", "port", &rc.tcp.port);
  r.Seconds("tcp", "setup_timeout_seconds", &rc.tcp.setup_timeout_ms);
  r.Seconds("tcp", "read_timeout_seconds", &rc.tcp.read_timeout_ms);
  r.Count("tcp", "leak_threshold", 1U, &rc.tcp.leak_threshold);

  if (!r.ok()) {
    return expected<ResilienceConfig, ConfigError>::error(ConfigError::kInvalidValue);
  }
  if (rc.serial.retry_delay_ms > rc.serial.max_retry_delay_ms) {
    MG_LOG_ERROR("Config", "[serial] retry_delay_seconds exceeds max_retry_delay_seconds");
    return expected<ResilienceConfig, ConfigError>::error(ConfigError::kInvalidValue);
  }
  // The ring only ever holds max_stored_failures records.
  if (rc.write_errors.error_threshold > rc.write_errors.max_stored_failures) {
    MG_LOG_ERROR("Config", "[write_errors] error_threshold %u exceeds max_stored_failures %u",
                 rc.write_errors.error_threshold, rc.write_errors.max_stored_failures);
    return expected<ResilienceConfig, ConfigError>::error(ConfigError::kInvalidValue);
  }
  return expected<ResilienceConfig, ConfigError>::success(rc);
}

}  // namespace mg

#endif  // MG_RESILIENCE_CONFIG_HPP_
