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
 * @file reboot_escalation.hpp
 * @brief Escalation port and a flock-based reboot signal in shared memory.
 *
 * The monitors only decide *when* a restart is warranted. The restart
 * itself is requested through RebootEscalationPort; the caller chooses the
 * mechanism. RebootSignalFile is the stock one: a lock file on tmpfs that a
 * watcher process polls, so it keeps working when the root filesystem has
 * gone read-only.
 */

#ifndef MG_REBOOT_ESCALATION_HPP_
#define MG_REBOOT_ESCALATION_HPP_

#include "mg/log.hpp"
#include "mg/vocabulary.hpp"

#include <cerrno>
#include <cstdio>
#include <ctime>
#include <mutex>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace mg {

/// Derived from monitor counters on demand; never stored.
struct EscalationDecision {
  bool should_escalate = false;
  FixedString<255> reason;
};

/**
 * @brief Request an emergency restart.
 *
 * Returns true when the request was accepted. Whether the restart happens
 * synchronously or later is up to the implementation.
 */
class RebootEscalationPort {
 public:
  virtual ~RebootEscalationPort() = default;
  virtual bool RequestReboot(const char* reason) = 0;
};

// ============================================================================
// RebootSignalFile
// ============================================================================

class RebootSignalFile final : public RebootEscalationPort {
 public:
  static constexpr const char* kLockName = "meshguard_reboot.lock";
  static constexpr const char* kInfoName = "meshguard_reboot.info";

  using InfoText = FixedString<511>;

  explicit RebootSignalFile(const char* dir = "/dev/shm") noexcept {
    std::snprintf(lock_path_, sizeof(lock_path_), "%s/%s", dir, kLockName);
    std::snprintf(info_path_, sizeof(info_path_), "%s/%s", dir, kInfoName);
  }

  /// Releases our lock but leaves the files for the watcher.
  ~RebootSignalFile() override {
    std::lock_guard<std::mutex> lock(mtx_);
    if (lock_fd_ >= 0) {
      ::close(lock_fd_);
      lock_fd_ = -1;
    }
  }

  RebootSignalFile(const RebootSignalFile&) = delete;
  RebootSignalFile& operator=(const RebootSignalFile&) = delete;

  /**
   * @brief Take the lock and keep it; write reason and timestamp.
   *
   * A lock already held (by us or by another process) counts as accepted.
   */
  bool RequestReboot(const char* reason) override {
    std::lock_guard<std::mutex> lock(mtx_);
    if (lock_fd_ >= 0) {
      MG_LOG_DEBUG("Reboot", "reboot signal already held");
      return true;
    }

    int fd = ::open(lock_path_, O_CREAT | O_WRONLY | O_CLOEXEC, 0644);
    if (fd < 0) {
      MG_LOG_ERROR("Reboot", "cannot open %s: errno=%d", lock_path_, errno);
      return false;
    }
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
      ::close(fd);
      MG_LOG_INFO("Reboot", "reboot signal already active");
      return true;
    }
    lock_fd_ = fd;

    if (!WriteInfo(reason)) {
      MG_LOG_WARN("Reboot", "cannot write %s: errno=%d", info_path_, errno);
    }
    MG_LOG_ERROR("Reboot", "reboot signal raised: %s", reason != nullptr ? reason : "");
    return true;
  }

  /// True while any open file description holds the lock.
  bool IsSignalled() const noexcept {
    int fd = ::open(lock_path_, O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
      return false;
    }
    bool held = false;
    if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
      (void)::flock(fd, LOCK_UN);
    } else {
      held = (errno == EWOULDBLOCK);
    }
    ::close(fd);
    return held;
  }

  /// Drop the lock and remove both files.
  bool Clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (lock_fd_ >= 0) {
      ::close(lock_fd_);
      lock_fd_ = -1;
    }
    bool ok = true;
    if (::unlink(lock_path_) != 0 && errno != ENOENT) {
      MG_LOG_ERROR("Reboot", "cannot remove %s: errno=%d", lock_path_, errno);
      ok = false;
    }
    if (::unlink(info_path_) != 0 && errno != ENOENT) {
      MG_LOG_ERROR("Reboot", "cannot remove %s: errno=%d", info_path_, errno);
      ok = false;
    }
    return ok;
  }

  /// Contents of the info file, empty when there is none.
  InfoText ReadInfo() const {
    InfoText text;
    FILE* f = std::fopen(info_path_, "r");
    if (f == nullptr) {
      return text;
    }
    char buf[InfoText::capacity() + 1];
    size_t n = std::fread(buf, 1, sizeof(buf) - 1, f);
    std::fclose(f);
    buf[n] = '\0';
    text.assign(TruncateToCapacity, buf, static_cast<uint32_t>(n));
    return text;
  }

  const char* LockPath() const noexcept { return lock_path_; }
  const char* InfoPath() const noexcept { return info_path_; }

 private:
  bool WriteInfo(const char* reason) const {
    FILE* f = std::fopen(info_path_, "w");
    if (f == nullptr) {
      return false;
    }
    char ts[32];
    time_t now = ::time(nullptr);
    struct tm tm_buf;
    ::localtime_r(&now, &tm_buf);
    std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);
    int w = std::fprintf(f, "Reason: %s\nPid: %d\nTimestamp: %s\n",
                         reason != nullptr ? reason : "unknown", static_cast<int>(::getpid()),
                         ts);
    return std::fclose(f) == 0 && w > 0;
  }

  char lock_path_[256];
  char info_path_[256];
  mutable std::mutex mtx_;
  int lock_fd_ = -1;
};

}  // namespace mg

#endif  // MG_REBOOT_ESCALATION_HPP_
