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
 * @file port_lock.hpp
 * @brief Serial device advisory-lock inspection and lock-holder lookup.
 *
 * IsLocked() only issues non-blocking open(2)/flock(2) calls and never
 * caches: the holder may change between two inspections. Holder lookup
 * spawns `lsof -F pc <path>` with a bounded deadline and degrades to an
 * empty result when the tool is missing, slow, or prints nothing useful.
 *
 * Linux-only holder lookup. Compatible with -fno-exceptions -fno-rtti.
 */

#ifndef MG_PORT_LOCK_HPP_
#define MG_PORT_LOCK_HPP_

#include "mg/log.hpp"
#include "mg/platform.hpp"
#include "mg/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/file.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mg {

// ============================================================================
// Types
// ============================================================================

/// Process holding a device open, as reported by the lookup tool.
struct HolderInfo {
  FixedString<32> command;
  pid_t pid = -1;
};

/// Fresh result of one lock inspection. Never cached.
struct PortLockInfo {
  bool is_locked = false;
  optional<HolderInfo> holder;
};

/// Outcome of the raw open+flock probe.
enum class LockProbe : uint8_t {
  kUnlocked = 0,
  kLocked,
  kMissing,      ///< Path does not exist.
  kInaccessible  ///< open(2) failed for another reason (permissions, ...).
};

// ============================================================================
// HolderLookup - injectable "who has this file open" strategy
// ============================================================================

class HolderLookup {
 public:
  virtual ~HolderLookup() = default;
  virtual optional<HolderInfo> Lookup(const char* path) = 0;
};

/**
 * @brief HolderLookup backed by the external `lsof` utility.
 *
 * Runs `<tool> -F pc <path>` in a child process and parses the first
 * `p<pid>` / `c<command>` pair. The child's stdout is drained through a
 * non-blocking pipe; once @p timeout_ms elapses the child is killed and the
 * lookup reports nothing.
 */
class LsofHolderLookup final : public HolderLookup {
 public:
  static constexpr uint32_t kDefaultTimeoutMs = 5000U;

  explicit LsofHolderLookup(const char* tool = "lsof",
                            uint32_t timeout_ms = kDefaultTimeoutMs) noexcept
      : tool_(tool), timeout_ms_(timeout_ms) {}

  optional<HolderInfo> Lookup(const char* path) override {
#if MG_HAS_HOLDER_LOOKUP
    char out[1024];
    if (!RunTool(path, out, sizeof(out))) {
      return {};
    }
    return ParseOutput(out);
#else
    (void)path;
    return {};
#endif
  }

  /**
   * @brief Parse `lsof -F` field output.
   *
   * Lines start with a one-letter field id: `p` pid, `c` command, `f` fd.
   * Returns the first process that has a pid; the command may be empty.
   */
  static optional<HolderInfo> ParseOutput(const char* text) noexcept {
    HolderInfo info;
    bool have_pid = false;
    const char* line = text;
    while (line != nullptr && *line != '\0') {
      const char* eol = std::strchr(line, '\n');
      uint32_t len = (eol != nullptr) ? static_cast<uint32_t>(eol - line)
                                      : static_cast<uint32_t>(std::strlen(line));
      if (len > 1U && line[0] == 'p') {
        if (have_pid) break;  // second process: keep the first one
        char* end = nullptr;
        long pid = std::strtol(line + 1, &end, 10);  // NOLINT
        if (end != line + 1 && pid > 0) {
          info.pid = static_cast<pid_t>(pid);
          have_pid = true;
        }
      } else if (len > 1U && line[0] == 'c' && have_pid && info.command.empty()) {
        info.command.assign(TruncateToCapacity, line + 1, len - 1U);
      }
      line = (eol != nullptr) ? eol + 1 : nullptr;
    }
    if (!have_pid) return {};
    return optional<HolderInfo>(info);
  }

 private:
#if MG_HAS_HOLDER_LOOKUP
  bool RunTool(const char* path, char* out, uint32_t out_size) {
    int pipe_fd[2];
    if (::pipe(pipe_fd) != 0) {
      return false;
    }

    pid_t child = ::fork();
    if (child < 0) {
      ::close(pipe_fd[0]);
      ::close(pipe_fd[1]);
      return false;
    }

    if (child == 0) {
      ::dup2(pipe_fd[1], STDOUT_FILENO);
      int devnull = ::open("/dev/null", O_WRONLY);
      if (devnull >= 0) {
        ::dup2(devnull, STDERR_FILENO);
      }
      ::close(pipe_fd[0]);
      ::close(pipe_fd[1]);
      const char* argv[] = {tool_, "-F", "pc", path, nullptr};
      ::execvp(tool_, const_cast<char* const*>(argv));
      ::_exit(127);
    }

    ::close(pipe_fd[1]);
    const int rd = pipe_fd[0];
    (void)::fcntl(rd, F_SETFL, ::fcntl(rd, F_GETFL, 0) | O_NONBLOCK);

    const uint64_t deadline = SteadyNowMs() + timeout_ms_;
    uint32_t used = 0;
    bool eof = false;
    while (!eof) {
      const uint64_t now = SteadyNowMs();
      if (now >= deadline) break;
      struct pollfd pfd;
      pfd.fd = rd;
      pfd.events = POLLIN;
      pfd.revents = 0;
      int pr = ::poll(&pfd, 1, static_cast<int>(deadline - now));
      if (pr < 0 && errno == EINTR) continue;
      if (pr <= 0) break;
      char chunk[256];
      ssize_t n = ::read(rd, chunk, sizeof(chunk));
      if (n > 0) {
        uint32_t take = static_cast<uint32_t>(n);
        if (take > out_size - 1U - used) take = out_size - 1U - used;
        std::memcpy(out + used, chunk, take);
        used += take;
      } else if (n == 0) {
        eof = true;
      } else if (errno != EAGAIN && errno != EINTR) {
        break;
      }
    }
    ::close(rd);
    out[used] = '\0';

    int status = 0;
    pid_t w = 0;
    for (;;) {
      w = ::waitpid(child, &status, WNOHANG);
      if (w != 0 || SteadyNowMs() >= deadline) break;
      struct timespec ts = {0, 5 * 1000000L};
      ::nanosleep(&ts, nullptr);
    }
    if (w == 0) {
      MG_LOG_DEBUG("PortLock", "%s timed out after %u ms, killing pid %d",
                   tool_, timeout_ms_, static_cast<int>(child));
      ::kill(child, SIGKILL);
      (void)::waitpid(child, &status, 0);
      return false;
    }
    if (w < 0) {
      return false;
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
      MG_LOG_DEBUG("PortLock", "%s not available, holder lookup disabled", tool_);
      return false;
    }
    return used > 0U;
  }
#endif

  const char* tool_;
  uint32_t timeout_ms_;
};

// ============================================================================
// PortLockInspector
// ============================================================================

/**
 * @brief Answers "is this device path locked, and is it us?".
 *
 * The holder lookup defaults to LsofHolderLookup; pass another
 * implementation to substitute it (tests, platforms without lsof).
 */
class PortLockInspector {
 public:
  explicit PortLockInspector(HolderLookup* lookup = nullptr) noexcept
      : lookup_(lookup) {}

  PortLockInspector(const PortLockInspector&) = delete;
  PortLockInspector& operator=(const PortLockInspector&) = delete;

  /**
   * @brief Raw probe: non-blocking open, then flock(LOCK_EX | LOCK_NB).
   *
   * Any lock acquired here is released before returning. EBUSY on open
   * (tty opened with TIOCEXCL) also counts as locked.
   */
  static LockProbe Probe(const char* path) noexcept {
    int fd = ::open(path, O_RDONLY | O_NONBLOCK | O_NOCTTY);
    if (fd < 0) {
      if (errno == ENOENT || errno == ENOTDIR) return LockProbe::kMissing;
      if (errno == EBUSY) return LockProbe::kLocked;
      return LockProbe::kInaccessible;
    }
    LockProbe result = LockProbe::kUnlocked;
    if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
      (void)::flock(fd, LOCK_UN);
    } else if (errno == EWOULDBLOCK) {
      result = LockProbe::kLocked;
    }
    ::close(fd);
    return result;
  }

  /// Missing or unreadable paths report not-locked.
  PortLockInfo IsLocked(const char* path) const noexcept {
    PortLockInfo info;
    info.is_locked = (Probe(path) == LockProbe::kLocked);
    return info;
  }

  /// IsLocked() plus a holder lookup when the path turns out to be locked.
  PortLockInfo Inspect(const char* path) {
    PortLockInfo info = IsLocked(path);
    if (info.is_locked) {
      info.holder = IdentifyHolder(path);
    }
    return info;
  }

  optional<HolderInfo> IdentifyHolder(const char* path) {
    return Lookup().Lookup(path);
  }

  bool IsSelfLocked(const char* path) {
    optional<HolderInfo> holder = IdentifyHolder(path);
    return holder.has_value() && holder.value().pid == ::getpid();
  }

 private:
  HolderLookup& Lookup() noexcept {
    return (lookup_ != nullptr) ? *lookup_ : default_lookup_;
  }

  HolderLookup* lookup_;
  LsofHolderLookup default_lookup_;
};

}  // namespace mg

#endif  // MG_PORT_LOCK_HPP_
