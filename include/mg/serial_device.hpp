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
 * @file serial_device.hpp
 * @brief Device handle / factory ports and a POSIX termios serial device.
 *
 * SerialConnectionManager never builds protocol framing itself: it asks a
 * DeviceFactory for a DeviceHandle and only uses the three liveness probes
 * exposed here. PosixSerialDeviceFactory is the stock implementation for a
 * raw tty: O_NONBLOCK open, exclusive flock(2) so other processes (and
 * PortLockInspector) see the port as taken, then raw-mode termios.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef MG_SERIAL_DEVICE_HPP_
#define MG_SERIAL_DEVICE_HPP_

#include "mg/platform.hpp"
#include "mg/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <memory>

#if defined(MG_PLATFORM_POSIX)
#include <fcntl.h>
#include <sys/file.h>
#include <termios.h>
#include <unistd.h>
#endif

namespace mg {

// ============================================================================
// Device errors
// ============================================================================

enum class DeviceOpenError : uint8_t {
  kInterrupted = 0,  ///< EINTR during open/lock; transient, retried.
  kPortLocked,       ///< Another open file description holds the flock.
  kNotFound,         ///< Device path does not exist.
  kOpenFailed,
  kConfigFailed,
};

inline const char* DeviceOpenErrorName(DeviceOpenError e) noexcept {
  switch (e) {
    case DeviceOpenError::kInterrupted:
      return "interrupted system call";
    case DeviceOpenError::kPortLocked:
      return "port locked";
    case DeviceOpenError::kNotFound:
      return "device not found";
    case DeviceOpenError::kOpenFailed:
      return "open failed";
    case DeviceOpenError::kConfigFailed:
      return "termios config failed";
    default:
      return "unknown";
  }
}

// ============================================================================
// Ports
// ============================================================================

/**
 * @brief Live device connection handed out by a DeviceFactory.
 *
 * IsStreamOpen() reports the byte stream (fd, socket) state,
 * IsProtocolConnected() the protocol layer's own view. Close() must be
 * idempotent and must release any advisory lock the handle holds.
 */
class DeviceHandle {
 public:
  virtual ~DeviceHandle() = default;
  virtual void Close() noexcept = 0;
  virtual bool IsStreamOpen() const noexcept = 0;
  virtual bool IsProtocolConnected() const noexcept = 0;
  virtual int Fd() const noexcept { return -1; }
};

using DeviceResult = expected<std::unique_ptr<DeviceHandle>, DeviceOpenError>;

class DeviceFactory {
 public:
  virtual ~DeviceFactory() = default;
  virtual DeviceResult Open(const char* path) = 0;
};

// ============================================================================
// PosixSerialDevice
// ============================================================================

struct SerialLineConfig {
  uint32_t baud_rate = 115200U;
  uint8_t data_bits = 8U;
  uint8_t stop_bits = 1U;
  uint8_t parity = 0U;  // 0=None, 1=Odd, 2=Even
};

#if defined(MG_PLATFORM_POSIX)

class PosixSerialDevice final : public DeviceHandle {
 public:
  explicit PosixSerialDevice(int fd) noexcept : fd_(fd) {}
  ~PosixSerialDevice() override { Close(); }

  PosixSerialDevice(const PosixSerialDevice&) = delete;
  PosixSerialDevice& operator=(const PosixSerialDevice&) = delete;

  void Close() noexcept override {
    if (fd_ >= 0) {
      (void)::flock(fd_, LOCK_UN);
      ::close(fd_);
      fd_ = -1;
    }
  }

  bool IsStreamOpen() const noexcept override {
    return fd_ >= 0 && ::fcntl(fd_, F_GETFD) != -1;
  }

  /// A raw tty has no protocol handshake; an open stream is connected.
  bool IsProtocolConnected() const noexcept override { return IsStreamOpen(); }

  int Fd() const noexcept override { return fd_; }

 private:
  int fd_;
};

class PosixSerialDeviceFactory final : public DeviceFactory {
 public:
  explicit PosixSerialDeviceFactory(const SerialLineConfig& line = SerialLineConfig{}) noexcept
      : line_(line) {}

  DeviceResult Open(const char* path) override {
    int fd = ::open(path, O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {
      return DeviceResult::error(MapOpenErrno(errno));
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
      const int err = errno;
      ::close(fd);
      return DeviceResult::error(err == EINTR ? DeviceOpenError::kInterrupted
                                              : DeviceOpenError::kPortLocked);
    }

    if (::isatty(fd) == 1 && !ConfigureLine(fd)) {
      (void)::flock(fd, LOCK_UN);
      ::close(fd);
      return DeviceResult::error(DeviceOpenError::kConfigFailed);
    }

    return DeviceResult::success(
        std::unique_ptr<DeviceHandle>(new PosixSerialDevice(fd)));
  }

  static speed_t BaudToSpeed(uint32_t baud) noexcept {
    switch (baud) {
      case 9600U:
        return B9600;
      case 19200U:
        return B19200;
      case 38400U:
        return B38400;
      case 57600U:
        return B57600;
      case 115200U:
        return B115200;
      case 230400U:
        return B230400;
#ifdef B460800
      case 460800U:
        return B460800;
#endif
#ifdef B921600
      case 921600U:
        return B921600;
#endif
      default:
        return B115200;
    }
  }

 private:
  static DeviceOpenError MapOpenErrno(int err) noexcept {
    switch (err) {
      case EINTR:
        return DeviceOpenError::kInterrupted;
      case ENOENT:
      case ENODEV:
      case ENXIO:
        return DeviceOpenError::kNotFound;
      case EBUSY:
        return DeviceOpenError::kPortLocked;
      default:
        return DeviceOpenError::kOpenFailed;
    }
  }

  bool ConfigureLine(int fd) const noexcept {
    struct termios tio;
    std::memset(&tio, 0, sizeof(tio));
    if (::tcgetattr(fd, &tio) != 0) {
      return false;
    }

    // Raw mode, no echo, no line discipline translation.
    tio.c_iflag &= static_cast<tcflag_t>(~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR |
                                           IGNCR | ICRNL | IXON | IXOFF | IXANY));
    tio.c_oflag &= static_cast<tcflag_t>(~OPOST);
    tio.c_lflag &= static_cast<tcflag_t>(~(ECHO | ECHONL | ICANON | ISIG | IEXTEN));
    tio.c_cflag &= static_cast<tcflag_t>(~(CSIZE | PARENB | PARODD | CSTOPB));
    tio.c_cflag |= static_cast<tcflag_t>(CLOCAL | CREAD);

    switch (line_.data_bits) {
      case 7U:
        tio.c_cflag |= CS7;
        break;
      default:
        tio.c_cflag |= CS8;
        break;
    }
    if (line_.parity == 1U) {
      tio.c_cflag |= static_cast<tcflag_t>(PARENB | PARODD);
    } else if (line_.parity == 2U) {
      tio.c_cflag |= PARENB;
    }
    if (line_.stop_bits == 2U) {
      tio.c_cflag |= CSTOPB;
    }

    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;

    const speed_t speed = BaudToSpeed(line_.baud_rate);
    ::cfsetispeed(&tio, speed);
    ::cfsetospeed(&tio, speed);

    if (::tcsetattr(fd, TCSANOW, &tio) != 0) {
      return false;
    }
    ::tcflush(fd, TCIOFLUSH);
    return true;
  }

  SerialLineConfig line_;
};

#endif  // MG_PLATFORM_POSIX

}  // namespace mg

#endif  // MG_SERIAL_DEVICE_HPP_
