// -*- mode: c++; c-basic-offset: 2; indent-tabs-mode: nil; -*-
// Copyright (C) 2013 Henner Zeller <h.zeller@acm.org>
//
// This program is free software; you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation version 2.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://gnu.org/licenses/gpl-2.0.txt>

// Transport that writes the slot stream to a character device. With spidev
// the MOSI line clocks out one slot per SPI clock, so the bus is set to the
// slot rate; the kernel driver does the DMA.

#include "display-backend.h"

#include <errno.h>
#include <fcntl.h>
#include <linux/spi/spidev.h>
#include <poll.h>
#include <stdio.h>
#include <string.h>
#include <sys/ioctl.h>
#include <time.h>
#include <unistd.h>

#include "logging.h"

namespace bci_display {
using internal::LogDebug;

// spidev refuses transfers larger than its bufsiz module parameter.
static const char kSpidevBufsizParam[] = "/sys/module/spidev/parameters/bufsiz";

// Monotonic, so a wall clock step can't expire a deadline.
static int64_t GetMicrosecondTime() {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<int64_t>(ts.tv_sec) * 1000000 + ts.tv_nsec / 1000;
}

static bool IsSpidev(const std::string &device) {
  return device.find("spidev") != std::string::npos;
}

namespace {
class DeviceSignalTransport : public SignalTransport {
public:
  DeviceSignalTransport() : fd_(-1) {}
  virtual ~DeviceSignalTransport() { Close(); }

  virtual bool Open(const MatrixSpec &spec, int slot_rate_hz,
                    size_t frame_bytes, DisplayError *err) {
    if (fd_ >= 0) return true;
    device_ = spec.device;
    const int fd = open(device_.c_str(),
                        O_WRONLY | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
      return SetError(err, kHardwareInitError, "Can't open %s: %s",
                      device_.c_str(), strerror(errno));
    }
    if (IsSpidev(device_) && !ConfigureSpi(fd, slot_rate_hz, frame_bytes,
                                           err)) {
      close(fd);
      return false;
    }
    fd_ = fd;
    LogDebug("Opened %s at %dHz slot rate, %zu bytes per frame",
             device_.c_str(), slot_rate_hz, frame_bytes);
    return true;
  }

  virtual bool Transmit(const SignalFrame &frame, int64_t deadline_usec,
                        DisplayError *err) {
    if (fd_ < 0)
      return SetError(err, kHardwareInitError, "%s is not open",
                      device_.c_str());
    const int64_t start = GetMicrosecondTime();
    const int64_t deadline = start + deadline_usec;
    const uint8_t *data = frame.data.data();
    size_t remaining = frame.data.size();
    while (remaining > 0) {
      const int64_t now = GetMicrosecondTime();
      if (now >= deadline) {
        return SetError(err, kHardwareTimeoutError,
                        "Frame to %s not out after %lldus (%zu of %zu bytes "
                        "pending)", device_.c_str(),
                        (long long)(now - start), remaining,
                        frame.data.size());
      }
      struct pollfd pfd;
      pfd.fd = fd_;
      pfd.events = POLLOUT;
      pfd.revents = 0;
      const int timeout_ms = static_cast<int>((deadline - now + 999) / 1000);
      const int ready = poll(&pfd, 1, timeout_ms);
      if (ready < 0) {
        if (errno == EINTR) continue;
        return SetError(err, kHardwareInitError, "poll(%s): %s",
                        device_.c_str(), strerror(errno));
      }
      if (ready == 0) continue;  // Deadline check above.
      if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
        return SetError(err, kHardwareInitError, "%s reports an error "
                        "condition", device_.c_str());
      }
      const ssize_t written = write(fd_, data, remaining);
      if (written < 0) {
        if (errno == EAGAIN || errno == EINTR) continue;
        return SetError(err, kHardwareInitError, "write(%s): %s",
                        device_.c_str(), strerror(errno));
      }
      data += written;
      remaining -= written;
    }
    return true;
  }

  virtual void Close() {
    if (fd_ < 0) return;
    close(fd_);
    fd_ = -1;
    LogDebug("Closed %s", device_.c_str());
  }

private:
  bool ConfigureSpi(int fd, int slot_rate_hz, size_t frame_bytes,
                    DisplayError *err) {
    const long bufsiz = ReadSpidevBufsiz();
    if (bufsiz > 0 && (size_t)bufsiz < frame_bytes) {
      return SetError(err, kHardwareInitError,
                      "Frame of %zu bytes exceeds spidev buffer of %ld "
                      "bytes; raise spidev.bufsiz on the kernel command line",
                      frame_bytes, bufsiz);
    }
    uint8_t mode = SPI_MODE_0;
    uint8_t bits = 8;
    uint32_t speed = slot_rate_hz;
    if (ioctl(fd, SPI_IOC_WR_MODE, &mode) < 0
        || ioctl(fd, SPI_IOC_WR_BITS_PER_WORD, &bits) < 0
        || ioctl(fd, SPI_IOC_WR_MAX_SPEED_HZ, &speed) < 0) {
      return SetError(err, kHardwareInitError, "Can't configure %s for "
                      "%dHz: %s", device_.c_str(), slot_rate_hz,
                      strerror(errno));
    }
    return true;
  }

  // Returns -1 if unknown.
  static long ReadSpidevBufsiz() {
    FILE *f = fopen(kSpidevBufsizParam, "r");
    if (f == NULL) return -1;
    long result = -1;
    if (fscanf(f, "%ld", &result) != 1) result = -1;
    fclose(f);
    return result;
  }

  int fd_;
  std::string device_;
};
}  // namespace

SignalTransport *CreateDeviceTransport() {
  return new DeviceSignalTransport();
}

}  // namespace bci_display
