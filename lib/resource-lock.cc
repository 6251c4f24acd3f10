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

#include "resource-lock.h"

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <sys/file.h>
#include <unistd.h>

#include "logging.h"

namespace bci_display {
namespace internal {

std::string ResourceLock::LockPath(const std::string &lock_dir,
                                   const char *resource, int number) {
  char name[64];
  snprintf(name, sizeof(name), "bci-display-%s%d.lock", resource, number);
  std::string result = lock_dir.empty() ? std::string(".") : lock_dir;
  if (result[result.size() - 1] != '/') result += '/';
  return result + name;
}

bool ResourceLock::Acquire(const std::string &path, DisplayError *err) {
  if (fd_ >= 0) return true;  // Already ours.

  const int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    return SetError(err, kHardwareInitError, "Can't create lock file %s: %s",
                    path.c_str(), strerror(errno));
  }
  if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
    const int flock_errno = errno;
    close(fd);
    if (flock_errno == EWOULDBLOCK) {
      return SetError(err, kResourceBusyError, "%s is held by another "
                      "display handle or process", path.c_str());
    }
    return SetError(err, kHardwareInitError, "Can't lock %s: %s",
                    path.c_str(), strerror(flock_errno));
  }

  // Leave our pid for whoever wonders who holds the resource.
  char pid[32];
  const int len = snprintf(pid, sizeof(pid), "%d\n", getpid());
  if (ftruncate(fd, 0) != 0 || write(fd, pid, len) != len) {
    LogDebug("Could not write pid to %s: %s", path.c_str(), strerror(errno));
  }

  fd_ = fd;
  path_ = path;
  LogDebug("Claimed %s", path_.c_str());
  return true;
}

void ResourceLock::Release() {
  if (fd_ < 0) return;
  flock(fd_, LOCK_UN);
  close(fd_);
  fd_ = -1;
  LogDebug("Released %s", path_.c_str());
  path_.clear();
}

}  // namespace internal
}  // namespace bci_display
