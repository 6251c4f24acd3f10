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

#ifndef BCI_DISPLAY_RESOURCE_LOCK_H
#define BCI_DISPLAY_RESOURCE_LOCK_H

#include <string>

#include "display-error.h"

namespace bci_display {
namespace internal {

// Exclusive claim of a hardware resource (GPIO pin, DMA channel), held as
// a flock() on a lock file. flock() conflicts between separate open()s even
// within one process, so the claim is exclusive against other processes
// and other handles alike. Released on Release() or destruction; the kernel
// drops it if the process dies.
class ResourceLock {
public:
  ResourceLock() : fd_(-1) {}
  ~ResourceLock() { Release(); }

  // Path of the lock file for e.g. ("gpio", 18) in "lock_dir".
  static std::string LockPath(const std::string &lock_dir,
                              const char *resource, int number);

  // Returns false with kResourceBusyError if somebody else holds the lock,
  // kHardwareInitError if the lock file can't be created.
  bool Acquire(const std::string &path, DisplayError *err);
  void Release();

private:
  ResourceLock(const ResourceLock &);
  ResourceLock &operator=(const ResourceLock &);

  int fd_;
  std::string path_;
};

}  // namespace internal
}  // namespace bci_display

#endif  // BCI_DISPLAY_RESOURCE_LOCK_H
