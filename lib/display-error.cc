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

#include "display-error.h"

#include <stdarg.h>
#include <stdio.h>

namespace bci_display {

const char *ErrorKindName(ErrorKind kind) {
  switch (kind) {
  case kNoError:                return "NoError";
  case kConfigError:            return "ConfigError";
  case kDecodeError:            return "DecodeError";
  case kOutOfRangeError:        return "OutOfRangeError";
  case kHardwareInitError:      return "HardwareInitError";
  case kResourceBusyError:      return "ResourceBusyError";
  case kHardwareTimeoutError:   return "HardwareTimeoutError";
  case kDisplayUnavailableError: return "DisplayUnavailableError";
  }
  return "UnknownError";
}

bool SetError(DisplayError *err, ErrorKind kind, const char *format, ...) {
  if (err == NULL) return false;
  char buffer[512];
  va_list ap;
  va_start(ap, format);
  vsnprintf(buffer, sizeof(buffer), format, ap);
  va_end(ap);
  err->kind = kind;
  err->message = buffer;
  return false;
}

void PrefixError(DisplayError *err, const std::string &context) {
  if (err == NULL || err->kind == kNoError) return;
  err->message = context + ": " + err->message;
}

}  // namespace bci_display
