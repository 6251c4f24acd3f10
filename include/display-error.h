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

// Error reporting for the display library. Operations return false (or NULL
// for factories) and describe the failure in an optional DisplayError.
#ifndef BCI_DISPLAY_DISPLAY_ERROR_H
#define BCI_DISPLAY_DISPLAY_ERROR_H

#include <string>

namespace bci_display {

enum ErrorKind {
  kNoError = 0,
  kConfigError,            // Bad or inconsistent configuration. Fatal.
  kDecodeError,            // Image missing, unsupported or corrupt.
  kOutOfRangeError,        // Coordinate or size outside the valid range.
  kHardwareInitError,      // GPIO/DMA/device can't be set up. Fatal.
  kResourceBusyError,      // GPIO pin or DMA channel claimed elsewhere.
  kHardwareTimeoutError,   // Transmission missed its deadline.
  kDisplayUnavailableError // No windowing surface.
};

struct DisplayError {
  DisplayError() : kind(kNoError) {}

  void Reset() { kind = kNoError; message.clear(); }

  ErrorKind kind;
  std::string message;
};

// Printable name of the error kind, e.g. "ConfigError".
const char *ErrorKindName(ErrorKind kind);

// Fill "err" (if not NULL) with kind and printf-style message. Always
// returns false, so failing paths can "return SetError(...)".
bool SetError(DisplayError *err, ErrorKind kind, const char *format, ...)
  __attribute__((format(printf, 3, 4)));

// Prepend context to an already filled error, e.g. the image path.
void PrefixError(DisplayError *err, const std::string &context);

}  // namespace bci_display

#endif  // BCI_DISPLAY_DISPLAY_ERROR_H
