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

// Diagnostic output on stderr.
//
// Debug messages are off unless the environment variable BCI_DISPLAY_DEBUG
// is set: "on", "all" or "always" logs everything, a number N logs the next
// N debug messages (handy to look at the first few frames only).
#ifndef BCI_DISPLAY_LOGGING_H
#define BCI_DISPLAY_LOGGING_H

namespace bci_display {
namespace internal {

void LogDebug(const char *fmt, ...) __attribute__((format(printf, 1, 2)));
void LogError(const char *fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace internal
}  // namespace bci_display

#endif  // BCI_DISPLAY_LOGGING_H
