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

#include "logging.h"

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>

#include <chrono>

#include "string-util.h"

namespace bci_display {
namespace internal {

static bool sDebugConfigured = false;
static bool sDebugAlways = false;
static int sDebugMessagesPending = 0;

static void ConfigureDebugFromEnv() {
  if (sDebugConfigured) return;
  sDebugConfigured = true;
  const char *env = getenv("BCI_DISPLAY_DEBUG");
  if (env == NULL || *env == '\0') return;
  if (StrCaseEqual(env, "always") || StrCaseEqual(env, "all") ||
      StrCaseEqual(env, "on")) {
    sDebugAlways = true;
  } else {
    const int messages = atoi(env);
    if (messages > 0) sDebugMessagesPending = messages;
  }
}

static bool DebugEnabled() {
  ConfigureDebugFromEnv();
  return sDebugAlways || sDebugMessagesPending > 0;
}

static double SecondsSinceStart() {
  using clock = std::chrono::steady_clock;
  static const clock::time_point t0 = clock::now();
  return std::chrono::duration_cast<std::chrono::duration<double>>(
    clock::now() - t0).count();
}

void LogDebug(const char *fmt, ...) {
  if (!DebugEnabled()) return;
  if (!sDebugAlways) --sDebugMessagesPending;

  fprintf(stderr, "[bci-display t=%9.6f] ", SecondsSinceStart());
  va_list ap;
  va_start(ap, fmt);
  vfprintf(stderr, fmt, ap);
  va_end(ap);
  fputc('\n', stderr);
}

void LogError(const char *fmt, ...) {
  fprintf(stderr, "bci-display: ");
  va_list ap;
  va_start(ap, fmt);
  vfprintf(stderr, fmt, ap);
  va_end(ap);
  fputc('\n', stderr);
}

}  // namespace internal
}  // namespace bci_display
