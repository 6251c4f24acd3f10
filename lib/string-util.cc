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

#include "string-util.h"

#include <errno.h>
#include <limits.h>
#include <stdlib.h>

#include <cctype>  // For tolower

namespace bci_display {
namespace internal {

int StrCaseCompare(const char *s1, const char *s2) {
  while (*s1 && *s2) {
    const int c1 = std::tolower(static_cast<unsigned char>(*s1));
    const int c2 = std::tolower(static_cast<unsigned char>(*s2));
    if (c1 != c2) return c1 - c2;
    ++s1;
    ++s2;
  }
  return std::tolower(static_cast<unsigned char>(*s1))
    - std::tolower(static_cast<unsigned char>(*s2));
}

bool ParseInt(const char *str, int *result) {
  if (str == NULL || *str == '\0') return false;
  char *end;
  errno = 0;
  const long value = strtol(str, &end, 10);
  if (*end != '\0' || errno != 0) return false;
  if (value < INT_MIN || value > INT_MAX) return false;
  *result = static_cast<int>(value);
  return true;
}

bool ParseFloat(const char *str, float *result) {
  if (str == NULL || *str == '\0') return false;
  char *end;
  errno = 0;
  const float value = strtof(str, &end);
  if (*end != '\0' || errno != 0) return false;
  *result = value;
  return true;
}

}  // namespace internal
}  // namespace bci_display
