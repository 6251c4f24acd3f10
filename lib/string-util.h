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

#ifndef BCI_DISPLAY_STRING_UTIL_H
#define BCI_DISPLAY_STRING_UTIL_H

#include <stddef.h>

namespace bci_display {
namespace internal {

// Case-insensitive compare, same return convention as strcasecmp().
int StrCaseCompare(const char *s1, const char *s2);

inline bool StrCaseEqual(const char *s1, const char *s2) {
  return StrCaseCompare(s1, s2) == 0;
}

// Parse a full decimal integer / float. Returns false on trailing garbage
// or empty input, leaving *result untouched.
bool ParseInt(const char *str, int *result);
bool ParseFloat(const char *str, float *result);

}  // namespace internal
}  // namespace bci_display

#endif  // BCI_DISPLAY_STRING_UTIL_H
