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

#include "pixel-mapper.h"

#include <limits.h>
#include <stddef.h>
#include <stdint.h>

#include "string-util.h"

namespace bci_display {

static const struct {
  WiringTopology topology;
  const char *name;
} kTopologyNames[] = {
  { kRowMajor,         "row-major" },
  { kSerpentineRow,    "serpentine-row" },
  { kColumnMajor,      "column-major" },
  { kSerpentineColumn, "serpentine-column" },
};

bool ParseWiringTopology(const char *name, WiringTopology *topology) {
  if (name == NULL) return false;
  for (size_t i = 0; i < sizeof(kTopologyNames) / sizeof(kTopologyNames[0]);
       ++i) {
    if (internal::StrCaseEqual(name, kTopologyNames[i].name)) {
      *topology = kTopologyNames[i].topology;
      return true;
    }
  }
  return false;
}

const char *WiringTopologyName(WiringTopology topology) {
  for (size_t i = 0; i < sizeof(kTopologyNames) / sizeof(kTopologyNames[0]);
       ++i) {
    if (kTopologyNames[i].topology == topology)
      return kTopologyNames[i].name;
  }
  return "unknown";
}

int MapToLedIndex(int x, int y, int width, int height,
                  WiringTopology topology) {
  if (width <= 0 || height <= 0) return -1;
  if (static_cast<int64_t>(width) * height > INT_MAX) return -1;
  if (x < 0 || y < 0 || x >= width || y >= height) return -1;

  switch (topology) {
  case kRowMajor:
    return y * width + x;
  case kSerpentineRow:
    return y * width + ((y % 2 == 0) ? x : width - 1 - x);
  case kColumnMajor:
    return x * height + y;
  case kSerpentineColumn:
    return x * height + ((x % 2 == 0) ? y : height - 1 - y);
  }
  return -1;
}

LedIndexMap::LedIndexMap(int width, int height, WiringTopology topology)
  : width_(width), height_(height), topology_(topology),
    table_(new int[width * height]) {
  for (int y = 0; y < height_; ++y) {
    for (int x = 0; x < width_; ++x) {
      table_[y * width_ + x] = MapToLedIndex(x, y, width_, height_, topology_);
    }
  }
}

LedIndexMap::~LedIndexMap() {
  delete [] table_;
}

LedIndexMap *LedIndexMap::Create(int width, int height,
                                 WiringTopology topology, int led_count,
                                 DisplayError *err) {
  if (width <= 0 || height <= 0) {
    SetError(err, kConfigError, "Matrix size %dx%d: width and height need "
             "to be greater than zero", width, height);
    return NULL;
  }
  const int64_t grid = static_cast<int64_t>(width) * height;
  if (grid > INT_MAX) {
    SetError(err, kConfigError, "Matrix size %dx%d: too many LEDs",
             width, height);
    return NULL;
  }
  if (led_count != grid) {
    SetError(err, kConfigError, "led_count %d does not match %dx%d = %d LEDs",
             led_count, width, height, static_cast<int>(grid));
    return NULL;
  }
  return new LedIndexMap(width, height, topology);
}

}  // namespace bci_display
