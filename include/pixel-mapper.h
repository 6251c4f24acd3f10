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

// Mapping of logical (x, y) image coordinates to the position of the LED on
// the physical chain. LED matrices are a single strip folded into a grid,
// and how it is folded is described by the WiringTopology.
#ifndef BCI_DISPLAY_PIXEL_MAPPER_H
#define BCI_DISPLAY_PIXEL_MAPPER_H

#include "display-error.h"

namespace bci_display {

enum WiringTopology {
  kRowMajor = 0,       // Every row runs left to right.
  kSerpentineRow,      // Even rows left to right, odd rows right to left.
  kColumnMajor,        // Every column runs top to bottom.
  kSerpentineColumn    // Even columns top to bottom, odd ones bottom to top.
};

// Parse "row-major", "serpentine-row", "column-major" or
// "serpentine-column" (case insensitive). Returns false on unknown names.
bool ParseWiringTopology(const char *name, WiringTopology *topology);
const char *WiringTopologyName(WiringTopology topology);

// Index of the LED showing logical pixel (x, y) on a width x height grid.
// Returns -1 if (x, y) is outside the grid, or the grid is empty or has
// more than INT_MAX pixels; callers are expected to only pass valid
// coordinates.
int MapToLedIndex(int x, int y, int width, int height,
                  WiringTopology topology);

// Precomputed MapToLedIndex() for all pixels of one grid, so the render
// loop is a simple table lookup.
class LedIndexMap {
public:
  // Returns NULL with a kConfigError if "led_count" doesn't match
  // width * height, or the grid is empty.
  static LedIndexMap *Create(int width, int height, WiringTopology topology,
                             int led_count, DisplayError *err);
  ~LedIndexMap();

  int width() const { return width_; }
  int height() const { return height_; }
  WiringTopology topology() const { return topology_; }

  // LED index of pixel (x, y) or -1 if outside.
  int get(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_)
      return -1;
    return table_[y * width_ + x];
  }

private:
  LedIndexMap(int width, int height, WiringTopology topology);
  LedIndexMap(const LedIndexMap &);
  LedIndexMap &operator=(const LedIndexMap &);

  const int width_;
  const int height_;
  const WiringTopology topology_;
  int *const table_;
};

}  // namespace bci_display

#endif  // BCI_DISPLAY_PIXEL_MAPPER_H
