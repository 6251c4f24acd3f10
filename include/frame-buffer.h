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

// A logical image: a fixed size grid of colors in row-major order. This is
// what control sources write into and what display backends consume; it
// knows nothing about how LEDs are wired.
#ifndef BCI_DISPLAY_FRAME_BUFFER_H
#define BCI_DISPLAY_FRAME_BUFFER_H

#include <stdint.h>
#include <stddef.h>

#include "display-error.h"

namespace bci_display {

struct Color {
  Color() : r(0), g(0), b(0), w(0) {}
  Color(uint8_t rr, uint8_t gg, uint8_t bb, uint8_t ww = 0)
    : r(rr), g(gg), b(bb), w(ww) {}

  bool operator==(const Color &other) const {
    return r == other.r && g == other.g && b == other.b && w == other.w;
  }
  bool operator!=(const Color &other) const { return !(*this == other); }

  uint8_t r;
  uint8_t g;
  uint8_t b;
  uint8_t w;  // Only used by RGBW strips.
};

class FrameBuffer {
public:
  // Width and height need to be a valid size, see IsValidSize().
  FrameBuffer(int width, int height);

  // True if both are positive and width * height fits in an int.
  static bool IsValidSize(int width, int height);
  ~FrameBuffer();

  // Decode an image file (PNG, JPEG, BMP, PPM, ...) into a new FrameBuffer
  // of the image's size. Returns NULL and a kDecodeError if the file is
  // missing, not an image or corrupt. Fully transparent pixels become black.
  static FrameBuffer *FromImage(const char *path, DisplayError *err);

  int width() const { return width_; }
  int height() const { return height_; }

  // Both return false if (x, y) is outside the grid.
  bool SetPixel(int x, int y, const Color &color);
  bool GetPixel(int x, int y, Color *color) const;

  // Copy a width x height block of colors (row-major) to position (x, y).
  // Parts falling outside the grid are clipped.
  void SetPixels(int x, int y, int width, int height, const Color *colors);

  void Fill(const Color &color);
  void Clear() { Fill(Color()); }

  // Copy the content of another frame of the same size. Returns false
  // if sizes differ.
  bool CopyFrom(const FrameBuffer &other);

  // Row-major pixel data, width() * height() entries.
  const Color *data() const { return pixels_; }

private:
  FrameBuffer(const FrameBuffer &);             // Not copyable.
  FrameBuffer &operator=(const FrameBuffer &);

  const int width_;
  const int height_;
  Color *const pixels_;
};

}  // namespace bci_display

#endif  // BCI_DISPLAY_FRAME_BUFFER_H
