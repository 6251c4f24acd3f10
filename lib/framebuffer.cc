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

// The framebuffer holds the logical image in plain row-major order. Getting
// it into the order and format the hardware wants is the job of the
// backends; this is only the in-memory canvas.

#include "frame-buffer.h"

#include <assert.h>
#include <limits.h>
#include <string.h>

#include <algorithm>

namespace bci_display {

bool FrameBuffer::IsValidSize(int width, int height) {
  if (width <= 0 || height <= 0) return false;
  return static_cast<int64_t>(width) * height <= INT_MAX;
}

FrameBuffer::FrameBuffer(int width, int height)
  : width_(width), height_(height),
    pixels_(new Color[IsValidSize(width, height) ? width * height : 1]) {
  assert(IsValidSize(width_, height_));
}

FrameBuffer::~FrameBuffer() {
  delete [] pixels_;
}

bool FrameBuffer::SetPixel(int x, int y, const Color &color) {
  if (x < 0 || y < 0 || x >= width_ || y >= height_)
    return false;
  pixels_[y * width_ + x] = color;
  return true;
}

bool FrameBuffer::GetPixel(int x, int y, Color *color) const {
  if (x < 0 || y < 0 || x >= width_ || y >= height_)
    return false;
  *color = pixels_[y * width_ + x];
  return true;
}

void FrameBuffer::SetPixels(int x, int y, int width, int height,
                            const Color *colors) {
  const int safe_y = std::max(0, y);
  const int safe_y_max = std::min(height_, y + height);
  const int safe_x = std::max(0, x);
  const int safe_x_max = std::min(width_, x + width);
  if (safe_x >= safe_x_max) return;

  for (int row = safe_y; row < safe_y_max; ++row) {
    const Color *src = colors + (row - y) * width + (safe_x - x);
    std::copy(src, src + (safe_x_max - safe_x),
              pixels_ + row * width_ + safe_x);
  }
}

void FrameBuffer::Fill(const Color &color) {
  std::fill(pixels_, pixels_ + width_ * height_, color);
}

bool FrameBuffer::CopyFrom(const FrameBuffer &other) {
  if (&other == this) return true;
  if (other.width_ != width_ || other.height_ != height_)
    return false;
  memcpy(pixels_, other.pixels_, sizeof(*pixels_) * width_ * height_);
  return true;
}

}  // namespace bci_display
