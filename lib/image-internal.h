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

#ifndef BCI_DISPLAY_IMAGE_INTERNAL_H
#define BCI_DISPLAY_IMAGE_INTERNAL_H

#include <opencv2/core.hpp>

#include "frame-buffer.h"
#include "led-display.h"

namespace bci_display {
namespace internal {

// Conversion between FrameBuffer and a CV_8UC3 BGR image, the format
// OpenCV wants for display.
cv::Mat FrameBufferToBGR(const FrameBuffer &frame);

// Create the view of "source" shown on a width x height display: the
// source is center-cropped to the target aspect ratio, the crop is
// shrunk by "zoom" around its center (zoom < 1 shows more than the source,
// the outside is black), then resampled with "policy". With zoom 1 and
// equal sizes the pixels are copied unchanged. Returns NULL with a
// kOutOfRangeError if the view can't be made at this size.
FrameBuffer *ComposeView(const FrameBuffer &source, int width, int height,
                         float zoom, ResizePolicy policy, DisplayError *err);

}  // namespace internal
}  // namespace bci_display

#endif  // BCI_DISPLAY_IMAGE_INTERNAL_H
