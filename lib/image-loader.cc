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

// Image decoding and resampling. All OpenCV image handling of the library
// lives here.

#include "image-internal.h"

#include <errno.h>
#include <math.h>
#include <string.h>
#include <sys/stat.h>

#include <algorithm>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "logging.h"

namespace bci_display {
namespace internal {

// FrameBuffer <-> CV_8UC4 with channels in r, g, b, w order. Keeping all
// four channels lets resampling carry the white channel along.
static cv::Mat FrameBufferToRGBW(const FrameBuffer &frame) {
  cv::Mat result(frame.height(), frame.width(), CV_8UC4);
  const Color *pixel = frame.data();
  for (int y = 0; y < frame.height(); ++y) {
    cv::Vec4b *row = result.ptr<cv::Vec4b>(y);
    for (int x = 0; x < frame.width(); ++x, ++pixel) {
      row[x] = cv::Vec4b(pixel->r, pixel->g, pixel->b, pixel->w);
    }
  }
  return result;
}

static FrameBuffer *RGBWToFrameBuffer(const cv::Mat &rgbw) {
  FrameBuffer *result = new FrameBuffer(rgbw.cols, rgbw.rows);
  for (int y = 0; y < rgbw.rows; ++y) {
    const cv::Vec4b *row = rgbw.ptr<cv::Vec4b>(y);
    for (int x = 0; x < rgbw.cols; ++x) {
      result->SetPixel(x, y, Color(row[x][0], row[x][1], row[x][2], row[x][3]));
    }
  }
  return result;
}

cv::Mat FrameBufferToBGR(const FrameBuffer &frame) {
  cv::Mat result(frame.height(), frame.width(), CV_8UC3);
  const Color *pixel = frame.data();
  for (int y = 0; y < frame.height(); ++y) {
    cv::Vec3b *row = result.ptr<cv::Vec3b>(y);
    for (int x = 0; x < frame.width(); ++x, ++pixel) {
      row[x] = cv::Vec3b(pixel->b, pixel->g, pixel->r);
    }
  }
  return result;
}

FrameBuffer *ComposeView(const FrameBuffer &source, int width, int height,
                         float zoom, ResizePolicy policy, DisplayError *err) {
  if (!FrameBuffer::IsValidSize(width, height) || !(zoom > 0.0f)) {
    SetError(err, kOutOfRangeError, "Can't compose a %dx%d view at zoom %.3f",
             width, height, zoom);
    return NULL;
  }
  if (zoom == 1.0f && source.width() == width && source.height() == height) {
    FrameBuffer *copy = new FrameBuffer(width, height);
    copy->CopyFrom(source);
    return copy;
  }

  // Largest centered region of the source with the target aspect ratio.
  const double target_aspect = static_cast<double>(width) / height;
  double crop_width = source.width();
  double crop_height = source.height();
  if (crop_width / crop_height > target_aspect) {
    crop_width = crop_height * target_aspect;
  } else {
    crop_height = crop_width / target_aspect;
  }
  crop_width /= zoom;
  crop_height /= zoom;

  const int region_width = std::max(1, static_cast<int>(lround(crop_width)));
  const int region_height = std::max(1, static_cast<int>(lround(crop_height)));
  const int region_x = static_cast<int>(
    lround((source.width() - crop_width) / 2.0));
  const int region_y = static_cast<int>(
    lround((source.height() - crop_height) / 2.0));

  cv::Mat scaled;
  try {
    // Copy the region into a black canvas; with zoom < 1 it extends beyond
    // the source.
    const cv::Mat rgbw = FrameBufferToRGBW(source);
    cv::Mat region(region_height, region_width, CV_8UC4, cv::Scalar::all(0));
    const cv::Rect wanted(region_x, region_y, region_width, region_height);
    const cv::Rect available = wanted & cv::Rect(0, 0, rgbw.cols, rgbw.rows);
    if (available.area() > 0) {
      rgbw(available).copyTo(region(available - wanted.tl()));
    }

    if (region.cols == width && region.rows == height) {
      scaled = region;
    } else {
      const int interpolation =
        (policy == kResizeBox) ? cv::INTER_AREA : cv::INTER_NEAREST;
      cv::resize(region, scaled, cv::Size(width, height), 0, 0,
                 interpolation);
    }
  } catch (const cv::Exception &e) {
    SetError(err, kOutOfRangeError, "Can't resample %dx%d image to %dx%d: %s",
             source.width(), source.height(), width, height, e.what());
    return NULL;
  }
  LogDebug("Composed %dx%d view from %dx%d region at (%d,%d), zoom %.3f",
           width, height, region_width, region_height, region_x, region_y,
           zoom);
  return RGBWToFrameBuffer(scaled);
}

}  // namespace internal

FrameBuffer *FrameBuffer::FromImage(const char *path, DisplayError *err) {
  struct stat st;
  if (path == NULL || stat(path, &st) != 0) {
    SetError(err, kDecodeError, "Can't open image '%s': %s",
             path ? path : "(null)", strerror(path ? errno : EINVAL));
    return NULL;
  }
  if (!S_ISREG(st.st_mode)) {
    SetError(err, kDecodeError, "'%s' is not a regular file", path);
    return NULL;
  }

  cv::Mat image;
  try {
    image = cv::imread(path, cv::IMREAD_UNCHANGED);
  } catch (const cv::Exception &e) {
    SetError(err, kDecodeError, "Can't decode '%s': %s", path, e.what());
    return NULL;
  }
  if (image.empty()) {
    SetError(err, kDecodeError,
             "Can't decode '%s': unsupported format or corrupt file", path);
    return NULL;
  }

  if (image.depth() == CV_16U) {
    image.convertTo(image, CV_8U, 1.0 / 257.0);
  } else if (image.depth() != CV_8U) {
    SetError(err, kDecodeError, "'%s': unsupported pixel depth", path);
    return NULL;
  }

  // Bring everything to BGRA so there is one conversion loop.
  cv::Mat bgra;
  switch (image.channels()) {
  case 1: cv::cvtColor(image, bgra, cv::COLOR_GRAY2BGRA); break;
  case 3: cv::cvtColor(image, bgra, cv::COLOR_BGR2BGRA); break;
  case 4: bgra = image; break;
  default:
    SetError(err, kDecodeError, "'%s': unsupported number of channels (%d)",
             path, image.channels());
    return NULL;
  }

  FrameBuffer *result = new FrameBuffer(bgra.cols, bgra.rows);
  for (int y = 0; y < bgra.rows; ++y) {
    const cv::Vec4b *row = bgra.ptr<cv::Vec4b>(y);
    for (int x = 0; x < bgra.cols; ++x) {
      const cv::Vec4b &p = row[x];
      if (p[3] == 0) continue;  // Transparent: stays off.
      result->SetPixel(x, y, Color(p[2], p[1], p[0]));
    }
  }
  internal::LogDebug("Decoded '%s': %dx%d, %d channel(s)", path,
                     result->width(), result->height(), image.channels());
  return result;
}

}  // namespace bci_display
