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

#include "display-backend.h"

#include <stdlib.h>

#include <opencv2/core.hpp>
#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

#include "image-internal.h"
#include "logging.h"

namespace bci_display {
using internal::LogDebug;

namespace {
class HighGuiSurface : public WindowSurface {
public:
  HighGuiSurface() : open_(false) {}
  virtual ~HighGuiSurface() { Close(); }

  virtual bool Open(const std::string &title, int width, int height,
                    DisplayError *err) {
    if (open_) return true;
    const char *x11 = getenv("DISPLAY");
    const char *wayland = getenv("WAYLAND_DISPLAY");
    if ((x11 == NULL || *x11 == '\0') && (wayland == NULL || *wayland == '\0'))
      return SetError(err, kDisplayUnavailableError,
                      "No windowing system (neither DISPLAY nor "
                      "WAYLAND_DISPLAY set)");
    try {
      // AUTOSIZE windows ignore resizeWindow().
      cv::namedWindow(title, cv::WINDOW_NORMAL);
      cv::resizeWindow(title, width, height);
    } catch (const cv::Exception &e) {
      return SetError(err, kDisplayUnavailableError, "Can't open window: %s",
                      e.what());
    }
    title_ = title;
    open_ = true;
    LogDebug("Window '%s' %dx%d", title_.c_str(), width, height);
    return true;
  }

  virtual bool Show(const FrameBuffer &frame, int scale, DisplayError *err) {
    if (!open_)
      return SetError(err, kDisplayUnavailableError, "Window is not open");
    try {
      const cv::Mat bgr = internal::FrameBufferToBGR(frame);
      if (scale > 1) {
        // Nearest neighbor, so every pixel stays a sharp square like an LED.
        cv::resize(bgr, scaled_, cv::Size(frame.width() * scale,
                                          frame.height() * scale),
                   0, 0, cv::INTER_NEAREST);
        cv::imshow(title_, scaled_);
      } else {
        cv::imshow(title_, bgr);
      }
      cv::waitKey(1);  // Let HighGUI paint.
    } catch (const cv::Exception &e) {
      return SetError(err, kDisplayUnavailableError, "Can't show frame: %s",
                      e.what());
    }
    return true;
  }

  virtual int PollKey(int delay_ms) {
    if (!open_) return -1;
    return cv::waitKey(delay_ms);
  }

  virtual bool IsOpen() {
    if (!open_) return false;
    try {
      return cv::getWindowProperty(title_, cv::WND_PROP_VISIBLE) >= 1;
    } catch (const cv::Exception &e) {
      LogDebug("Window property query failed: %s", e.what());
      return false;
    }
  }

  virtual void Close() {
    if (!open_) return;
    open_ = false;
    try {
      cv::destroyWindow(title_);
      cv::waitKey(1);
    } catch (const cv::Exception &e) {
      LogDebug("destroyWindow(%s): %s", title_.c_str(), e.what());
    }
  }

private:
  bool open_;
  std::string title_;
  cv::Mat scaled_;
};
}  // namespace

WindowSurface *CreateHighGuiSurface() {
  return new HighGuiSurface();
}

EmulatedDisplay::EmulatedDisplay(const WindowOptions &options,
                                 WindowSurface *surface)
  : options_(options), surface_(surface), open_(false), width_(0),
    height_(0) {
}

EmulatedDisplay::~EmulatedDisplay() {
  Shutdown();
  delete surface_;
}

bool EmulatedDisplay::NativeSize(int *, int *) const {
  return false;  // Whatever we get.
}

bool EmulatedDisplay::Initialize(int width, int height, DisplayError *err) {
  if (open_) {
    if (width == width_ && height == height_) return true;
    return SetError(err, kOutOfRangeError, "Window already shows %dx%d "
                    "frames, can't switch to %dx%d", width_, height_,
                    width, height);
  }
  if (width <= 0 || height <= 0)
    return SetError(err, kOutOfRangeError, "Invalid frame size %dx%d",
                    width, height);
  if (options_.scale < 1)
    return SetError(err, kConfigError, "Window scale %d must be >= 1",
                    options_.scale);
  if (!surface_->Open(options_.title, width * options_.scale,
                      height * options_.scale, err))
    return false;
  width_ = width;
  height_ = height;
  open_ = true;
  return true;
}

bool EmulatedDisplay::Render(const FrameBuffer &frame, DisplayError *err) {
  if (!open_)
    return SetError(err, kDisplayUnavailableError, "Window not initialized");
  if (frame.width() != width_ || frame.height() != height_)
    return SetError(err, kOutOfRangeError, "Frame of %dx%d does not fit the "
                    "%dx%d window", frame.width(), frame.height(),
                    width_, height_);
  return surface_->Show(frame, options_.scale, err);
}

void EmulatedDisplay::Shutdown() {
  if (!open_) return;
  surface_->Close();
  open_ = false;
}

int EmulatedDisplay::PollKey(int delay_ms) {
  return open_ ? surface_->PollKey(delay_ms) : -1;
}

bool EmulatedDisplay::IsOpen() {
  return open_ && surface_->IsOpen();
}

}  // namespace bci_display
