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

#include "led-display.h"

#include "image-internal.h"
#include "logging.h"
#include "string-util.h"

namespace bci_display {
using internal::LogDebug;

static const float kMinZoom = 0.125f;
static const float kMaxZoom = 8.0f;

DisplayController *DisplayController::CreateFromOptions(
  const DisplayOptions &options, DisplayError *err) {
  if (!options.Validate(err))
    return NULL;

  const char *type = options.display_type.c_str();
  DisplayBackend *backend = NULL;
  if (internal::StrCaseEqual(type, "external")) {
    backend = new MatrixDisplay(options.matrix, CreateDeviceTransport());
  } else if (internal::StrCaseEqual(type, "internal")
             || internal::StrCaseEqual(type, "emulated")) {
    backend = new EmulatedDisplay(options.window, CreateHighGuiSurface());
  } else {
    SetError(err, kConfigError, "Unknown display type '%s'; expected "
             "'external', 'internal' or 'emulated'", type);
    return NULL;
  }
  LogDebug("Using %s display", type);
  return new DisplayController(backend, options.resize);
}

DisplayController::DisplayController(DisplayBackend *backend,
                                     ResizePolicy resize)
  : backend_(backend), resize_(resize), has_native_size_(false),
    native_width_(0), native_height_(0), frame_(NULL), source_(NULL),
    zoom_(1.0f), backend_initialized_(false), closed_(false) {
  has_native_size_ = backend_->NativeSize(&native_width_, &native_height_);
  if (has_native_size_
      && FrameBuffer::IsValidSize(native_width_, native_height_)) {
    frame_ = new FrameBuffer(native_width_, native_height_);
  }
}

DisplayController::~DisplayController() {
  Close();
  delete backend_;
  delete frame_;
  delete source_;
}

bool DisplayController::CheckOpen(DisplayError *err) const {
  if (closed_)
    return SetError(err, kDisplayUnavailableError, "Display is closed");
  return true;
}

bool DisplayController::CheckNativeSize(DisplayError *err) const {
  if (has_native_size_ && frame_ == NULL)
    return SetError(err, kConfigError, "Display reports invalid size %dx%d",
                    native_width_, native_height_);
  return true;
}

bool DisplayController::Show(const char *image_path, DisplayError *err) {
  if (!CheckOpen(err))
    return false;
  FrameBuffer *image = FrameBuffer::FromImage(image_path, err);
  if (image == NULL)
    return false;
  delete source_;
  source_ = image;
  return Present(err);
}

bool DisplayController::ShowFrame(const FrameBuffer &image,
                                  DisplayError *err) {
  if (!CheckOpen(err))
    return false;
  FrameBuffer *copy = new FrameBuffer(image.width(), image.height());
  copy->CopyFrom(image);
  delete source_;
  source_ = copy;
  return Present(err);
}

bool DisplayController::Clear(DisplayError *err) {
  if (!CheckOpen(err) || !CheckNativeSize(err))
    return false;
  delete source_;
  source_ = NULL;
  if (frame_ == NULL)
    return true;  // Nothing shown yet.
  frame_->Clear();
  return RenderFrame(err);
}

bool DisplayController::SetZoom(float factor, DisplayError *err) {
  if (!CheckOpen(err))
    return false;
  if (!(factor >= kMinZoom && factor <= kMaxZoom))
    return SetError(err, kOutOfRangeError, "Zoom %.3f outside %.3f..%.1f",
                    factor, kMinZoom, kMaxZoom);
  zoom_ = factor;
  if (source_ == NULL)
    return true;
  return Present(err);
}

bool DisplayController::Present(DisplayError *err) {
  if (!CheckNativeSize(err))
    return false;
  if (frame_ == NULL) {
    // Display adopts the size of the first image.
    frame_ = new FrameBuffer(source_->width(), source_->height());
  }
  FrameBuffer *view = internal::ComposeView(*source_, frame_->width(),
                                            frame_->height(), zoom_, resize_,
                                            err);
  if (view == NULL)
    return false;
  frame_->CopyFrom(*view);
  delete view;
  return RenderFrame(err);
}

bool DisplayController::RenderFrame(DisplayError *err) {
  if (!backend_initialized_) {
    if (!backend_->Initialize(frame_->width(), frame_->height(), err)) {
      PrefixError(err, "Can't initialize display");
      return false;
    }
    backend_initialized_ = true;
  }
  return backend_->Render(*frame_, err);
}

void DisplayController::Close() {
  if (closed_) return;
  closed_ = true;
  backend_->Shutdown();
  backend_initialized_ = false;
  LogDebug("Display closed");
}

}  // namespace bci_display
