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

// Entry point of the display library. A DisplayController shows images on
// whatever backend the options select, so a control source (e.g. a BCI
// classifier picking the next symbol) doesn't care if it talks to an LED
// matrix or a window on the desktop.
//
//   bci_display::DisplayOptions options;
//   bci_display::DisplayError err;
//   if (!bci_display::ParseOptionsFromFlags(&argc, &argv, &options, &err))
//     ...
//   DisplayController *display =
//     DisplayController::CreateFromOptions(options, &err);
//   display->Show("arrow-left.png", &err);
//   ...
//   delete display;  // Switches the LEDs off.
#ifndef BCI_DISPLAY_LED_DISPLAY_H
#define BCI_DISPLAY_LED_DISPLAY_H

#include <stdio.h>

#include <string>

#include "display-backend.h"
#include "display-error.h"
#include "frame-buffer.h"

namespace bci_display {

// How images are resampled to the display size.
enum ResizePolicy {
  kResizeNearest = 0,  // Nearest neighbor; keeps hard pixel edges.
  kResizeBox           // Area average; better for photos on small matrices.
};

// "nearest" or "box". Returns false for anything else.
bool ParseResizePolicy(const char *name, ResizePolicy *policy);

struct DisplayOptions {
  DisplayOptions();

  // Validate values without touching any hardware. For the "external"
  // display this includes the matrix spec.
  bool Validate(DisplayError *err) const;

  // "external" for the LED matrix, "internal" or "emulated" for a window.
  std::string display_type;
  MatrixSpec matrix;
  WindowOptions window;
  ResizePolicy resize;
};

// Consume the --led-* and --window-* flags from the command line and store
// them in "options". Other arguments are left in argv, with *argc adjusted.
// Returns false with a kConfigError on unknown --led-/--window- flags or
// unparseable values.
bool ParseOptionsFromFlags(int *argc, char ***argv, DisplayOptions *options,
                           DisplayError *err);

// Print the flags understood by ParseOptionsFromFlags(), with the values of
// "defaults".
void PrintDisplayFlags(FILE *out,
                       const DisplayOptions &defaults = DisplayOptions());

class DisplayController {
public:
  // Create a controller for the backend named in the options. Returns NULL
  // with a kConfigError on unknown backends or invalid options. No hardware
  // is touched yet; that happens on the first Show().
  static DisplayController *CreateFromOptions(const DisplayOptions &options,
                                              DisplayError *err);

  // Takes ownership of the backend. A backend reporting an invalid native
  // size makes every Show() and Clear() fail with kConfigError.
  DisplayController(DisplayBackend *backend,
                    ResizePolicy resize = kResizeNearest);
  ~DisplayController();

  // Decode the image, fit it to the display and show it. A decode error is
  // reported with kDecodeError and leaves the controller usable.
  bool Show(const char *image_path, DisplayError *err);

  // Same for an image that is already in memory.
  bool ShowFrame(const FrameBuffer &image, DisplayError *err);

  // Switch all pixels off. Before the first image of a display without
  // native size, there is nothing to clear and this succeeds.
  bool Clear(DisplayError *err);

  // Zoom into (factor > 1) or out of (factor < 1) the last image, around
  // its center. Factor must be within [1/8, 8] (kOutOfRangeError). Applies
  // to later images as well.
  bool SetZoom(float factor, DisplayError *err);
  float zoom() const { return zoom_; }

  // Double or halve the zoom, as the '+' and '-' keys do.
  bool ZoomIn(DisplayError *err) { return SetZoom(zoom_ * 2.0f, err); }
  bool ZoomOut(DisplayError *err) { return SetZoom(zoom_ / 2.0f, err); }

  // Shut the backend down. Only the first call does something; after that,
  // every operation fails with kDisplayUnavailableError.
  void Close();
  bool closed() const { return closed_; }

  // Frame currently on display; NULL before the first Show() of a display
  // without native size.
  const FrameBuffer *frame() const { return frame_; }
  DisplayBackend *backend() { return backend_; }

private:
  DisplayController(const DisplayController &);
  DisplayController &operator=(const DisplayController &);

  bool CheckOpen(DisplayError *err) const;
  bool CheckNativeSize(DisplayError *err) const;
  bool Present(DisplayError *err);   // Compose source_ into frame_, render.
  bool RenderFrame(DisplayError *err);

  DisplayBackend *const backend_;
  const ResizePolicy resize_;
  bool has_native_size_;
  int native_width_;
  int native_height_;
  FrameBuffer *frame_;     // In display size.
  FrameBuffer *source_;    // Last image, original size.
  float zoom_;
  bool backend_initialized_;
  bool closed_;
};

}  // namespace bci_display

#endif  // BCI_DISPLAY_LED_DISPLAY_H
