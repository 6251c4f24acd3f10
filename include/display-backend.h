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

// Display backends: the targets a FrameBuffer can be rendered to. There is
// a window on the desktop (EmulatedDisplay) and a chain of WS281x type
// LEDs folded into a matrix (MatrixDisplay).
#ifndef BCI_DISPLAY_DISPLAY_BACKEND_H
#define BCI_DISPLAY_DISPLAY_BACKEND_H

#include <stdint.h>
#include <stddef.h>

#include <string>
#include <vector>

#include "display-error.h"
#include "frame-buffer.h"
#include "pixel-mapper.h"

namespace bci_display {

namespace internal {
class ResourceLock;
class SignalEncoder;
}

// Description of a physical LED matrix and the signal to drive it.
// Constructed with the defaults of an 8x8 WS2812B matrix on GPIO 18.
struct MatrixSpec {
  MatrixSpec();

  // Check values for consistency, e.g. led_count == width * height and
  // the pulse timing can be expressed at this frequency. Fills a
  // kConfigError and returns false otherwise. No hardware is touched.
  bool Validate(DisplayError *err) const;

  int gpio_pin;         // Data output. Default 18 (PWM0).
  int led_count;        // Number of LEDs on the chain. Default 64.
  int led_freq_hz;      // Data bit rate. Default 800000.
  int dma_channel;      // DMA channel feeding the peripheral. Default 10.
  bool invert;          // Output goes through an inverting level shifter.
  float brightness;     // Global brightness 0..1, linear. Default 1.
  int width_count;      // LEDs per row. Default 8.
  int height_count;     // Rows. Default 8.

  std::string led_sequence;  // Color order on the wire, "GRB", "RGBW"...
  WiringTopology wiring;     // How the chain is folded. Default row-major.

  // Pulse timing of the LED family. Every data bit is sent as
  // slots_per_bit slots; the line is high for t0h_ns (0 bit) or t1h_ns
  // (1 bit), rounded to whole slots. Defaults are WS2812B values.
  int t0h_ns;           // Default 400.
  int t1h_ns;           // Default 800.
  int reset_us;         // Low time that latches the data. Default 55.
  int slots_per_bit;    // Default 3.

  std::string device;    // Device node the signal is written to.
  std::string lock_dir;  // Where GPIO/DMA claim lock files are created.
};

// The encoded signal of one frame. Every bit is one PWM slot of
// 1/slot_rate_hz seconds; bits are sent MSB first.
struct SignalFrame {
  SignalFrame() : slot_rate_hz(0) {}

  size_t slot_count() const { return data.size() * 8; }
  bool level(size_t slot) const {
    return (data[slot / 8] & (0x80 >> (slot % 8))) != 0;
  }
  // Time it takes to clock out the whole frame.
  int64_t DurationMicros() const;

  std::vector<uint8_t> data;
  int slot_rate_hz;
};

// Gets the encoded signal to the LEDs.
class SignalTransport {
public:
  virtual ~SignalTransport() {}

  // Prepare the output for frames of "frame_bytes" bytes at the given slot
  // rate. Returns false with a kHardwareInitError if not possible.
  virtual bool Open(const MatrixSpec &spec, int slot_rate_hz,
                    size_t frame_bytes, DisplayError *err) = 0;

  // Send the frame. Blocks until it is handed to the hardware. Fails with
  // kHardwareTimeoutError if that takes longer than deadline_usec.
  virtual bool Transmit(const SignalFrame &frame, int64_t deadline_usec,
                        DisplayError *err) = 0;

  virtual void Close() = 0;
};

// Transport writing the slot stream to MatrixSpec::device. A spidev device
// is configured to clock out at the slot rate.
SignalTransport *CreateDeviceTransport();

// A window to show frames in.
class WindowSurface {
public:
  virtual ~WindowSurface() {}

  // Open a window of the given size in screen pixels. Returns false with
  // kDisplayUnavailableError if there is no windowing system.
  virtual bool Open(const std::string &title, int width, int height,
                    DisplayError *err) = 0;

  // Show the frame, every pixel as a "scale" x "scale" block.
  virtual bool Show(const FrameBuffer &frame, int scale,
                    DisplayError *err) = 0;

  // Process window events for up to delay_ms milliseconds. Returns the
  // key pressed or -1.
  virtual int PollKey(int delay_ms) = 0;

  // False once the user closed the window.
  virtual bool IsOpen() = 0;

  virtual void Close() = 0;
};

// WindowSurface based on OpenCV's HighGUI.
WindowSurface *CreateHighGuiSurface();

// The capabilities every display target has. A backend is initialized
// once, renders any number of frames and is shut down once; Shutdown()
// may be called in any state.
class DisplayBackend {
public:
  virtual ~DisplayBackend() {}

  // Size the backend requires frames to have. Returns false if the backend
  // adopts whatever size is passed to Initialize().
  virtual bool NativeSize(int *width, int *height) const = 0;

  // Acquire the display for frames of width x height.
  virtual bool Initialize(int width, int height, DisplayError *err) = 0;

  // Show the frame. Blocks until it is out.
  virtual bool Render(const FrameBuffer &frame, DisplayError *err) = 0;

  // Release everything Initialize() acquired.
  virtual void Shutdown() = 0;
};

struct WindowOptions {
  WindowOptions() : scale(1), title("bci-display") {}

  int scale;          // Screen pixels per frame pixel, >= 1.
  std::string title;
};

// Shows frames in a desktop window, pixel by pixel.
class EmulatedDisplay : public DisplayBackend {
public:
  // Takes ownership of the surface.
  EmulatedDisplay(const WindowOptions &options, WindowSurface *surface);
  virtual ~EmulatedDisplay();

  virtual bool NativeSize(int *width, int *height) const;
  virtual bool Initialize(int width, int height, DisplayError *err);
  virtual bool Render(const FrameBuffer &frame, DisplayError *err);
  virtual void Shutdown();

  // Interactive front ends poll the window for keys and close events.
  int PollKey(int delay_ms);
  bool IsOpen();

private:
  EmulatedDisplay(const EmulatedDisplay &);             // Not copyable.
  EmulatedDisplay &operator=(const EmulatedDisplay &);

  const WindowOptions options_;
  WindowSurface *const surface_;
  bool open_;
  int width_;
  int height_;
};

// Drives a physical LED matrix: frames are reordered into wiring order,
// encoded into the LED protocol and sent through the transport.
//
// The GPIO pin and DMA channel are claimed exclusively (across processes)
// while initialized. A transmission that misses its deadline leaves the
// display unusable until Shutdown() and Initialize().
class MatrixDisplay : public DisplayBackend {
public:
  // Takes ownership of the transport.
  MatrixDisplay(const MatrixSpec &spec, SignalTransport *transport);
  virtual ~MatrixDisplay();

  virtual bool NativeSize(int *width, int *height) const;
  virtual bool Initialize(int width, int height, DisplayError *err);
  virtual bool Render(const FrameBuffer &frame, DisplayError *err);
  virtual void Shutdown();

  const MatrixSpec &spec() const { return spec_; }
  bool initialized() const { return initialized_; }
  bool usable() const { return initialized_ && usable_; }

  // True if the pin can output a PWM, PCM or SPI signal.
  static bool IsSignalCapablePin(int gpio_pin);

private:
  MatrixDisplay(const MatrixDisplay &);                 // Not copyable.
  MatrixDisplay &operator=(const MatrixDisplay &);

  bool Transmit(const SignalFrame &frame, DisplayError *err);
  bool SendAllOff(DisplayError *err);
  void ReleaseResources();

  const MatrixSpec spec_;
  SignalTransport *const transport_;
  internal::SignalEncoder *encoder_;
  LedIndexMap *index_map_;
  internal::ResourceLock *gpio_lock_;
  internal::ResourceLock *dma_lock_;
  bool transport_open_;
  bool initialized_;
  bool usable_;
  std::vector<Color> leds_;   // Colors in wiring order.
  SignalFrame signal_;
};

}  // namespace bci_display

#endif  // BCI_DISPLAY_DISPLAY_BACKEND_H
