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

#include <stdint.h>
#include <string.h>

#include <algorithm>

#include "logging.h"
#include "resource-lock.h"
#include "signal-encoder.h"

namespace bci_display {
using internal::LogDebug;
using internal::LogError;

// At 800kHz a single data line refreshes about 33000 LEDs per second;
// anything near this is a typo.
static const int kMaxLedCount = 1 << 20;

// Highest DMA channel of the BCM283x DMA controller. 15 is reserved.
static const int kMaxDmaChannel = 14;

// GPIOs that can be routed to a peripheral able to clock out the slot
// stream.
static const int kSignalCapablePins[] = {
  10,                  // SPI0 MOSI
  12, 18, 40, 52,      // PWM0
  13, 19, 41, 45, 53,  // PWM1
  21, 31,              // PCM DOUT
};

MatrixSpec::MatrixSpec()
  : gpio_pin(18), led_count(64), led_freq_hz(800000), dma_channel(10),
    invert(false), brightness(1.0f), width_count(8), height_count(8),
    led_sequence("GRB"), wiring(kRowMajor),
    t0h_ns(400), t1h_ns(800), reset_us(55), slots_per_bit(3),
    device("/dev/spidev0.0"), lock_dir("/var/lock") {
}

bool MatrixSpec::Validate(DisplayError *err) const {
  if (width_count <= 0 || height_count <= 0)
    return SetError(err, kConfigError, "Matrix size %dx%d: must be positive",
                    width_count, height_count);
  const int64_t grid = static_cast<int64_t>(width_count) * height_count;
  if (grid > kMaxLedCount)
    return SetError(err, kConfigError, "Matrix size %dx%d: more than %d LEDs",
                    width_count, height_count, kMaxLedCount);
  if (led_count != grid)
    return SetError(err, kConfigError,
                    "led_count %d does not match %dx%d matrix (%d LEDs)",
                    led_count, width_count, height_count,
                    static_cast<int>(grid));
  if (!(brightness >= 0.0f && brightness <= 1.0f))
    return SetError(err, kConfigError, "Brightness %.3f outside 0..1",
                    brightness);
  internal::SlotTiming timing;
  if (!internal::SignalEncoder::ComputeSlotTiming(*this, &timing, err))
    return false;
  int channels;
  int fetch[4];
  if (!internal::SignalEncoder::ParseColorSequence(led_sequence.c_str(),
                                                   &channels, fetch)) {
    return SetError(err, kConfigError, "LED sequence '%s' is not a "
                    "permutation of RGB or RGBW", led_sequence.c_str());
  }
  if (device.empty())
    return SetError(err, kConfigError, "No output device given");
  return true;
}

bool MatrixDisplay::IsSignalCapablePin(int gpio_pin) {
  for (size_t i = 0;
       i < sizeof(kSignalCapablePins) / sizeof(kSignalCapablePins[0]); ++i) {
    if (kSignalCapablePins[i] == gpio_pin) return true;
  }
  return false;
}

MatrixDisplay::MatrixDisplay(const MatrixSpec &spec,
                             SignalTransport *transport)
  : spec_(spec), transport_(transport), encoder_(NULL), index_map_(NULL),
    gpio_lock_(new internal::ResourceLock()),
    dma_lock_(new internal::ResourceLock()),
    transport_open_(false), initialized_(false), usable_(false) {
}

MatrixDisplay::~MatrixDisplay() {
  Shutdown();
  delete gpio_lock_;
  delete dma_lock_;
  delete transport_;
}

bool MatrixDisplay::NativeSize(int *width, int *height) const {
  *width = spec_.width_count;
  *height = spec_.height_count;
  return true;
}

bool MatrixDisplay::Initialize(int width, int height, DisplayError *err) {
  if (initialized_) {
    if (usable_) return true;
    return SetError(err, kHardwareTimeoutError, "Matrix display is unusable "
                    "after a failed transmission; Shutdown() first");
  }

  // Everything that doesn't need hardware first.
  if (!spec_.Validate(err))
    return false;
  if (width != spec_.width_count || height != spec_.height_count)
    return SetError(err, kOutOfRangeError, "Frame of %dx%d does not fit "
                    "the %dx%d matrix", width, height,
                    spec_.width_count, spec_.height_count);
  if (!IsSignalCapablePin(spec_.gpio_pin))
    return SetError(err, kHardwareInitError, "GPIO %d can't output a PWM, "
                    "PCM or SPI signal", spec_.gpio_pin);
  if (spec_.dma_channel < 0 || spec_.dma_channel > kMaxDmaChannel)
    return SetError(err, kHardwareInitError, "DMA channel %d outside 0..%d",
                    spec_.dma_channel, kMaxDmaChannel);

  encoder_ = internal::SignalEncoder::Create(spec_, err);
  if (encoder_ == NULL) {
    ReleaseResources();
    return false;
  }
  index_map_ = LedIndexMap::Create(spec_.width_count, spec_.height_count,
                                   spec_.wiring, spec_.led_count, err);
  if (index_map_ == NULL) {
    ReleaseResources();
    return false;
  }

  if (!gpio_lock_->Acquire(internal::ResourceLock::LockPath(
                             spec_.lock_dir, "gpio", spec_.gpio_pin), err)
      || !dma_lock_->Acquire(internal::ResourceLock::LockPath(
                               spec_.lock_dir, "dma", spec_.dma_channel),
                             err)) {
    ReleaseResources();
    return false;
  }

  if (!transport_->Open(spec_, encoder_->timing().slot_rate_hz,
                        encoder_->FrameBytes(spec_.led_count), err)) {
    ReleaseResources();
    return false;
  }
  transport_open_ = true;

  leds_.assign(spec_.led_count, Color());
  initialized_ = true;
  usable_ = true;

  // Start out dark; whatever was on the LEDs before is not ours.
  if (!SendAllOff(err)) {
    ReleaseResources();
    return false;
  }
  LogDebug("Matrix %dx%d (%s) on GPIO %d, DMA %d initialized",
           spec_.width_count, spec_.height_count,
           WiringTopologyName(spec_.wiring), spec_.gpio_pin,
           spec_.dma_channel);
  return true;
}

bool MatrixDisplay::Render(const FrameBuffer &frame, DisplayError *err) {
  if (!initialized_)
    return SetError(err, kHardwareInitError, "Matrix display not initialized");
  if (!usable_)
    return SetError(err, kHardwareTimeoutError, "Matrix display is unusable "
                    "after a failed transmission");
  if (frame.width() != spec_.width_count
      || frame.height() != spec_.height_count)
    return SetError(err, kOutOfRangeError, "Frame of %dx%d does not fit "
                    "the %dx%d matrix", frame.width(), frame.height(),
                    spec_.width_count, spec_.height_count);

  const Color *pixels = frame.data();
  for (int y = 0; y < spec_.height_count; ++y) {
    for (int x = 0; x < spec_.width_count; ++x) {
      leds_[index_map_->get(x, y)] = *pixels++;
    }
  }
  encoder_->Encode(leds_.data(), spec_.led_count, &signal_);
  return Transmit(signal_, err);
}

bool MatrixDisplay::Transmit(const SignalFrame &frame, DisplayError *err) {
  DisplayError local;
  if (transport_->Transmit(frame,
                           internal::SignalEncoder::DeadlineMicros(frame),
                           &local)) {
    return true;
  }
  if (local.kind == kHardwareTimeoutError) {
    usable_ = false;
    LogError("%s; display disabled until re-initialized",
             local.message.c_str());
  }
  if (err) *err = local;
  return false;
}

bool MatrixDisplay::SendAllOff(DisplayError *err) {
  std::fill(leds_.begin(), leds_.end(), Color());
  encoder_->Encode(leds_.data(), spec_.led_count, &signal_);
  return Transmit(signal_, err);
}

void MatrixDisplay::Shutdown() {
  // Also after a timeout: the LEDs must not stay lit.
  if (initialized_ && transport_open_) {
    DisplayError ignored;
    if (!SendAllOff(&ignored)) {
      LogError("Could not switch LEDs off: %s", ignored.message.c_str());
    }
  }
  ReleaseResources();
}

void MatrixDisplay::ReleaseResources() {
  if (transport_open_) {
    transport_->Close();
    transport_open_ = false;
  }
  dma_lock_->Release();
  gpio_lock_->Release();
  delete encoder_;
  encoder_ = NULL;
  delete index_map_;
  index_map_ = NULL;
  initialized_ = false;
  usable_ = false;
}

}  // namespace bci_display
