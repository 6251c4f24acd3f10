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

#ifndef BCI_DISPLAY_SIGNAL_ENCODER_H
#define BCI_DISPLAY_SIGNAL_ENCODER_H

#include <stdint.h>
#include <stddef.h>

#include "display-backend.h"

namespace bci_display {
namespace internal {

// Pulse timing of a MatrixSpec, expressed in PWM slots.
struct SlotTiming {
  int slot_rate_hz;
  int slots_per_bit;
  int high_slots_zero;   // Slots high for a 0 bit.
  int high_slots_one;    // Slots high for a 1 bit.
  int reset_slots;       // Minimum low slots latching the frame.
};

// Converts colors in wiring order into the WS281x slot stream.
//
// Per LED: every channel is scaled by the global brightness, then the
// channels are put in led_sequence order and sent MSB first, each bit as
// a short (0) or long (1) high pulse. The frame ends with the low reset
// gap. With invert, all levels of the finished frame are complemented.
class SignalEncoder {
public:
  // Validates the spec; returns NULL with kConfigError on problems.
  static SignalEncoder *Create(const MatrixSpec &spec, DisplayError *err);

  // Translate the nanosecond timing of a MatrixSpec into slots. Returns false
  // with kConfigError if 0 and 1 bits can't be told apart at this rate.
  static bool ComputeSlotTiming(const MatrixSpec &spec, SlotTiming *timing,
                                DisplayError *err);

  // Parse a color order such as "GRB" or "grbw". Fills the number of
  // channels and for each output byte the index into {r, g, b, w}.
  static bool ParseColorSequence(const char *sequence, int *channels,
                                 int fetch[4]);

  // Linear brightness scaling: round(value * brightness), clamped.
  static uint8_t ScaleChannel(uint8_t value, float brightness);

  int channels() const { return channels_; }
  const SlotTiming &timing() const { return timing_; }

  // Bytes of an encoded frame for "led_count" LEDs.
  size_t FrameBytes(int led_count) const;

  // Encode "count" LEDs. Output only depends on the input.
  void Encode(const Color *leds, int count, SignalFrame *out) const;

  // How long a transmission of this frame may take before it counts as
  // hung: four times the frame duration plus 5ms.
  static int64_t DeadlineMicros(const SignalFrame &frame);

private:
  SignalEncoder(const MatrixSpec &spec, const SlotTiming &timing,
                int channels, const int fetch[4]);

  const SlotTiming timing_;
  const bool invert_;
  int channels_;
  int fetch_[4];
  uint8_t brightness_lookup_[256];
};

}  // namespace internal
}  // namespace bci_display

#endif  // BCI_DISPLAY_SIGNAL_ENCODER_H
