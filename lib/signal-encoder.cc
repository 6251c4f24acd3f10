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

// WS281x style LEDs take a single data line. Each bit is a pulse with fixed
// period; a short high time is a 0, a long high time a 1. We generate that
// by splitting every bit period into a few slots clocked out by the PWM (or
// SPI) peripheral, e.g. with three slots per bit a 0 is 100 and a 1 is 110.
//
// Example with the defaults (800kHz, 400ns/800ns, 3 slots): the slot rate
// is 2.4MHz, a slot 416ns. The 55us reset gap is 132 low slots.

#include "signal-encoder.h"

#include <math.h>
#include <string.h>

#include <algorithm>

#include "logging.h"

namespace bci_display {

int64_t SignalFrame::DurationMicros() const {
  if (slot_rate_hz <= 0) return 0;
  return static_cast<int64_t>(slot_count()) * 1000000 / slot_rate_hz;
}

namespace internal {

// Some reasonable limits. Data rates of the WS281x family are 400kHz or
// 800kHz; everything outside of these bounds is surely a typo.
static const int kMinFrequencyHz = 100000;
static const int kMaxFrequencyHz = 2000000;
static const int kMaxSlotsPerBit = 16;

bool SignalEncoder::ComputeSlotTiming(const MatrixSpec &spec,
                                      SlotTiming *timing,
                                      DisplayError *err) {
  if (spec.led_freq_hz < kMinFrequencyHz || spec.led_freq_hz > kMaxFrequencyHz)
    return SetError(err, kConfigError,
                    "led_freq_hz %d outside supported range %d..%d",
                    spec.led_freq_hz, kMinFrequencyHz, kMaxFrequencyHz);
  if (spec.slots_per_bit < 3 || spec.slots_per_bit > kMaxSlotsPerBit)
    return SetError(err, kConfigError,
                    "slots_per_bit %d: need 3..%d slots to shape a bit",
                    spec.slots_per_bit, kMaxSlotsPerBit);
  if (spec.t0h_ns <= 0 || spec.t1h_ns <= 0 || spec.reset_us <= 0)
    return SetError(err, kConfigError,
                    "Pulse timing t0h=%dns t1h=%dns reset=%dus must be "
                    "positive", spec.t0h_ns, spec.t1h_ns, spec.reset_us);

  const int slot_rate = spec.led_freq_hz * spec.slots_per_bit;
  const double slot_ns = 1e9 / slot_rate;
  const int high0 = static_cast<int>(lround(spec.t0h_ns / slot_ns));
  const int high1 = static_cast<int>(lround(spec.t1h_ns / slot_ns));
  if (high0 < 1 || high0 >= high1 || high1 >= spec.slots_per_bit) {
    return SetError(err, kConfigError,
                    "At %dHz with %d slots of %.1fns per bit, t0h=%dns and "
                    "t1h=%dns become %d and %d high slots; need "
                    "1 <= t0h < t1h < %d slots",
                    spec.led_freq_hz, spec.slots_per_bit, slot_ns,
                    spec.t0h_ns, spec.t1h_ns, high0, high1,
                    spec.slots_per_bit);
  }

  timing->slot_rate_hz = slot_rate;
  timing->slots_per_bit = spec.slots_per_bit;
  timing->high_slots_zero = high0;
  timing->high_slots_one = high1;
  timing->reset_slots = static_cast<int>(
    (static_cast<int64_t>(spec.reset_us) * slot_rate + 999999) / 1000000);
  return true;
}

bool SignalEncoder::ParseColorSequence(const char *sequence, int *channels,
                                       int fetch[4]) {
  if (sequence == NULL) return false;
  const size_t len = strlen(sequence);
  if (len != 3 && len != 4) return false;
  bool seen[4] = { false, false, false, false };
  for (size_t i = 0; i < len; ++i) {
    int channel;
    switch (sequence[i]) {
    case 'R': case 'r': channel = 0; break;
    case 'G': case 'g': channel = 1; break;
    case 'B': case 'b': channel = 2; break;
    case 'W': case 'w': channel = 3; break;
    default: return false;
    }
    if (seen[channel]) return false;
    seen[channel] = true;
    fetch[i] = channel;
  }
  if (!seen[0] || !seen[1] || !seen[2]) return false;
  *channels = static_cast<int>(len);
  return true;
}

uint8_t SignalEncoder::ScaleChannel(uint8_t value, float brightness) {
  const long scaled = lroundf(value * brightness);
  return static_cast<uint8_t>(std::min(255L, std::max(0L, scaled)));
}

SignalEncoder *SignalEncoder::Create(const MatrixSpec &spec,
                                     DisplayError *err) {
  if (!spec.Validate(err))
    return NULL;
  SlotTiming timing;
  if (!ComputeSlotTiming(spec, &timing, err))
    return NULL;
  int channels;
  int fetch[4];
  if (!ParseColorSequence(spec.led_sequence.c_str(), &channels, fetch)) {
    SetError(err, kConfigError, "Invalid LED sequence '%s'",
             spec.led_sequence.c_str());
    return NULL;
  }
  LogDebug("Encoder: %d channel(s) '%s', slot rate %dHz, 0=%d/%d 1=%d/%d "
           "slots high, reset %d slots%s", channels,
           spec.led_sequence.c_str(), timing.slot_rate_hz,
           timing.high_slots_zero, timing.slots_per_bit,
           timing.high_slots_one, timing.slots_per_bit, timing.reset_slots,
           spec.invert ? ", inverted" : "");
  return new SignalEncoder(spec, timing, channels, fetch);
}

SignalEncoder::SignalEncoder(const MatrixSpec &spec, const SlotTiming &timing,
                             int channels, const int fetch[4])
  : timing_(timing), invert_(spec.invert), channels_(channels) {
  for (int i = 0; i < 4; ++i) fetch_[i] = (i < channels) ? fetch[i] : 0;
  // To avoid the multiplication in the critical path, utilize a lookup
  // table for all possible channel values.
  for (int v = 0; v < 256; ++v)
    brightness_lookup_[v] = ScaleChannel(v, spec.brightness);
}

size_t SignalEncoder::FrameBytes(int led_count) const {
  const size_t slots = static_cast<size_t>(led_count) * channels_ * 8
    * timing_.slots_per_bit + timing_.reset_slots;
  return (slots + 7) / 8;
}

// Set "count" consecutive slots starting at "slot" high.
static inline void SetSlotsHigh(uint8_t *data, size_t slot, int count) {
  for (int i = 0; i < count; ++i, ++slot) {
    data[slot >> 3] |= 0x80 >> (slot & 0x07);
  }
}

void SignalEncoder::Encode(const Color *leds, int count,
                           SignalFrame *out) const {
  out->slot_rate_hz = timing_.slot_rate_hz;
  out->data.assign(FrameBytes(count), 0);  // Everything low, incl. reset.
  uint8_t *const data = out->data.data();

  size_t slot = 0;
  for (int i = 0; i < count; ++i) {
    // Brightness first, so it doesn't matter in what order channels go out.
    const uint8_t scaled[4] = {
      brightness_lookup_[leds[i].r],
      brightness_lookup_[leds[i].g],
      brightness_lookup_[leds[i].b],
      brightness_lookup_[leds[i].w],
    };
    for (int c = 0; c < channels_; ++c) {
      const uint8_t value = scaled[fetch_[c]];
      for (uint8_t mask = 0x80; mask != 0; mask >>= 1) {
        SetSlotsHigh(data, slot, (value & mask)
                     ? timing_.high_slots_one
                     : timing_.high_slots_zero);
        slot += timing_.slots_per_bit;
      }
    }
  }

  if (invert_) {
    for (size_t i = 0; i < out->data.size(); ++i) {
      data[i] ^= 0xFF;
    }
  }
}

int64_t SignalEncoder::DeadlineMicros(const SignalFrame &frame) {
  return 4 * frame.DurationMicros() + 5000;
}

}  // namespace internal
}  // namespace bci_display
