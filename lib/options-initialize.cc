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

#include <string.h>

#include <vector>

#include "string-util.h"

namespace bci_display {
using internal::ParseFloat;
using internal::ParseInt;
using internal::StrCaseEqual;

bool ParseResizePolicy(const char *name, ResizePolicy *policy) {
  if (name == NULL) return false;
  if (StrCaseEqual(name, "nearest")) { *policy = kResizeNearest; return true; }
  if (StrCaseEqual(name, "box")) { *policy = kResizeBox; return true; }
  return false;
}

static const char *ResizePolicyName(ResizePolicy policy) {
  return policy == kResizeBox ? "box" : "nearest";
}

DisplayOptions::DisplayOptions()
  : display_type("external"), resize(kResizeNearest) {
}

bool DisplayOptions::Validate(DisplayError *err) const {
  const char *type = display_type.c_str();
  if (StrCaseEqual(type, "external")) {
    return matrix.Validate(err);
  }
  if (StrCaseEqual(type, "internal") || StrCaseEqual(type, "emulated")) {
    if (window.scale < 1)
      return SetError(err, kConfigError, "--window-scale=%d: must be >= 1",
                      window.scale);
    return true;
  }
  return SetError(err, kConfigError, "Unknown display type '%s'; expected "
                  "'external', 'internal' or 'emulated'", type);
}

// Flag parsing. A flag is given as --flag=value or --flag value; in the
// latter case the value is consumed from the next argument.
namespace {
class FlagParser {
public:
  FlagParser(int argc, char **argv) : argc_(argc), argv_(argv), pos_(0) {}

  bool Done() const { return pos_ >= argc_; }
  const char *current() const { return argv_[pos_]; }
  void Skip() { ++pos_; }

  // If current argument is "flag", get its value, advancing past it.
  // Returns false if this is not the flag. On a missing value, *value is
  // NULL.
  bool Consume(const char *flag, const char **value) {
    if (Done()) return false;
    const char *arg = argv_[pos_];
    const size_t len = strlen(flag);
    if (strncmp(arg, flag, len) != 0) return false;
    if (arg[len] == '=') {
      *value = arg + len + 1;
      ++pos_;
      return true;
    }
    if (arg[len] != '\0') return false;
    ++pos_;
    *value = (pos_ < argc_) ? argv_[pos_++] : NULL;
    return true;
  }

  // Flags without value.
  bool ConsumeBool(const char *flag) {
    if (Done()) return false;
    if (strcmp(argv_[pos_], flag) != 0) return false;
    ++pos_;
    return true;
  }

private:
  const int argc_;
  char **const argv_;
  int pos_;
};
}  // namespace

static bool MissingValue(const char *flag, DisplayError *err) {
  return SetError(err, kConfigError, "%s needs a value", flag);
}

static bool ConsumeIntFlag(FlagParser *parser, const char *flag, int *result,
                           bool *consumed, DisplayError *err) {
  const char *value;
  if (*consumed || !parser->Consume(flag, &value)) return true;
  *consumed = true;
  if (value == NULL) return MissingValue(flag, err);
  if (!ParseInt(value, result))
    return SetError(err, kConfigError, "%s=%s: not a number", flag, value);
  return true;
}

static bool ConsumeStringFlag(FlagParser *parser, const char *flag,
                              std::string *result, bool *consumed,
                              DisplayError *err) {
  const char *value;
  if (*consumed || !parser->Consume(flag, &value)) return true;
  *consumed = true;
  if (value == NULL) return MissingValue(flag, err);
  *result = value;
  return true;
}

// Brightness is given as fraction (0.5) or percent (50%).
static bool ParseBrightness(const char *value, float *result) {
  std::string str(value);
  bool percent = false;
  if (!str.empty() && str[str.size() - 1] == '%') {
    percent = true;
    str.erase(str.size() - 1);
  }
  float parsed;
  if (!ParseFloat(str.c_str(), &parsed)) return false;
  *result = percent ? parsed / 100.0f : parsed;
  return true;
}

bool ParseOptionsFromFlags(int *argc, char ***argv, DisplayOptions *options,
                           DisplayError *err) {
  std::vector<char*> unused;
  unused.push_back((*argv)[0]);  // Program name.

  FlagParser parser(*argc, *argv);
  parser.Skip();
  while (!parser.Done()) {
    const char *arg = parser.current();
    if (strcmp(arg, "--") == 0) {
      // Everything after is not for us.
      unused.push_back(const_cast<char*>(arg));
      parser.Skip();
      while (!parser.Done()) {
        unused.push_back(const_cast<char*>(parser.current()));
        parser.Skip();
      }
      break;
    }
    if (strncmp(arg, "--led-", 6) != 0 && strncmp(arg, "--window-", 9) != 0) {
      unused.push_back(const_cast<char*>(arg));
      parser.Skip();
      continue;
    }

    MatrixSpec *const m = &options->matrix;
    bool consumed = false;
    const char *value;
    if (!ConsumeStringFlag(&parser, "--led-display", &options->display_type,
                           &consumed, err)
        || !ConsumeIntFlag(&parser, "--led-gpio", &m->gpio_pin,
                           &consumed, err)
        || !ConsumeIntFlag(&parser, "--led-count", &m->led_count,
                           &consumed, err)
        || !ConsumeIntFlag(&parser, "--led-freq", &m->led_freq_hz,
                           &consumed, err)
        || !ConsumeIntFlag(&parser, "--led-dma", &m->dma_channel,
                           &consumed, err)
        || !ConsumeIntFlag(&parser, "--led-cols", &m->width_count,
                           &consumed, err)
        || !ConsumeIntFlag(&parser, "--led-rows", &m->height_count,
                           &consumed, err)
        || !ConsumeStringFlag(&parser, "--led-sequence", &m->led_sequence,
                              &consumed, err)
        || !ConsumeIntFlag(&parser, "--led-t0h-ns", &m->t0h_ns,
                           &consumed, err)
        || !ConsumeIntFlag(&parser, "--led-t1h-ns", &m->t1h_ns,
                           &consumed, err)
        || !ConsumeIntFlag(&parser, "--led-reset-us", &m->reset_us,
                           &consumed, err)
        || !ConsumeIntFlag(&parser, "--led-slots-per-bit", &m->slots_per_bit,
                           &consumed, err)
        || !ConsumeStringFlag(&parser, "--led-device", &m->device,
                              &consumed, err)
        || !ConsumeStringFlag(&parser, "--led-lock-dir", &m->lock_dir,
                              &consumed, err)
        || !ConsumeIntFlag(&parser, "--window-scale", &options->window.scale,
                           &consumed, err)
        || !ConsumeStringFlag(&parser, "--window-title",
                              &options->window.title, &consumed, err)) {
      return false;
    }
    if (consumed) continue;

    if (parser.ConsumeBool("--led-invert")) {
      m->invert = true;
    } else if (parser.ConsumeBool("--led-no-invert")) {
      m->invert = false;
    } else if (parser.Consume("--led-brightness", &value)) {
      if (value == NULL) return MissingValue("--led-brightness", err);
      if (!ParseBrightness(value, &m->brightness))
        return SetError(err, kConfigError, "--led-brightness=%s: expected "
                        "0..1 or a percentage", value);
    } else if (parser.Consume("--led-wiring", &value)) {
      if (value == NULL) return MissingValue("--led-wiring", err);
      if (!ParseWiringTopology(value, &m->wiring))
        return SetError(err, kConfigError, "--led-wiring=%s: expected "
                        "row-major, serpentine-row, column-major or "
                        "serpentine-column", value);
    } else if (parser.Consume("--led-resize", &value)) {
      if (value == NULL) return MissingValue("--led-resize", err);
      if (!ParseResizePolicy(value, &options->resize))
        return SetError(err, kConfigError, "--led-resize=%s: expected "
                        "nearest or box", value);
    } else {
      return SetError(err, kConfigError, "Unknown flag %s", arg);
    }
  }

  for (size_t i = 0; i < unused.size(); ++i) {
    (*argv)[i] = unused[i];
  }
  *argc = static_cast<int>(unused.size());
  (*argv)[*argc] = NULL;
  return true;
}

void PrintDisplayFlags(FILE *out, const DisplayOptions &d) {
  const MatrixSpec &m = d.matrix;
  fprintf(out,
          "\t--led-display=<type>      : external (LED matrix), internal or "
          "emulated (window). Default: %s\n"
          "\t--led-gpio=<pin>          : Data GPIO. Default: %d\n"
          "\t--led-count=<n>           : LEDs on the chain. Default: %d\n"
          "\t--led-cols=<n>            : LEDs per row. Default: %d\n"
          "\t--led-rows=<n>            : Rows. Default: %d\n"
          "\t--led-wiring=<topology>   : row-major, serpentine-row, "
          "column-major, serpentine-column. Default: %s\n"
          "\t--led-freq=<hz>           : Data rate. Default: %d\n"
          "\t--led-dma=<channel>       : DMA channel 0..14. Default: %d\n"
          "\t--led-%sinvert          : Output %sinverted.\n"
          "\t--led-brightness=<b>      : 0..1 or percent. Default: %.2f\n"
          "\t--led-sequence=<order>    : Color order, e.g. GRB, RGBW. "
          "Default: %s\n"
          "\t--led-t0h-ns=<ns>         : High time of a 0 bit. Default: %d\n"
          "\t--led-t1h-ns=<ns>         : High time of a 1 bit. Default: %d\n"
          "\t--led-reset-us=<us>       : Latch gap. Default: %d\n"
          "\t--led-slots-per-bit=<n>   : PWM slots per bit. Default: %d\n"
          "\t--led-device=<path>       : Output device. Default: %s\n"
          "\t--led-lock-dir=<dir>      : GPIO/DMA lock files. Default: %s\n"
          "\t--led-resize=<policy>     : nearest or box. Default: %s\n"
          "\t--window-scale=<n>        : Screen pixels per pixel. "
          "Default: %d\n"
          "\t--window-title=<title>    : Window title. Default: %s\n",
          d.display_type.c_str(), m.gpio_pin, m.led_count, m.width_count,
          m.height_count, WiringTopologyName(m.wiring), m.led_freq_hz,
          m.dma_channel, m.invert ? "no-" : "", m.invert ? "not " : "",
          m.brightness, m.led_sequence.c_str(), m.t0h_ns, m.t1h_ns,
          m.reset_us, m.slots_per_bit, m.device.c_str(), m.lock_dir.c_str(),
          ResizePolicyName(d.resize), d.window.scale,
          d.window.title.c_str());
}

}  // namespace bci_display
