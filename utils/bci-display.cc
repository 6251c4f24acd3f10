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

// Show an image on the LED matrix or in a window until interrupted.
//
//   bci-display --led-cols=16 --led-rows=16 --led-count=256 ghost.png
//   bci-display --led-display=emulated --window-scale=20 pacman.jpg

#include "led-display.h"

#include <poll.h>
#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

using bci_display::DisplayController;
using bci_display::DisplayError;
using bci_display::DisplayOptions;
using bci_display::EmulatedDisplay;

volatile bool interrupt_received = false;
static void InterruptHandler(int signo) {
  interrupt_received = true;
}

static int usage(const char *progname) {
  fprintf(stderr, "usage: %s [options] <image>\n", progname);
  fprintf(stderr, "Shows the image until interrupted. Keys: '+'/'-' zoom, "
          "'q' quit.\nOptions:\n");
  bci_display::PrintDisplayFlags(stderr);
  return 2;
}

static int ReportError(const DisplayError &err) {
  fprintf(stderr, "%s: %s\n", bci_display::ErrorKindName(err.kind),
          err.message.c_str());
  return 1;
}

// Apply a key; returns false if it asks us to quit.
static bool HandleKey(int key, DisplayController *display) {
  DisplayError err;
  switch (key) {
  case '+': case '=':
    if (!display->ZoomIn(&err))
      fprintf(stderr, "%s\n", err.message.c_str());
    return true;
  case '-': case '_':
    if (!display->ZoomOut(&err))
      fprintf(stderr, "%s\n", err.message.c_str());
    return true;
  case 'q': case 'Q': case 27:  // ESC
    return false;
  default:
    return true;
  }
}

// Window: HighGUI delivers the keys and tells us if the window got closed.
static void RunWindowLoop(EmulatedDisplay *window, DisplayController *display) {
  while (!interrupt_received && window->IsOpen()) {
    const int key = window->PollKey(100);
    if (key >= 0 && !HandleKey(key & 0xFF, display))
      break;
  }
}

// Matrix: keys come from stdin.
static void RunTerminalLoop(DisplayController *display) {
  if (isatty(STDIN_FILENO))
    fprintf(stderr, "Press '+'/'-' and <RETURN> to zoom, 'q' to quit, "
            "CTRL-C to exit.\n");
  bool stdin_open = true;
  while (!interrupt_received) {
    struct pollfd pfd;
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    pfd.revents = 0;
    if (!stdin_open) {
      usleep(100 * 1000);
      continue;
    }
    if (poll(&pfd, 1, 100) <= 0)
      continue;
    char c;
    if (read(STDIN_FILENO, &c, 1) != 1) {
      stdin_open = false;  // EOF; keep showing until a signal.
      continue;
    }
    if (!HandleKey(c, display))
      break;
  }
}

int main(int argc, char *argv[]) {
  DisplayOptions options;
  DisplayError err;
  if (!bci_display::ParseOptionsFromFlags(&argc, &argv, &options, &err)) {
    fprintf(stderr, "%s\n", err.message.c_str());
    return usage(argv[0]);
  }
  if (argc != 2)
    return usage(argv[0]);
  const char *image_path = argv[1];

  // Title the window after the image.
  if (options.window.title == DisplayOptions().window.title) {
    const char *base = strrchr(image_path, '/');
    options.window.title = base ? base + 1 : image_path;
  }

  DisplayController *display = DisplayController::CreateFromOptions(options,
                                                                    &err);
  if (display == NULL)
    return ReportError(err);

  signal(SIGTERM, InterruptHandler);
  signal(SIGINT, InterruptHandler);

  int exit_code = 0;
  if (!display->Show(image_path, &err)) {
    exit_code = ReportError(err);
  } else {
    EmulatedDisplay *window =
      dynamic_cast<EmulatedDisplay*>(display->backend());
    if (window)
      RunWindowLoop(window, display);
    else
      RunTerminalLoop(display);
  }

  if (interrupt_received)
    fprintf(stderr, "Received signal, exiting.\n");

  // Switches the LEDs off / closes the window.
  display->Close();
  delete display;
  return exit_code;
}
