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

#include <unity.h>

#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "led-display.h"
#include "mocks/fake-transport.h"

using namespace bci_display;
using bci_display::testing::FakeTransport;
using bci_display::testing::RecordingSurface;
using bci_display::testing::SurfaceLog;
using bci_display::testing::TempDir;
using bci_display::testing::TestSpec;
using bci_display::testing::TransportLog;

namespace {
struct BackendLog {
  BackendLog() : initializes(0), renders(0), shutdowns(0), init_width(0),
                 init_height(0), fail_render(false) {}
  int initializes;
  int renders;
  int shutdowns;
  int init_width;
  int init_height;
  bool fail_render;
  std::vector<Color> last_pixels;
};

// Backend that only counts. With a native size of 0x0 it adopts sizes.
class CountingBackend : public DisplayBackend {
public:
  CountingBackend(BackendLog *log, int width, int height)
    : log_(log), width_(width), height_(height) {}

  virtual bool NativeSize(int *width, int *height) const {
    if (width_ <= 0) return false;
    *width = width_;
    *height = height_;
    return true;
  }
  virtual bool Initialize(int width, int height, DisplayError *) {
    ++log_->initializes;
    log_->init_width = width;
    log_->init_height = height;
    return true;
  }
  virtual bool Render(const FrameBuffer &frame, DisplayError *err) {
    ++log_->renders;
    if (log_->fail_render)
      return SetError(err, kHardwareTimeoutError, "render failed");
    log_->last_pixels.assign(frame.data(),
                             frame.data() + frame.width() * frame.height());
    return true;
  }
  virtual void Shutdown() { ++log_->shutdowns; }

private:
  BackendLog *const log_;
  const int width_;
  const int height_;
};
}  // namespace

static TempDir *sTempDir = NULL;
static const Color kRed(255, 0, 0);
static const Color kBlue(0, 0, 255);
static const Color kBlack;

// Write a width x height PNG of a single color, return its path.
static std::string WriteImage(const char *name, int width, int height,
                              const Color &color) {
  cv::Mat bgr(height, width, CV_8UC3, cv::Scalar(color.b, color.g, color.r));
  const std::string path = sTempDir->path() + "/" + name;
  TEST_ASSERT_TRUE(cv::imwrite(path, bgr));
  return path;
}

static void AssertAll(const Color &expected,
                      const std::vector<Color> &pixels) {
  TEST_ASSERT_TRUE(pixels.size() > 0);
  for (size_t i = 0; i < pixels.size(); ++i)
    TEST_ASSERT_TRUE(expected == pixels[i]);
}

void setUp(void) {
  sTempDir = new TempDir();
}

void tearDown(void) {
  delete sTempDir;
  sTempDir = NULL;
}

void test_show_scales_to_native_size(void) {
  BackendLog log;
  DisplayController display(new CountingBackend(&log, 4, 4));
  TEST_ASSERT_NOT_NULL(display.frame());
  DisplayError err;
  TEST_ASSERT_TRUE(display.Show(WriteImage("red.png", 2, 2, kRed).c_str(),
                                &err));
  TEST_ASSERT_EQUAL(1, log.initializes);
  TEST_ASSERT_EQUAL(4, log.init_width);
  TEST_ASSERT_EQUAL(4, log.init_height);
  TEST_ASSERT_EQUAL(1, log.renders);
  TEST_ASSERT_EQUAL(16, log.last_pixels.size());
  AssertAll(kRed, log.last_pixels);

  // Initialized once only.
  TEST_ASSERT_TRUE(display.Show(WriteImage("blue.png", 8, 8, kBlue).c_str(),
                                &err));
  TEST_ASSERT_EQUAL(1, log.initializes);
  TEST_ASSERT_EQUAL(2, log.renders);
  AssertAll(kBlue, log.last_pixels);
}

void test_decode_error_keeps_controller_usable(void) {
  BackendLog log;
  DisplayController display(new CountingBackend(&log, 2, 2));
  DisplayError err;
  const std::string missing = sTempDir->path() + "/missing.png";
  TEST_ASSERT_FALSE(display.Show(missing.c_str(), &err));
  TEST_ASSERT_EQUAL(kDecodeError, err.kind);
  TEST_ASSERT_TRUE(err.message.find("missing.png") != std::string::npos);
  TEST_ASSERT_EQUAL(0, log.renders);

  err.Reset();
  TEST_ASSERT_TRUE(display.Show(WriteImage("ok.png", 2, 2, kRed).c_str(),
                                &err));
  TEST_ASSERT_EQUAL(1, log.renders);
}

void test_close_shuts_down_exactly_once(void) {
  BackendLog log;
  {
    DisplayController display(new CountingBackend(&log, 2, 2));
    DisplayError err;
    TEST_ASSERT_TRUE(display.Show(WriteImage("a.png", 2, 2, kRed).c_str(),
                                  &err));
    display.Close();
    TEST_ASSERT_EQUAL(1, log.shutdowns);
    display.Close();
    TEST_ASSERT_EQUAL(1, log.shutdowns);
    TEST_ASSERT_TRUE(display.closed());
  }
  TEST_ASSERT_EQUAL(1, log.shutdowns);   // Not again in the destructor.
}

void test_destructor_closes(void) {
  BackendLog log;
  {
    DisplayController display(new CountingBackend(&log, 2, 2));
  }
  TEST_ASSERT_EQUAL(1, log.shutdowns);
}

void test_close_after_failed_render(void) {
  BackendLog log;
  log.fail_render = true;
  DisplayController display(new CountingBackend(&log, 2, 2));
  DisplayError err;
  TEST_ASSERT_FALSE(display.Show(WriteImage("a.png", 2, 2, kRed).c_str(),
                                 &err));
  TEST_ASSERT_EQUAL(kHardwareTimeoutError, err.kind);
  display.Close();
  TEST_ASSERT_EQUAL(1, log.shutdowns);
}

void test_operations_after_close_fail(void) {
  BackendLog log;
  DisplayController display(new CountingBackend(&log, 2, 2));
  display.Close();
  DisplayError err;
  TEST_ASSERT_FALSE(display.Show(WriteImage("a.png", 2, 2, kRed).c_str(),
                                 &err));
  TEST_ASSERT_EQUAL(kDisplayUnavailableError, err.kind);
  err.Reset();
  TEST_ASSERT_FALSE(display.Clear(&err));
  TEST_ASSERT_EQUAL(kDisplayUnavailableError, err.kind);
  err.Reset();
  TEST_ASSERT_FALSE(display.SetZoom(2.0f, &err));
  TEST_ASSERT_EQUAL(kDisplayUnavailableError, err.kind);
  TEST_ASSERT_EQUAL(0, log.renders);
}

void test_clear(void) {
  BackendLog log;
  DisplayController adopting(new CountingBackend(&log, 0, 0));
  DisplayError err;
  TEST_ASSERT_TRUE(adopting.Clear(&err));   // Nothing to clear yet.
  TEST_ASSERT_EQUAL(0, log.renders);
  TEST_ASSERT_NULL(adopting.frame());

  TEST_ASSERT_TRUE(adopting.Show(WriteImage("a.png", 3, 2, kRed).c_str(),
                                 &err));
  TEST_ASSERT_EQUAL(3, log.init_width);
  TEST_ASSERT_EQUAL(2, log.init_height);
  TEST_ASSERT_TRUE(adopting.Clear(&err));
  TEST_ASSERT_EQUAL(2, log.renders);
  AssertAll(kBlack, log.last_pixels);
}

void test_adopted_size_stays_fixed(void) {
  BackendLog log;
  DisplayController display(new CountingBackend(&log, 0, 0));
  FrameBuffer small(2, 2);
  small.Fill(kRed);
  FrameBuffer large(6, 6);
  large.Fill(kBlue);
  DisplayError err;
  TEST_ASSERT_TRUE(display.ShowFrame(small, &err));
  TEST_ASSERT_TRUE(display.ShowFrame(large, &err));
  TEST_ASSERT_EQUAL(1, log.initializes);
  TEST_ASSERT_EQUAL(4, log.last_pixels.size());
  AssertAll(kBlue, log.last_pixels);
}

void test_zoom(void) {
  BackendLog log;
  DisplayController display(new CountingBackend(&log, 4, 4));
  // Blue border around a red 2x2 center.
  FrameBuffer source(4, 4);
  source.Fill(kBlue);
  for (int y = 1; y <= 2; ++y)
    for (int x = 1; x <= 2; ++x)
      source.SetPixel(x, y, kRed);

  DisplayError err;
  TEST_ASSERT_TRUE(display.ShowFrame(source, &err));
  TEST_ASSERT_TRUE(log.last_pixels[0] == kBlue);

  TEST_ASSERT_TRUE(display.SetZoom(2.0f, &err));
  TEST_ASSERT_EQUAL(2, log.renders);
  AssertAll(kRed, log.last_pixels);

  // Zoomed out, the area around the image is black.
  TEST_ASSERT_TRUE(display.SetZoom(0.5f, &err));
  TEST_ASSERT_TRUE(log.last_pixels[0] == kBlack);
  TEST_ASSERT_TRUE(log.last_pixels[2 * 4 + 2] == kRed);

  TEST_ASSERT_FALSE(display.SetZoom(10.0f, &err));
  TEST_ASSERT_EQUAL(kOutOfRangeError, err.kind);
  TEST_ASSERT_FALSE(display.SetZoom(0.0f, &err));
  TEST_ASSERT_EQUAL_FLOAT(0.5f, display.zoom());
  TEST_ASSERT_EQUAL(3, log.renders);
}

void test_zoom_keys_double_and_halve(void) {
  BackendLog log;
  DisplayController display(new CountingBackend(&log, 4, 4));
  DisplayError err;
  TEST_ASSERT_TRUE(display.ZoomIn(&err));
  TEST_ASSERT_EQUAL_FLOAT(2.0f, display.zoom());
  TEST_ASSERT_TRUE(display.ZoomIn(&err));
  TEST_ASSERT_TRUE(display.ZoomIn(&err));
  TEST_ASSERT_EQUAL_FLOAT(8.0f, display.zoom());
  TEST_ASSERT_FALSE(display.ZoomIn(&err));
  TEST_ASSERT_EQUAL(kOutOfRangeError, err.kind);
  TEST_ASSERT_EQUAL_FLOAT(8.0f, display.zoom());

  for (int i = 0; i < 6; ++i)
    TEST_ASSERT_TRUE(display.ZoomOut(&err));
  TEST_ASSERT_EQUAL_FLOAT(0.125f, display.zoom());
  TEST_ASSERT_FALSE(display.ZoomOut(&err));
  TEST_ASSERT_EQUAL(0, log.renders);   // Nothing shown yet.
}

void test_invalid_native_size_is_config_error(void) {
  // A matrix without columns, built directly instead of from options.
  TransportLog transport_log;
  MatrixSpec spec = TestSpec(sTempDir->path(), 0, 8);
  DisplayController display(
    new MatrixDisplay(spec, new FakeTransport(&transport_log)));
  TEST_ASSERT_NULL(display.frame());

  DisplayError err;
  TEST_ASSERT_FALSE(display.Show(WriteImage("red.png", 2, 2, kRed).c_str(),
                                 &err));
  TEST_ASSERT_EQUAL(kConfigError, err.kind);

  FrameBuffer image(2, 2);
  err.Reset();
  TEST_ASSERT_FALSE(display.ShowFrame(image, &err));
  TEST_ASSERT_EQUAL(kConfigError, err.kind);
  err.Reset();
  TEST_ASSERT_FALSE(display.Clear(&err));
  TEST_ASSERT_EQUAL(kConfigError, err.kind);
  TEST_ASSERT_EQUAL(0, transport_log.opens);
}

void test_emulated_display_end_to_end(void) {
  SurfaceLog surface_log;
  WindowOptions window;
  window.scale = 10;
  window.title = "ghost";
  DisplayController *display = new DisplayController(
    new EmulatedDisplay(window, new RecordingSurface(&surface_log)));
  TEST_ASSERT_NULL(display->frame());

  DisplayError err;
  TEST_ASSERT_TRUE(display->Show(WriteImage("red.png", 2, 2, kRed).c_str(),
                                 &err));
  TEST_ASSERT_EQUAL(1, surface_log.opens);
  TEST_ASSERT_EQUAL_STRING("ghost", surface_log.title.c_str());
  TEST_ASSERT_EQUAL(20, surface_log.width);
  TEST_ASSERT_EQUAL(20, surface_log.height);
  TEST_ASSERT_EQUAL(1, surface_log.shows);
  TEST_ASSERT_EQUAL(10, surface_log.last_scale);
  TEST_ASSERT_EQUAL(2, surface_log.last_frame_width);
  TEST_ASSERT_EQUAL(2, surface_log.last_frame_height);
  AssertAll(kRed, surface_log.last_pixels);
  TEST_ASSERT_NOT_NULL(display->frame());
  for (int y = 0; y < 2; ++y) {
    for (int x = 0; x < 2; ++x) {
      Color c;
      TEST_ASSERT_TRUE(display->frame()->GetPixel(x, y, &c));
      TEST_ASSERT_TRUE(c == kRed);
    }
  }

  delete display;
  TEST_ASSERT_EQUAL(1, surface_log.closes);
}

void test_emulated_display_without_windowing(void) {
  SurfaceLog surface_log;
  RecordingSurface *surface = new RecordingSurface(&surface_log);
  surface->set_unavailable(true);
  DisplayController display(new EmulatedDisplay(WindowOptions(), surface));
  DisplayError err;
  TEST_ASSERT_FALSE(display.Show(WriteImage("red.png", 2, 2, kRed).c_str(),
                                 &err));
  TEST_ASSERT_EQUAL(kDisplayUnavailableError, err.kind);
  TEST_ASSERT_EQUAL(0, surface_log.shows);
}

void test_create_from_options(void) {
  DisplayError err;
  DisplayOptions options;
  options.display_type = "hologram";
  TEST_ASSERT_NULL(DisplayController::CreateFromOptions(options, &err));
  TEST_ASSERT_EQUAL(kConfigError, err.kind);

  // An invalid MatrixSpec is found before any hardware is touched.
  err.Reset();
  options.display_type = "External";
  options.matrix.led_count = 63;
  TEST_ASSERT_NULL(DisplayController::CreateFromOptions(options, &err));
  TEST_ASSERT_EQUAL(kConfigError, err.kind);

  // Backends are created lazily; nothing is opened here.
  err.Reset();
  options.matrix.led_count = 64;
  options.matrix.lock_dir = sTempDir->path();
  DisplayController *display =
    DisplayController::CreateFromOptions(options, &err);
  TEST_ASSERT_NOT_NULL(display);
  TEST_ASSERT_NOT_NULL(dynamic_cast<MatrixDisplay*>(display->backend()));
  TEST_ASSERT_NOT_NULL(display->frame());
  TEST_ASSERT_EQUAL(8, display->frame()->width());
  delete display;

  options.display_type = "emulated";
  display = DisplayController::CreateFromOptions(options, &err);
  TEST_ASSERT_NOT_NULL(display);
  TEST_ASSERT_NOT_NULL(dynamic_cast<EmulatedDisplay*>(display->backend()));
  delete display;
}

int main(int argc, char **argv) {
  UNITY_BEGIN();
  RUN_TEST(test_show_scales_to_native_size);
  RUN_TEST(test_decode_error_keeps_controller_usable);
  RUN_TEST(test_close_shuts_down_exactly_once);
  RUN_TEST(test_destructor_closes);
  RUN_TEST(test_close_after_failed_render);
  RUN_TEST(test_operations_after_close_fail);
  RUN_TEST(test_clear);
  RUN_TEST(test_adopted_size_stays_fixed);
  RUN_TEST(test_zoom);
  RUN_TEST(test_zoom_keys_double_and_halve);
  RUN_TEST(test_invalid_native_size_is_config_error);
  RUN_TEST(test_emulated_display_end_to_end);
  RUN_TEST(test_emulated_display_without_windowing);
  RUN_TEST(test_create_from_options);
  return UNITY_END();
}
