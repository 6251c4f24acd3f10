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

#include <vector>

#include "pixel-mapper.h"

using namespace bci_display;

void setUp(void) {}
void tearDown(void) {}

void test_row_major_is_plain_raster_order(void) {
  TEST_ASSERT_EQUAL(0, MapToLedIndex(0, 0, 8, 8, kRowMajor));
  TEST_ASSERT_EQUAL(7, MapToLedIndex(7, 0, 8, 8, kRowMajor));
  TEST_ASSERT_EQUAL(8, MapToLedIndex(0, 1, 8, 8, kRowMajor));
  TEST_ASSERT_EQUAL(63, MapToLedIndex(7, 7, 8, 8, kRowMajor));
}

void test_serpentine_row_reverses_odd_rows(void) {
  // 4x3: row 1 runs right to left.
  TEST_ASSERT_EQUAL(0, MapToLedIndex(0, 0, 4, 3, kSerpentineRow));
  TEST_ASSERT_EQUAL(3, MapToLedIndex(3, 0, 4, 3, kSerpentineRow));
  TEST_ASSERT_EQUAL(7, MapToLedIndex(0, 1, 4, 3, kSerpentineRow));
  TEST_ASSERT_EQUAL(4, MapToLedIndex(3, 1, 4, 3, kSerpentineRow));
  TEST_ASSERT_EQUAL(8, MapToLedIndex(0, 2, 4, 3, kSerpentineRow));

  TEST_ASSERT_EQUAL(0, MapToLedIndex(0, 0, 4, 2, kSerpentineRow));
  TEST_ASSERT_EQUAL(3, MapToLedIndex(3, 0, 4, 2, kSerpentineRow));
  TEST_ASSERT_EQUAL(7, MapToLedIndex(0, 1, 4, 2, kSerpentineRow));
  TEST_ASSERT_EQUAL(4, MapToLedIndex(3, 1, 4, 2, kSerpentineRow));
}

void test_column_topologies(void) {
  TEST_ASSERT_EQUAL(0, MapToLedIndex(0, 0, 4, 3, kColumnMajor));
  TEST_ASSERT_EQUAL(2, MapToLedIndex(0, 2, 4, 3, kColumnMajor));
  TEST_ASSERT_EQUAL(3, MapToLedIndex(1, 0, 4, 3, kColumnMajor));

  // Column 1 runs bottom to top.
  TEST_ASSERT_EQUAL(5, MapToLedIndex(1, 0, 4, 3, kSerpentineColumn));
  TEST_ASSERT_EQUAL(3, MapToLedIndex(1, 2, 4, 3, kSerpentineColumn));
  TEST_ASSERT_EQUAL(6, MapToLedIndex(2, 0, 4, 3, kSerpentineColumn));
}

void test_out_of_range_reports_minus_one(void) {
  TEST_ASSERT_EQUAL(-1, MapToLedIndex(8, 0, 8, 8, kRowMajor));
  TEST_ASSERT_EQUAL(-1, MapToLedIndex(0, 8, 8, 8, kSerpentineRow));
  TEST_ASSERT_EQUAL(-1, MapToLedIndex(-1, 0, 8, 8, kColumnMajor));
  TEST_ASSERT_EQUAL(-1, MapToLedIndex(0, 0, 0, 8, kRowMajor));
  TEST_ASSERT_EQUAL(-1, MapToLedIndex(0, 0, 8, -1, kSerpentineColumn));
}

void test_every_topology_is_a_bijection(void) {
  const WiringTopology topologies[] = {
    kRowMajor, kSerpentineRow, kColumnMajor, kSerpentineColumn
  };
  const int width = 5, height = 3;
  for (int t = 0; t < 4; ++t) {
    std::vector<int> hits(width * height, 0);
    for (int y = 0; y < height; ++y) {
      for (int x = 0; x < width; ++x) {
        const int index = MapToLedIndex(x, y, width, height, topologies[t]);
        TEST_ASSERT_TRUE(index >= 0 && index < width * height);
        ++hits[index];
      }
    }
    for (int i = 0; i < width * height; ++i)
      TEST_ASSERT_EQUAL(1, hits[i]);
  }
}

void test_lookup_table_agrees_with_function(void) {
  DisplayError err;
  LedIndexMap *map = LedIndexMap::Create(6, 4, kSerpentineColumn, 24, &err);
  TEST_ASSERT_NOT_NULL(map);
  for (int y = 0; y < 4; ++y) {
    for (int x = 0; x < 6; ++x) {
      TEST_ASSERT_EQUAL(MapToLedIndex(x, y, 6, 4, kSerpentineColumn),
                        map->get(x, y));
    }
  }
  TEST_ASSERT_EQUAL(-1, map->get(6, 0));
  TEST_ASSERT_EQUAL(-1, map->get(0, -1));
  delete map;
}

void test_lookup_table_rejects_count_mismatch(void) {
  DisplayError err;
  TEST_ASSERT_NULL(LedIndexMap::Create(8, 8, kRowMajor, 60, &err));
  TEST_ASSERT_EQUAL(kConfigError, err.kind);

  err.Reset();
  TEST_ASSERT_NULL(LedIndexMap::Create(0, 8, kRowMajor, 0, &err));
  TEST_ASSERT_EQUAL(kConfigError, err.kind);
}

void test_oversized_grid_is_rejected(void) {
  // 65536 * 65536 wraps to 0 in an int.
  DisplayError err;
  TEST_ASSERT_NULL(LedIndexMap::Create(65536, 65536, kRowMajor, 0, &err));
  TEST_ASSERT_EQUAL(kConfigError, err.kind);
  TEST_ASSERT_EQUAL(-1, MapToLedIndex(65535, 65535, 65536, 65536,
                                      kRowMajor));
  TEST_ASSERT_EQUAL(-1, MapToLedIndex(0, 0, 65536, 65536, kSerpentineColumn));
}

void test_topology_names(void) {
  WiringTopology topology = kRowMajor;
  TEST_ASSERT_TRUE(ParseWiringTopology("Serpentine-Row", &topology));
  TEST_ASSERT_EQUAL(kSerpentineRow, topology);
  TEST_ASSERT_TRUE(ParseWiringTopology("column-major", &topology));
  TEST_ASSERT_EQUAL(kColumnMajor, topology);
  TEST_ASSERT_FALSE(ParseWiringTopology("zigzag", &topology));
  TEST_ASSERT_EQUAL(kColumnMajor, topology);
  TEST_ASSERT_EQUAL_STRING("serpentine-column",
                           WiringTopologyName(kSerpentineColumn));
}

int main(int argc, char **argv) {
  UNITY_BEGIN();
  RUN_TEST(test_row_major_is_plain_raster_order);
  RUN_TEST(test_serpentine_row_reverses_odd_rows);
  RUN_TEST(test_column_topologies);
  RUN_TEST(test_out_of_range_reports_minus_one);
  RUN_TEST(test_every_topology_is_a_bijection);
  RUN_TEST(test_lookup_table_agrees_with_function);
  RUN_TEST(test_lookup_table_rejects_count_mismatch);
  RUN_TEST(test_oversized_grid_is_rejected);
  RUN_TEST(test_topology_names);
  return UNITY_END();
}
