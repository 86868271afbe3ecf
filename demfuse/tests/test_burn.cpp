// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_burn.cpp
 *
 * Tests for burning river bed levels into an elevation raster.
 */

#include <gtest/gtest.h>

#include "demfuse/bathymetry/burn.hpp"
#include "demfuse/errors.hpp"

using namespace demfuse;

// ─── Fixture ────────────────────────────────────────────────────────────────

/// 3x6 grid with 100 m cells; the middle row is a river flowing east.
class BurnTest : public ::testing::Test {
 protected:
  Raster elevation;
  FlowDirRaster flwdir;
  RiverSegmentTable table;
  Mask mask;

  void SetUp() override {
    Eigen::MatrixXd z = Eigen::MatrixXd::Constant(3, 6, 20.0);
    Eigen::MatrixXd d8 = Eigen::MatrixXd::Constant(3, 6, 247);
    for (int c = 0; c < 6; ++c) {
      z(1, c) = 10.0 - c;
      d8(1, c) = 1;
    }
    d8(1, 5) = 0;
    elevation = Raster(z, GeoTransform::northUp(0.0, 300.0, 100.0), {}, -9999.0,
                       DataType::Float64);
    flwdir = FlowDirRaster::fromD8(
        Raster(d8, elevation.transform(), {}, 255.0, DataType::UInt8));

    mask = Mask::Constant(3, 6, false);
    mask.row(1).setConstant(true);

    RiverSegment up;
    up.segid = 1;
    up.geometry = {Point(50.0, 150.0), Point(250.0, 150.0), Point(350.0, 150.0)};
    up.rivdst = 500.0;
    up.zb = 5.0;
    up.rivslp = 0.01;
    RiverSegment down;
    down.segid = 2;
    down.geometry = {Point(350.0, 150.0), Point(550.0, 150.0)};
    down.rivdst = 200.0;
    down.zb = 2.0;
    down.rivslp = 0.005;
    table = {up, down};
  }
};

// ─── Burning ────────────────────────────────────────────────────────────────

TEST_F(BurnTest, BedFollowsSegmentSlope) {
  Raster out = burnRiverZb(table, elevation, mask, &flwdir, false);
  EXPECT_DOUBLE_EQ(out(1, 0), 5.0);
  EXPECT_DOUBLE_EQ(out(1, 2), 3.0);   // 200 m below the head at 1 %
  EXPECT_DOUBLE_EQ(out(1, 3), 2.0);
  EXPECT_DOUBLE_EQ(out(1, 5), 1.0);
}

TEST_F(BurnTest, OutsideMaskUnchanged) {
  Raster out = burnRiverZb(table, elevation, mask, &flwdir, true);
  for (int c = 0; c < 6; ++c) {
    EXPECT_DOUBLE_EQ(out(0, c), 20.0);
    EXPECT_DOUBLE_EQ(out(2, c), 20.0);
    EXPECT_LE(out(1, c), elevation(1, c));
  }
}

TEST_F(BurnTest, NeverRaisesTheDem) {
  table[0].zb = 50.0;
  table[0].rivslp = 0.0;
  Raster out = burnRiverZb(table, elevation, mask, &flwdir, false);
  EXPECT_DOUBLE_EQ(out(1, 0), 10.0);
  EXPECT_DOUBLE_EQ(out(1, 1), 9.0);
}

TEST_F(BurnTest, ConstantBedWithoutFlowNetwork) {
  Raster out = burnRiverZb(table, elevation, mask);
  EXPECT_DOUBLE_EQ(out(1, 0), 5.0);
  EXPECT_DOUBLE_EQ(out(1, 2), 5.0);
  EXPECT_DOUBLE_EQ(out(1, 4), 2.0);
}

TEST_F(BurnTest, MaskCellsAwayFromLinesGetNearestBed) {
  mask(0, 0) = true;
  Raster out = burnRiverZb(table, elevation, mask, &flwdir, false);
  EXPECT_DOUBLE_EQ(out(0, 0), 5.0);
}

TEST_F(BurnTest, NodataPreserved) {
  elevation(1, 4) = -9999.0;
  Raster out = burnRiverZb(table, elevation, mask, &flwdir, true);
  EXPECT_FALSE(out.isValid(1, 4));
  EXPECT_DOUBLE_EQ(out.nodata(), -9999.0);
}

TEST_F(BurnTest, MismatchedMaskThrows) {
  Mask small = Mask::Constant(2, 2, true);
  EXPECT_THROW(burnRiverZb(table, elevation, small), ConfigError);
}
