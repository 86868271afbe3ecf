// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_flow_direction.cpp
 *
 * Tests for the D8 flow-direction network: construction, derived
 * rasters, stream segmentation and DEM conditioning.
 */

#include <gtest/gtest.h>

#include "demfuse/errors.hpp"
#include "demfuse/hydro/flow_direction.hpp"

using namespace demfuse;

// ─── Fixture ────────────────────────────────────────────────────────────────

class FlowDirectionTest : public ::testing::Test {
 protected:
  // 1x5 row flowing east with 1 km cells, outlet at the last cell
  Raster row_grid;
  FlowDirRaster row_flow;

  void SetUp() override {
    Eigen::MatrixXd d8(1, 5);
    d8 << 1, 1, 1, 1, 0;
    row_grid = Raster(d8, GeoTransform::northUp(0.0, 1000.0, 1000.0),
                      Crs{32633, false}, 247.0, DataType::UInt8);
    row_flow = FlowDirRaster::fromD8(row_grid);
  }

  Raster rowElevation(std::initializer_list<double> values) const {
    Eigen::MatrixXd z(1, 5);
    int c = 0;
    for (double v : values) z(0, c++) = v;
    return Raster(z, row_grid.transform(), row_grid.crs(), -9999.0,
                  DataType::Float64);
  }
};

// ─── Construction ───────────────────────────────────────────────────────────

TEST_F(FlowDirectionTest, FromD8LinksCells) {
  EXPECT_EQ(row_flow.size(), 5);
  EXPECT_EQ(row_flow.downstream(0), 1);
  EXPECT_EQ(row_flow.downstream(3), 4);
  EXPECT_TRUE(row_flow.isPit(4));
  EXPECT_EQ(row_flow.sequence().front(), 0);
  EXPECT_EQ(row_flow.sequence().back(), 4);
}

TEST(FlowDirConstructionTest, OffGridFlowBecomesPit) {
  Eigen::MatrixXd d8(1, 2);
  d8 << 16, 1;  // both drain off the grid
  Raster grid(d8, GeoTransform::northUp(0.0, 1.0, 1.0));
  FlowDirRaster flw = FlowDirRaster::fromD8(grid);
  EXPECT_TRUE(flw.isPit(0));
  EXPECT_TRUE(flw.isPit(1));
}

TEST(FlowDirConstructionTest, InvalidInputThrows) {
  Raster like(1, 2, GeoTransform::northUp(0.0, 1.0, 1.0));
  EXPECT_THROW(FlowDirRaster({1, 0}, like), ConfigError);     // loop
  EXPECT_THROW(FlowDirRaster({1}, like), ConfigError);        // size
  EXPECT_THROW(FlowDirRaster({5, -1}, like), ConfigError);    // out of grid

  Eigen::MatrixXd d8(1, 2);
  d8 << 3, 0;
  EXPECT_THROW(FlowDirRaster::fromD8(Raster(d8, like.transform())), ConfigError);
}

TEST(FlowDirConstructionTest, FromDemRoutesOverSpillPoint) {
  // Bowl with a single low notch at the top edge
  Eigen::MatrixXd z = Eigen::MatrixXd::Constant(3, 3, 10.0);
  z(1, 1) = 2.0;
  z(0, 1) = 5.0;
  Raster dem(z, GeoTransform::northUp(0.0, 3.0, 1.0), {}, -9999.0);
  FlowDirRaster flw = FlowDirRaster::fromDem(dem);

  EXPECT_EQ(flw.downstream(4), 1);
  EXPECT_TRUE(flw.isPit(1));
  EXPECT_TRUE(flw.isPit(0));
}

// ─── Derived Rasters ────────────────────────────────────────────────────────

TEST_F(FlowDirectionTest, UpstreamAreaAccumulates) {
  Raster upa = row_flow.upstreamArea();
  for (int c = 0; c < 5; ++c) EXPECT_NEAR(upa(0, c), c + 1.0, 1e-9);
}

TEST_F(FlowDirectionTest, DistanceToOutlet) {
  Raster dst = row_flow.distanceToOutlet();
  EXPECT_DOUBLE_EQ(dst(0, 0), 4000.0);
  EXPECT_DOUBLE_EQ(dst(0, 3), 1000.0);
  EXPECT_DOUBLE_EQ(dst(0, 4), 0.0);
}

TEST_F(FlowDirectionTest, HandRelativeToDrain) {
  Mask drain = Mask::Constant(1, 5, false);
  drain(0, 4) = true;
  Raster hnd = row_flow.hand(drain, rowElevation({5, 4, 3, 2, 1}));
  EXPECT_NEAR(hnd(0, 0), 4.0, 1e-6);
  EXPECT_NEAR(hnd(0, 4), 0.0, 1e-6);
}

TEST_F(FlowDirectionTest, HandNodataWithoutDrain) {
  Mask drain = Mask::Constant(1, 5, false);
  drain(0, 1) = true;
  Raster hnd = row_flow.hand(drain, rowElevation({5, 4, 3, 2, 1}));
  EXPECT_NEAR(hnd(0, 0), 1.0, 1e-6);
  EXPECT_FALSE(hnd.isValid(0, 3));  // below the drain, never reaches it
}

TEST(StreamOrderTest, ConfluenceIncreasesOrder) {
  // (0,0) and (0,2) join at (1,1), which drains to (2,1)
  Eigen::MatrixXd d8 = Eigen::MatrixXd::Constant(3, 3, 247);
  d8(0, 0) = 2;
  d8(0, 2) = 8;
  d8(1, 1) = 4;
  d8(2, 1) = 0;
  Raster grid(d8, GeoTransform::northUp(0.0, 3.0, 1.0));
  FlowDirRaster flw = FlowDirRaster::fromD8(grid);

  Raster order = flw.streamOrder();
  EXPECT_DOUBLE_EQ(order(0, 0), 1.0);
  EXPECT_DOUBLE_EQ(order(1, 1), 2.0);
  EXPECT_DOUBLE_EQ(order(2, 1), 2.0);
  EXPECT_FALSE(order.isValid(1, 0));
}

// ─── Streams ────────────────────────────────────────────────────────────────

TEST_F(FlowDirectionTest, StreamsSplitByMaxLength) {
  Mask all = Mask::Constant(1, 5, true);
  auto segments = row_flow.streams(all, 2);
  ASSERT_EQ(segments.size(), 3u);
  EXPECT_EQ(segments[0].idx, 0);
  EXPECT_EQ(segments[0].idx_ds, 2);
  EXPECT_EQ(segments[0].cells, (std::vector<int>{0, 1}));
  EXPECT_EQ(segments[2].idx, 4);
  EXPECT_TRUE(segments[2].pit);
  EXPECT_EQ(segments[2].idx_ds, -1);

  auto line = row_flow.segmentLine(segments[0]);
  ASSERT_EQ(line.size(), 3u);
  EXPECT_DOUBLE_EQ(line.back().x(), 2500.0);
}

TEST_F(FlowDirectionTest, StreamsLimitedToMask) {
  Mask partial = Mask::Constant(1, 5, false);
  partial(0, 2) = partial(0, 3) = partial(0, 4) = true;
  auto segments = row_flow.streams(partial);
  ASSERT_EQ(segments.size(), 1u);
  EXPECT_EQ(segments[0].idx, 2);
  EXPECT_EQ(segments[0].cells.size(), 3u);
}

// ─── Conditioning ───────────────────────────────────────────────────────────

TEST_F(FlowDirectionTest, DemAdjustRemovesUphillSteps) {
  Raster adjusted = row_flow.demAdjust(rowElevation({5, 6, 3, 4, 1}));
  EXPECT_DOUBLE_EQ(adjusted(0, 1), 5.0);
  EXPECT_DOUBLE_EQ(adjusted(0, 3), 3.0);
  EXPECT_DOUBLE_EQ(adjusted(0, 4), 1.0);
}

TEST(DigD4Test, LowersCheaperOrthogonalNeighbour) {
  Eigen::MatrixXd d8(2, 2);
  d8 << 2, 0, 0, 0;  // (0,0) drains diagonally to (1,1)
  Raster grid(d8, GeoTransform::northUp(0.0, 2.0, 1.0));
  FlowDirRaster flw = FlowDirRaster::fromD8(grid);

  Eigen::MatrixXd z(2, 2);
  z << 5, 8, 9, 1;
  Raster elv(z, grid.transform(), {}, -9999.0, DataType::Float64);
  Raster out = flw.digD4(elv, Mask::Constant(2, 2, true));
  EXPECT_DOUBLE_EQ(out(0, 1), 5.0);
  EXPECT_DOUBLE_EQ(out(1, 0), 9.0);
  EXPECT_NEAR(flw.linkLength(0), std::sqrt(2.0), 1e-12);
}
