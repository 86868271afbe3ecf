// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_interpolate.cpp
 *
 * Tests for nodata interpolation (linear, nearest, IDW) and
 * nearest-value spreading.
 */

#include <gtest/gtest.h>

#include "demfuse/interpolate.hpp"

using namespace demfuse;

// ─── Fixture ────────────────────────────────────────────────────────────────

class InterpolateTest : public ::testing::Test {
 protected:
  // 7x7 grid of 5.0 with a 3x3 hole in the middle
  Eigen::MatrixXd grid;

  void SetUp() override {
    grid = Eigen::MatrixXd::Constant(7, 7, 5.0);
    grid.block(2, 2, 3, 3).setConstant(NAN);
  }
};

// ─── Hole Filling ───────────────────────────────────────────────────────────

TEST_F(InterpolateTest, LinearFillsUniformHoleExactly) {
  Eigen::MatrixXd out = interpolateNodata(grid, InterpMethod::Linear);
  ASSERT_TRUE(out.allFinite());
  for (int r = 2; r < 5; ++r) {
    for (int c = 2; c < 5; ++c) EXPECT_NEAR(out(r, c), 5.0, 1e-9);
  }
}

TEST_F(InterpolateTest, NearestAndIdwFillUniformHole) {
  for (auto method : {InterpMethod::Nearest, InterpMethod::Idw}) {
    Eigen::MatrixXd out = interpolateNodata(grid, method);
    ASSERT_TRUE(out.allFinite());
    EXPECT_NEAR(out(3, 3), 5.0, 1e-9);
  }
}

TEST(InterpolateLinearTest, RampIsReproduced) {
  // Values increase linearly with the column; a hole in the ramp is
  // filled by the same plane
  Eigen::MatrixXd ramp(5, 6);
  for (int r = 0; r < 5; ++r) {
    for (int c = 0; c < 6; ++c) ramp(r, c) = static_cast<double>(c);
  }
  Eigen::MatrixXd holed = ramp;
  holed.block(1, 1, 3, 4).setConstant(NAN);

  Eigen::MatrixXd out = interpolateNodata(holed, InterpMethod::Linear);
  for (int c = 1; c < 5; ++c) EXPECT_NEAR(out(2, c), ramp(2, c), 1e-9);
}

TEST_F(InterpolateTest, TargetMaskLimitsFilledCells) {
  Mask target = Mask::Constant(7, 7, false);
  target(3, 3) = true;
  target(2, 2) = true;
  Eigen::MatrixXd out = interpolateNodata(grid, InterpMethod::Nearest, &target);
  EXPECT_DOUBLE_EQ(out(2, 2), 5.0);
  EXPECT_TRUE(std::isnan(out(2, 3)));
  // (3, 3) is reached through (2, 2)
  EXPECT_DOUBLE_EQ(out(3, 3), 5.0);
}

TEST(InterpolateEdgeTest, AllNanStaysNan) {
  Eigen::MatrixXd empty = Eigen::MatrixXd::Constant(3, 3, NAN);
  for (auto method :
       {InterpMethod::Linear, InterpMethod::Nearest, InterpMethod::Idw}) {
    EXPECT_FALSE(interpolateNodata(empty, method).array().isFinite().any());
  }
}

TEST(InterpolateEdgeTest, RasterOverloadKeepsNodataValue) {
  Eigen::MatrixXd v = Eigen::MatrixXd::Constant(3, 3, 2.0);
  v(1, 1) = -9999.0;
  Raster r(v, GeoTransform::northUp(0.0, 3.0, 1.0), {}, -9999.0,
           DataType::Float64);
  Raster out = interpolateNodata(r, InterpMethod::Idw);
  EXPECT_DOUBLE_EQ(out.nodata(), -9999.0);
  EXPECT_NEAR(out(1, 1), 2.0, 1e-12);
  EXPECT_EQ(out.countNodata(), 0);
}

// ─── Spreading ──────────────────────────────────────────────────────────────

TEST(SpreadTest, NearestSourceAndDistance) {
  Eigen::MatrixXd obs = Eigen::MatrixXd::Constant(1, 7, NAN);
  obs(0, 0) = 1.0;
  obs(0, 6) = 2.0;
  SpreadResult s = spread2d(obs, nullptr, 10.0, 10.0);

  EXPECT_DOUBLE_EQ(s.values(0, 2), 1.0);
  EXPECT_DOUBLE_EQ(s.values(0, 4), 2.0);
  EXPECT_DOUBLE_EQ(s.distance(0, 2), 20.0);
  EXPECT_EQ(s.source(0, 5), 6);
}

TEST(SpreadTest, MaskBlocksPaths) {
  Eigen::MatrixXd obs = Eigen::MatrixXd::Constant(1, 5, NAN);
  obs(0, 0) = 3.0;
  Mask mask = Mask::Constant(1, 5, true);
  mask(0, 2) = false;
  SpreadResult s = spread2d(obs, &mask);

  EXPECT_DOUBLE_EQ(s.values(0, 1), 3.0);
  EXPECT_TRUE(std::isnan(s.values(0, 3)));
  EXPECT_EQ(s.source(0, 4), -1);
}
