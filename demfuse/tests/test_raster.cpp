// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_raster.cpp
 *
 * Tests for the georeferenced raster container: nodata handling,
 * dtype quantization and grid georeferencing.
 */

#include <gtest/gtest.h>

#include "demfuse/raster.hpp"

using namespace demfuse;

// ─── Nodata ─────────────────────────────────────────────────────────────────

TEST(RasterTest, ConstructedFilledWithNodata) {
  Raster r(3, 4, GeoTransform::northUp(0.0, 3.0, 1.0), {}, -9999.0);
  EXPECT_EQ(r.rows(), 3);
  EXPECT_EQ(r.cols(), 4);
  EXPECT_EQ(r.countNodata(), 12);
  EXPECT_FALSE(r.isValid(0, 0));
  EXPECT_DOUBLE_EQ(r(0, 0), -9999.0);
}

TEST(RasterTest, MaskedReplacesNodataWithNan) {
  Eigen::MatrixXd v(2, 2);
  v << 1.0, -9999.0, NAN, 4.0;
  Raster r(v, GeoTransform::northUp(0.0, 2.0, 1.0), {}, -9999.0);

  Eigen::MatrixXd m = r.masked();
  EXPECT_DOUBLE_EQ(m(0, 0), 1.0);
  EXPECT_TRUE(std::isnan(m(0, 1)));
  EXPECT_TRUE(std::isnan(m(1, 0)));
  EXPECT_EQ(r.countNodata(), 2);
  EXPECT_EQ(r.validMask().count(), 2);
}

TEST(RasterTest, AssignMaskedWritesNodataValue) {
  Raster r(2, 2, GeoTransform::northUp(0.0, 2.0, 1.0), {}, -9999.0,
           DataType::Float64);
  Eigen::MatrixXd v(2, 2);
  v << 1.5, NAN, 2.5, 3.5;
  r.assignMasked(v);
  EXPECT_DOUBLE_EQ(r(0, 1), -9999.0);
  EXPECT_DOUBLE_EQ(r(1, 1), 3.5);
}

TEST(RasterTest, SetNodataRewritesMissingCells) {
  Eigen::MatrixXd v(1, 3);
  v << NAN, 2.0, NAN;
  Raster r(v, GeoTransform::northUp(0.0, 1.0, 1.0));
  EXPECT_FALSE(r.hasFiniteNodata());

  r.setNodata(-1.0);
  EXPECT_TRUE(r.hasFiniteNodata());
  EXPECT_DOUBLE_EQ(r(0, 0), -1.0);
  EXPECT_DOUBLE_EQ(r(0, 1), 2.0);
  EXPECT_EQ(r.countNodata(), 2);
}

// ─── Quantization ───────────────────────────────────────────────────────────

TEST(RasterTest, QuantizeIntegerTypesRoundAndClamp) {
  EXPECT_DOUBLE_EQ(Raster::quantize(2.6, DataType::Int16), 3.0);
  EXPECT_DOUBLE_EQ(Raster::quantize(-1.0, DataType::UInt8), 0.0);
  EXPECT_DOUBLE_EQ(Raster::quantize(300.0, DataType::UInt8), 255.0);
  EXPECT_DOUBLE_EQ(Raster::quantize(0.1, DataType::Float64), 0.1);
  EXPECT_DOUBLE_EQ(Raster::quantize(0.1, DataType::Float32),
                   static_cast<double>(0.1f));
}

TEST(RasterTest, QuantizeNeverProducesNodataForValidValues) {
  EXPECT_DOUBLE_EQ(Raster::quantize(300.0, DataType::UInt8, 255.0), 254.0);
  EXPECT_DOUBLE_EQ(Raster::quantize(255.0, DataType::UInt8, 255.0), 255.0);
  EXPECT_DOUBLE_EQ(Raster::quantize(-3.0, DataType::UInt8, 0.0), 1.0);
  EXPECT_DOUBLE_EQ(Raster::quantize(-9999.2, DataType::Int16, -9999.0),
                   -10000.0);
  EXPECT_DOUBLE_EQ(Raster::quantize(12.0, DataType::UInt8, 255.0), 12.0);

  Raster r(1, 3, GeoTransform::northUp(0.0, 1.0, 1.0), {}, 255.0,
           DataType::UInt8);
  Eigen::MatrixXd v(1, 3);
  v << 300.0, NAN, 7.4;
  r.assignMasked(v);
  EXPECT_DOUBLE_EQ(r(0, 0), 254.0);
  EXPECT_TRUE(r.isValid(0, 0));
  EXPECT_FALSE(r.isValid(0, 1));
  EXPECT_DOUBLE_EQ(r(0, 2), 7.0);
}

TEST(RasterTest, QuantizeKeepsNan) {
  EXPECT_TRUE(std::isnan(Raster::quantize(NAN, DataType::Int32)));
}

// ─── Georeferencing ─────────────────────────────────────────────────────────

TEST(RasterTest, CellCenterAndIndex) {
  Raster r(4, 5, GeoTransform::northUp(100.0, 200.0, 10.0));
  Eigen::Vector2d c = r.cellCenter(0, 0);
  EXPECT_DOUBLE_EQ(c.x(), 105.0);
  EXPECT_DOUBLE_EQ(c.y(), 195.0);

  int row = -1, col = -1;
  ASSERT_TRUE(r.index(Eigen::Vector2d(137.0, 171.0), row, col));
  EXPECT_EQ(row, 2);
  EXPECT_EQ(col, 3);
  EXPECT_FALSE(r.index(Eigen::Vector2d(99.0, 171.0), row, col));
  EXPECT_FALSE(r.index(Eigen::Vector2d(120.0, 150.0), row, col));
}

TEST(RasterTest, BoundsAndIntersection) {
  Raster a(4, 5, GeoTransform::northUp(0.0, 40.0, 10.0));
  Bounds b = a.bounds();
  EXPECT_DOUBLE_EQ(b.xmin, 0.0);
  EXPECT_DOUBLE_EQ(b.xmax, 50.0);
  EXPECT_DOUBLE_EQ(b.ymin, 0.0);
  EXPECT_DOUBLE_EQ(b.ymax, 40.0);

  Raster touching(2, 2, GeoTransform::northUp(50.0, 40.0, 10.0));
  Raster overlapping(2, 2, GeoTransform::northUp(45.0, 40.0, 10.0));
  EXPECT_FALSE(b.intersects(touching.bounds()));
  EXPECT_TRUE(b.intersects(overlapping.bounds()));
}

TEST(RasterTest, IdenticalGridComparesShapeTransformAndCrs) {
  Raster a(3, 3, GeoTransform::northUp(0.0, 3.0, 1.0), Crs{32633, false});
  Raster b = a.like(1.0);
  EXPECT_TRUE(a.identicalGrid(b));

  Raster shifted(3, 3, GeoTransform::northUp(0.5, 3.0, 1.0), Crs{32633, false});
  EXPECT_FALSE(a.identicalGrid(shifted));

  Raster other_crs(3, 3, GeoTransform::northUp(0.0, 3.0, 1.0), Crs{4326, true});
  EXPECT_FALSE(a.identicalGrid(other_crs));
}

TEST(RasterTest, CellSizeInMetersForGeographicGrid) {
  Raster projected(2, 2, GeoTransform::northUp(0.0, 2.0, 25.0), Crs{32633, false});
  EXPECT_DOUBLE_EQ(projected.cellSizeMeters(), 25.0);
  EXPECT_DOUBLE_EQ(projected.cellArea(0), 625.0);

  Raster geographic(2, 2, GeoTransform::northUp(0.0, 0.02, 0.01), Crs{4326, true});
  EXPECT_NEAR(geographic.cellSizeMeters(), 0.01 * kMetersPerDegree, 1e-6);
  // Cells shrink with latitude
  Raster north(2, 2, GeoTransform::northUp(0.0, 60.0, 0.01), Crs{4326, true});
  EXPECT_LT(north.cellArea(0), geographic.cellArea(0));
}
