// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_river_zb.cpp
 *
 * Tests for river bed level reconstruction: segment extraction,
 * attribute joins, river and bank masks and bed level estimation.
 */

#include <gtest/gtest.h>

#include <cmath>

#include "demfuse/bathymetry/river_zb.hpp"
#include "demfuse/errors.hpp"

using namespace demfuse;

// ─── Fixture ────────────────────────────────────────────────────────────────

/**
 * Straight valley on an 11x11 grid with 100 m cells. The river runs east
 * along row 5 and drops 0.5 m per cell from 10 m; hillslopes rise 1 m per
 * cell away from the river and drain straight into it.
 */
class RiverZbTest : public ::testing::Test {
 protected:
  static constexpr int kSize = 11;
  static constexpr int kRiverRow = 5;

  Raster elevtn;
  Raster uparea;
  FlowDirRaster flwdir;
  FeatureTable rivers;
  config::RiverBathymetry cfg;

  void SetUp() override {
    const GeoTransform gt = GeoTransform::northUp(0.0, 1100.0, 100.0);
    const Crs utm{32633, false};

    Eigen::MatrixXd z(kSize, kSize);
    Eigen::MatrixXd d8(kSize, kSize);
    Eigen::MatrixXd upa(kSize, kSize);
    for (int r = 0; r < kSize; ++r) {
      for (int c = 0; c < kSize; ++c) {
        z(r, c) = riverElevation(c) + std::abs(r - kRiverRow);
        d8(r, c) = r < kRiverRow ? 4 : r > kRiverRow ? 64 : 1;
        upa(r, c) = r == kRiverRow ? 500.0 : 1.0;
      }
    }
    d8(kRiverRow, kSize - 1) = 0;

    elevtn = Raster(z, gt, utm, -9999.0, DataType::Float64);
    uparea = Raster(upa, gt, utm, -9999.0, DataType::Float64);
    flwdir = FlowDirRaster::fromD8(Raster(d8, gt, utm, 255.0, DataType::UInt8));

    Feature river;
    river.geometry = {Point(0.0, 550.0), Point(1100.0, 550.0)};
    river.properties["rivwth"] = 150.0;
    river.properties["qbankfull"] = 100.0;
    rivers = {river};

    cfg.segment_length = 500.0;  // 5 cells
    cfg.smooth_length = 0.0;
    cfg.nmin = 5;
    cfg.adjust_estuary = false;
    cfg.adjust_rivwth = false;
    cfg.hydraulics.method = DepthMethod::Powlaw;
    cfg.hydraulics.hc = 3.0;
    cfg.hydraulics.hp = 0.0;
  }

  static double riverElevation(int col) { return 10.0 - 0.5 * col; }

  RiverInputs inputs() const {
    RiverInputs in;
    in.elevtn = elevtn;
    in.uparea = uparea;
    in.rivers = rivers;
    return in;
  }
};

// ─── Segments ───────────────────────────────────────────────────────────────

TEST_F(RiverZbTest, ExtractSegmentsSplitsByLength) {
  auto table = extractSegments(flwdir, elevtn, uparea, cfg);
  ASSERT_EQ(table.size(), 3u);

  EXPECT_EQ(table[0].segid, 1);
  EXPECT_EQ(table[0].cells.size(), 5u);
  EXPECT_EQ(table[0].idx_ds, table[1].idx);
  EXPECT_EQ(table[2].idx_ds, -1);

  EXPECT_DOUBLE_EQ(table[0].elevtn, 10.0);
  EXPECT_DOUBLE_EQ(table[1].elevtn, 7.5);
  EXPECT_DOUBLE_EQ(table[0].rivdst, 1000.0);
  EXPECT_DOUBLE_EQ(table[0].rivlen, 500.0);
  EXPECT_DOUBLE_EQ(table[2].rivlen, 0.0);
  EXPECT_DOUBLE_EQ(table[0].uparea, 500.0);
  EXPECT_EQ(table[0].strord, 1);
}

TEST_F(RiverZbTest, JoinTakesNearestFeatureWithinDistance) {
  auto table = extractSegments(flwdir, elevtn, uparea, cfg);
  joinRiverAttributes(table, rivers, {"rivwth"}, 50.0);
  EXPECT_DOUBLE_EQ(table[1].rivwth, 150.0);
  EXPECT_TRUE(std::isnan(table[1].qbankfull));

  Feature far;
  far.geometry = {Point(0.0, 5000.0), Point(1100.0, 5000.0)};
  far.properties["qbankfull"] = 9.0;
  joinRiverAttributes(table, {far}, {"qbankfull"}, 50.0);
  EXPECT_TRUE(std::isnan(table[1].qbankfull));

  EXPECT_THROW(joinRiverAttributes(table, rivers, {"colour"}, 50.0), ConfigError);
}

// ─── Masks ──────────────────────────────────────────────────────────────────

TEST_F(RiverZbTest, RiverMaskFromWidth) {
  auto table = extractSegments(flwdir, elevtn, uparea, cfg);
  joinRiverAttributes(table, rivers, {"rivwth"}, cfg.max_dist);

  Mask mask = riverMask(table, elevtn, std::nullopt);
  EXPECT_EQ(mask.count(), kSize);
  EXPECT_TRUE(mask.row(kRiverRow).all());
}

TEST_F(RiverZbTest, RiverMaskRequiresWidthOrMask) {
  auto table = extractSegments(flwdir, elevtn, uparea, cfg);
  EXPECT_THROW(riverMask(table, elevtn, std::nullopt), ConfigError);

  Mask known = Mask::Constant(kSize, kSize, false);
  known(kRiverRow - 1, 3) = true;
  Mask mask = riverMask(table, elevtn, known);
  EXPECT_EQ(mask.count(), kSize + 1);
}

TEST_F(RiverZbTest, RiverMaskRejectsGeographicGrid) {
  auto table = extractSegments(flwdir, elevtn, uparea, cfg);
  joinRiverAttributes(table, rivers, {"rivwth"}, cfg.max_dist);
  Raster geographic = elevtn;
  geographic.setCrs(Crs{4326, true});
  EXPECT_THROW(riverMask(table, geographic, std::nullopt), ConfigError);
}

TEST_F(RiverZbTest, BankHeightsFromHand) {
  auto table = extractSegments(flwdir, elevtn, uparea, cfg);
  Mask river = Mask::Constant(kSize, kSize, false);
  river.row(kRiverRow).setConstant(true);
  const Mask rivd8 = uparea.masked().array() > cfg.river_upa;
  Raster hnd = flwdir.hand(rivd8, elevtn);

  RivbankDz bank = getRivbankDz(table, river, hnd, cfg.nmin, cfg.bankq);
  EXPECT_EQ(bank.bank_mask.count(), 2 * kSize);
  EXPECT_EQ(bank.river_mask.count(), kSize);
  ASSERT_EQ(bank.rivbank_dz.size(), 3u);
  EXPECT_DOUBLE_EQ(bank.rivbank_dz[0], 1.0);
  EXPECT_DOUBLE_EQ(bank.rivbank_dz[1], 1.0);
  // The outlet segment only has two bank cells
  EXPECT_DOUBLE_EQ(bank.rivbank_dz[2], 0.0);
}

TEST_F(RiverZbTest, SegmentWidthFromMaskArea) {
  auto table = extractSegments(flwdir, elevtn, uparea, cfg);
  Mask river = Mask::Constant(kSize, kSize, false);
  river.block(kRiverRow - 1, 0, 3, kSize).setConstant(true);

  auto width = segmentWidth(table, river, flwdir);
  // 15 cells of 100 m x 100 m along 500 m of river
  EXPECT_NEAR(width[0], 300.0, 1e-9);
}

// ─── Bed Levels ─────────────────────────────────────────────────────────────

TEST(BedLevelTest, SingleSegmentProfile) {
  RiverSegmentTable table(1);
  table[0].segid = 1;
  table[0].idx = 0;
  table[0].elevtn = 10.0;
  table[0].rivdst = 0.0;
  table[0].qbankfull = 1.0;

  config::RiverBathymetry cfg;
  cfg.hydraulics.method = DepthMethod::Powlaw;
  cfg.hydraulics.hc = 3.0;
  cfg.hydraulics.hp = 0.0;

  estimateBedLevels(table, RiverNetwork({0}, {-1}), {2.0}, cfg);
  const auto& seg = table[0];
  EXPECT_DOUBLE_EQ(seg.zs0, 12.0);
  EXPECT_DOUBLE_EQ(seg.zs, 12.0);
  EXPECT_DOUBLE_EQ(seg.rivbank_dz, 2.0);
  EXPECT_DOUBLE_EQ(seg.rivdph0, 3.0);
  EXPECT_DOUBLE_EQ(seg.rivdph, 3.0);
  EXPECT_DOUBLE_EQ(seg.zb, 9.0);
  EXPECT_LT(seg.zb, seg.elevtn);
  EXPECT_DOUBLE_EQ(seg.rivslp, 0.0);
  EXPECT_EQ(seg.estuary, 0);
}

TEST(BedLevelTest, MismatchedBankHeightsThrow) {
  RiverSegmentTable table(2);
  config::RiverBathymetry cfg;
  EXPECT_THROW(estimateBedLevels(table, RiverNetwork({0, 1}, {1, -1}), {1.0}, cfg),
               ConfigError);
}

TEST(BedLevelTest, SegmentWithoutBankHeightDoesNotLowerDownstream) {
  // 0 -> 1 -> 2 (outlet); the middle segment has no bank cells
  RiverSegmentTable table(3);
  const double elevtn[] = {20.0, 15.0, 10.0};
  for (int i = 0; i < 3; ++i) {
    table[i].idx = i;
    table[i].elevtn = elevtn[i];
    table[i].rivdst = 1000.0 * (2 - i);
    table[i].qbankfull = 1.0;
  }

  config::RiverBathymetry cfg;
  cfg.smooth_length = 0.0;
  cfg.adjust_estuary = false;
  cfg.hydraulics.method = DepthMethod::Powlaw;
  cfg.hydraulics.hc = 3.0;
  cfg.hydraulics.hp = 0.0;

  estimateBedLevels(table, RiverNetwork({0, 1, 2}, {1, 2, -1}), {2.0, NAN, 2.0},
                    cfg);
  EXPECT_DOUBLE_EQ(table[0].zs, 22.0);
  EXPECT_DOUBLE_EQ(table[1].zs, 15.0);
  EXPECT_DOUBLE_EQ(table[1].rivbank_dz, 0.0);
  EXPECT_DOUBLE_EQ(table[2].zs, 12.0);
  EXPECT_DOUBLE_EQ(table[2].rivbank_dz, 2.0);
  EXPECT_DOUBLE_EQ(table[2].zb, 9.0);
}

TEST(BedLevelTest, EstuaryCarriesUpstreamDepthToTheSea) {
  // 0 -> 1 -> 2 -> 3 (outlet), widening and dropping below 5 m from 1 on
  RiverSegmentTable table(4);
  const double elevtn[] = {8.0, 3.0, 1.0, 0.0};
  const double rivwth[] = {100.0, 200.0, 600.0, 1500.0};
  const double qbankfull[] = {100.0, 400.0, 900.0, 1600.0};
  for (int i = 0; i < 4; ++i) {
    table[i].idx = i;
    table[i].elevtn = elevtn[i];
    table[i].rivwth = rivwth[i];
    table[i].qbankfull = qbankfull[i];
    table[i].rivdst = 10000.0 * (3 - i);
  }

  config::RiverBathymetry cfg;
  cfg.smooth_length = 0.0;
  cfg.adjust_estuary = true;
  cfg.min_convergence = 0.01;
  cfg.estuary_max_elevtn = 5.0;
  cfg.hydraulics.method = DepthMethod::Powlaw;
  cfg.hydraulics.hc = 1.0;
  cfg.hydraulics.hp = 0.5;  // depth = sqrt(Q): 10, 20, 30, 40 m

  estimateBedLevels(table, RiverNetwork({0, 1, 2, 3}, {1, 2, 3, -1}),
                    {1.0, 1.0, 1.0, 1.0}, cfg);
  EXPECT_EQ(table[0].estuary, 0);
  EXPECT_DOUBLE_EQ(table[0].rivdph, 10.0);
  for (int i = 1; i < 4; ++i) {
    EXPECT_EQ(table[i].estuary, 1) << "segment " << i;
    EXPECT_NEAR(table[i].rivdph0, std::sqrt(qbankfull[i]), 1e-9);
    EXPECT_NEAR(table[i].rivdph, 10.0, 1e-9) << "segment " << i;
    EXPECT_NEAR(table[i].zb, table[i].zs - 10.0, 1e-9);
  }
}

TEST(BedLevelTest, NonPositiveSegmentLengthThrows) {
  RiverSegmentTable table(1);
  table[0].elevtn = 1.0;
  table[0].qbankfull = 1.0;
  config::RiverBathymetry cfg;
  cfg.segment_length = 0.0;
  EXPECT_THROW(estimateBedLevels(table, RiverNetwork({0}, {-1}), {1.0}, cfg),
               ConfigError);
  cfg.segment_length = -500.0;
  EXPECT_THROW(estimateBedLevels(table, RiverNetwork({0}, {-1}), {1.0}, cfg),
               ConfigError);
}

TEST_F(RiverZbTest, GetRiverZbFullPipeline) {
  RiverZbResult result = getRiverZb(inputs(), flwdir, cfg);
  const auto& table = result.segments;
  ASSERT_EQ(table.size(), 3u);
  EXPECT_EQ(result.river_mask.count(), kSize);

  EXPECT_DOUBLE_EQ(table[0].qbankfull, 100.0);
  EXPECT_DOUBLE_EQ(table[0].rivwth, 150.0);
  EXPECT_DOUBLE_EQ(table[0].zs, 11.0);
  EXPECT_DOUBLE_EQ(table[0].zb, 8.0);
  EXPECT_DOUBLE_EQ(table[1].zb, 5.5);
  EXPECT_DOUBLE_EQ(table[2].zb, 2.0);  // no bank height at the outlet
  EXPECT_NEAR(table[0].rivslp, 0.005, 1e-12);
  EXPECT_DOUBLE_EQ(table[2].rivslp, 0.0);

  for (size_t i = 0; i < table.size(); ++i) {
    EXPECT_LE(table[i].zb, table[i].elevtn);
    EXPECT_NEAR(table[i].rivdph, table[i].zs - table[i].zb, 1e-12);
  }
}

TEST_F(RiverZbTest, GetRiverZbDerivesUpstreamArea) {
  // 0.01 km2 per cell, each column adds 0.11 km2 to the river, so the
  // river starts at column 4
  RiverInputs in = inputs();
  in.uparea.reset();
  cfg.river_upa = 0.5;
  cfg.segment_length = 5000.0;
  RiverZbResult result = getRiverZb(in, flwdir, cfg);
  ASSERT_EQ(result.segments.size(), 1u);
  EXPECT_EQ(result.segments.front().idx, kRiverRow * kSize + 4);
  EXPECT_NEAR(result.segments.front().uparea, 0.55, 1e-9);
}

TEST_F(RiverZbTest, GetRiverZbWithoutRiversWarnsAndReturnsEmpty) {
  cfg.river_upa = 1e6;
  RiverZbResult result = getRiverZb(inputs(), flwdir, cfg);
  EXPECT_TRUE(result.segments.empty());
  EXPECT_EQ(result.river_mask.count(), 0);
}

TEST_F(RiverZbTest, GetRiverZbRejectsZeroSegmentLength) {
  cfg.segment_length = 0.0;
  EXPECT_THROW(getRiverZb(inputs(), flwdir, cfg), ConfigError);
}

TEST_F(RiverZbTest, GetRiverZbRequiresDischarge) {
  RiverInputs in = inputs();
  in.rivers->front().properties.erase("qbankfull");
  EXPECT_THROW(getRiverZb(in, flwdir, cfg), ConfigError);

  in.elevtn = Raster();
  EXPECT_THROW(getRiverZb(in, flwdir, cfg), ConfigError);
}

TEST_F(RiverZbTest, DischargeTableOverridesRivers) {
  Feature q;
  q.geometry = {Point(550.0, 550.0)};
  q.properties["qbankfull"] = 42.0;
  RiverInputs in = inputs();
  in.qbankfull = FeatureTable{q};
  cfg.max_dist = 1000.0;

  RiverZbResult result = getRiverZb(in, flwdir, cfg);
  for (const auto& seg : result.segments) EXPECT_DOUBLE_EQ(seg.qbankfull, 42.0);
}
