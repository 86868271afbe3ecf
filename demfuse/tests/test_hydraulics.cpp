// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_hydraulics.cpp
 *
 * Tests for bankfull river depth estimation.
 */

#include <gtest/gtest.h>

#include <cmath>

#include "demfuse/errors.hpp"
#include "demfuse/hydro/hydraulics.hpp"

using namespace demfuse;

// ─── Fixture ────────────────────────────────────────────────────────────────

class HydraulicsTest : public ::testing::Test {
 protected:
  // Three segments 0 -> 1 -> 2 (outlet), 5 km apart
  RiverNetwork chain{{0, 1, 2}, {1, 2, -1}};
  std::vector<double> qbankfull{100.0, 200.0, 400.0};
  std::vector<double> rivwth{50.0, 80.0, 120.0};
  std::vector<double> zs{10.0, 5.0, 0.0};
  std::vector<double> rivdst{10000.0, 5000.0, 0.0};
  config::Hydraulics cfg;
};

// ─── Closed Forms ───────────────────────────────────────────────────────────

TEST(DepthFormulaTest, PowerLaw) {
  EXPECT_NEAR(powlawDepth(100.0, 0.27, 0.30), 0.27 * std::pow(100.0, 0.30), 1e-12);
  EXPECT_DOUBLE_EQ(powlawDepth(55.0, 3.0, 0.0), 3.0);
}

TEST(DepthFormulaTest, Manning) {
  // (Q n / (W sqrt(S)))^(3/5)
  EXPECT_NEAR(manningDepth(100.0, 50.0, 1e-4, 0.03), std::pow(6.0, 0.6), 1e-12);
}

// ─── Per-Segment Depth ──────────────────────────────────────────────────────

TEST_F(HydraulicsTest, PowerLawClippedAtMinimumDepth) {
  cfg.method = DepthMethod::Powlaw;
  cfg.hc = 3.0;
  cfg.hp = 0.0;
  auto h = riverDepth(chain, qbankfull, {}, {}, {}, cfg);
  for (double v : h) EXPECT_DOUBLE_EQ(v, 3.0);

  cfg.hc = 0.1;
  h = riverDepth(chain, qbankfull, {}, {}, {}, cfg);
  for (double v : h) EXPECT_DOUBLE_EQ(v, cfg.min_rivdph);
}

TEST_F(HydraulicsTest, ManningUsesWaterSurfaceSlope) {
  cfg.method = DepthMethod::Manning;
  cfg.min_rivdph = 0.0;
  auto h = riverDepth(chain, qbankfull, rivwth, zs, rivdst, cfg);
  ASSERT_EQ(h.size(), 3u);
  EXPECT_NEAR(h[0], manningDepth(100.0, 50.0, 1e-3, cfg.manning_n), 1e-12);
  // The outlet has no downstream slope and uses min_rivslp
  EXPECT_NEAR(h[2], manningDepth(400.0, 120.0, cfg.min_rivslp, cfg.manning_n),
              1e-12);
}

TEST_F(HydraulicsTest, GradualFlowDepthsArePositiveAndFinite) {
  cfg.method = DepthMethod::Gvf;
  auto h = riverDepth(chain, qbankfull, rivwth, zs, rivdst, cfg);
  ASSERT_EQ(h.size(), 3u);
  for (double v : h) {
    EXPECT_TRUE(std::isfinite(v));
    EXPECT_GE(v, cfg.min_rivdph);
  }
}

TEST_F(HydraulicsTest, MissingDischargeGetsMinimumDepth) {
  cfg.method = DepthMethod::Manning;
  qbankfull[1] = NAN;
  rivwth[0] = 0.0;
  auto h = riverDepth(chain, qbankfull, rivwth, zs, rivdst, cfg);
  EXPECT_DOUBLE_EQ(h[0], cfg.min_rivdph);
  EXPECT_DOUBLE_EQ(h[1], cfg.min_rivdph);
  EXPECT_GT(h[2], cfg.min_rivdph);
}

TEST_F(HydraulicsTest, SizeMismatchThrows) {
  cfg.method = DepthMethod::Manning;
  EXPECT_THROW(riverDepth(chain, {1.0}, rivwth, zs, rivdst, cfg), ConfigError);
  EXPECT_THROW(riverDepth(chain, qbankfull, rivwth, {1.0}, rivdst, cfg),
               ConfigError);
}
