// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_morphology.cpp
 *
 * Tests for binary dilation and hole filling.
 */

#include <gtest/gtest.h>

#include "demfuse/morphology.hpp"

using namespace demfuse;

namespace {

Mask emptyMask(int rows, int cols) {
  return Mask::Constant(rows, cols, false);
}

}  // namespace

// ─── Dilation ───────────────────────────────────────────────────────────────

TEST(DilationTest, SingleCellEightConnected) {
  Mask m = emptyMask(5, 5);
  m(2, 2) = true;
  Mask d = binaryDilation(m);
  EXPECT_EQ(d.count(), 9);
  EXPECT_TRUE(d(1, 1));
  EXPECT_FALSE(d(0, 2));
}

TEST(DilationTest, SingleCellFourConnected) {
  Mask m = emptyMask(5, 5);
  m(2, 2) = true;
  Mask d = binaryDilation(m, 1, Connectivity::Four);
  EXPECT_EQ(d.count(), 5);
  EXPECT_FALSE(d(1, 1));
}

TEST(DilationTest, IterationsGrowTheSquare) {
  Mask m = emptyMask(7, 7);
  m(3, 3) = true;
  EXPECT_EQ(binaryDilation(m, 2).count(), 25);
  EXPECT_EQ(binaryDilation(m, 0).count(), 1);
}

TEST(DilationTest, ClippedAtBorder) {
  Mask m = emptyMask(3, 3);
  m(0, 0) = true;
  EXPECT_EQ(binaryDilation(m).count(), 4);
}

// ─── Fill Holes ─────────────────────────────────────────────────────────────

TEST(FillHolesTest, FillsEnclosedInterior) {
  Mask ring = emptyMask(5, 5);
  for (int i = 1; i <= 3; ++i) {
    ring(1, i) = ring(3, i) = ring(i, 1) = ring(i, 3) = true;
  }
  Mask filled = binaryFillHoles(ring);
  EXPECT_TRUE(filled(2, 2));
  EXPECT_EQ(filled.count(), 9);
  EXPECT_FALSE(filled(0, 0));
}

TEST(FillHolesTest, OpenShapeUnchanged) {
  Mask u = emptyMask(5, 5);
  for (int i = 1; i <= 3; ++i) {
    u(3, i) = u(i, 1) = u(i, 3) = true;  // open at the top
  }
  Mask filled = binaryFillHoles(u);
  EXPECT_FALSE(filled(2, 2));
  EXPECT_EQ(filled.count(), u.count());
}

TEST(FillHolesTest, DiagonalLeakDependsOnConnectivity) {
  // Hole at (2, 2) whose only exit is diagonal through the corner (1, 1)
  Mask m = emptyMask(5, 5);
  m(1, 2) = m(2, 1) = m(2, 3) = m(3, 2) = true;
  m(1, 3) = m(3, 1) = m(3, 3) = true;

  // 4-connected background cannot pass the diagonal gap
  EXPECT_TRUE(binaryFillHoles(m, Connectivity::Four)(2, 2));
  EXPECT_FALSE(binaryFillHoles(m, Connectivity::Eight)(2, 2));
}
