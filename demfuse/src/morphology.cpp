// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "demfuse/morphology.hpp"

#include <utility>
#include <vector>

namespace demfuse {

Mask binaryDilation(const Mask& mask, int iterations,
                    Connectivity connectivity) {
  const int rows = static_cast<int>(mask.rows());
  const int cols = static_cast<int>(mask.cols());
  const bool eight = connectivity == Connectivity::Eight;
  const int n = eight ? 8 : 4;
  const int* dr = eight ? grid::kDr8 : grid::kDr4;
  const int* dc = eight ? grid::kDc8 : grid::kDc4;

  Mask current = mask;
  Mask next(rows, cols);
  for (int iter = 0; iter < iterations; ++iter) {
    next = current;
    bool changed = false;
    for (int r = 0; r < rows; ++r) {
      for (int c = 0; c < cols; ++c) {
        if (current(r, c)) continue;
        for (int k = 0; k < n; ++k) {
          const int nr = r + dr[k];
          const int nc = c + dc[k];
          if (nr < 0 || nr >= rows || nc < 0 || nc >= cols) continue;
          if (current(nr, nc)) {
            next(r, c) = true;
            changed = true;
            break;
          }
        }
      }
    }
    current.swap(next);
    if (!changed) break;
  }
  return current;
}

Mask binaryFillHoles(const Mask& mask, Connectivity background) {
  const int rows = static_cast<int>(mask.rows());
  const int cols = static_cast<int>(mask.cols());
  const bool eight = background == Connectivity::Eight;
  const int n = eight ? 8 : 4;
  const int* dr = eight ? grid::kDr8 : grid::kDr4;
  const int* dc = eight ? grid::kDc8 : grid::kDc4;

  // Flood the background from every border cell
  Mask outside = Mask::Constant(rows, cols, false);
  std::vector<std::pair<int, int>> stack;
  auto seed = [&](int r, int c) {
    if (!mask(r, c) && !outside(r, c)) {
      outside(r, c) = true;
      stack.emplace_back(r, c);
    }
  };
  for (int r = 0; r < rows; ++r) {
    seed(r, 0);
    seed(r, cols - 1);
  }
  for (int c = 0; c < cols; ++c) {
    seed(0, c);
    seed(rows - 1, c);
  }

  while (!stack.empty()) {
    const auto [r, c] = stack.back();
    stack.pop_back();
    for (int k = 0; k < n; ++k) {
      const int nr = r + dr[k];
      const int nc = c + dc[k];
      if (nr < 0 || nr >= rows || nc < 0 || nc >= cols) continue;
      seed(nr, nc);
    }
  }
  return !outside;
}

}  // namespace demfuse
