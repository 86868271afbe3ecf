// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * interpolate.cpp
 *
 * Hole filling for raster grids: harmonic (linear), nearest and IDW.
 */

#include "demfuse/interpolate.hpp"

#include <Eigen/Sparse>
#include <Eigen/SparseCholesky>
#include <cmath>
#include <functional>
#include <queue>
#include <stdexcept>
#include <utility>
#include <vector>

namespace demfuse {

namespace {

constexpr int kIdwMaxRadius = 100;  // cells

Mask fillableCells(const Eigen::MatrixXd& values, const Mask* target) {
  Mask fillable = values.array().isNaN();
  if (target) fillable = fillable && *target;
  return fillable;
}

/**
 * Discrete Laplace fill. Each unknown cell equals the mean of its
 * 4-neighbours that are either valid or unknown; the resulting sparse
 * system is symmetric positive definite per connected component.
 */
Eigen::MatrixXd fillLinear(const Eigen::MatrixXd& values,
                           const Mask& fillable) {
  const int rows = static_cast<int>(values.rows());
  const int cols = static_cast<int>(values.cols());

  auto hasValidNeighbor = [&](int r, int c) {
    for (int k = 0; k < 4; ++k) {
      const int nr = r + grid::kDr4[k];
      const int nc = c + grid::kDc4[k];
      if (nr < 0 || nr >= rows || nc < 0 || nc >= cols) continue;
      if (std::isfinite(values(nr, nc))) return true;
    }
    return false;
  };

  // Unknowns: fillable cells connected to at least one valid cell
  Eigen::MatrixXi unknown_id = Eigen::MatrixXi::Constant(rows, cols, -1);
  std::vector<std::pair<int, int>> cells;
  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      if (fillable(r, c) && hasValidNeighbor(r, c)) {
        unknown_id(r, c) = static_cast<int>(cells.size());
        cells.emplace_back(r, c);
      }
    }
  }
  for (size_t head = 0; head < cells.size(); ++head) {
    const auto [r, c] = cells[head];
    for (int k = 0; k < 4; ++k) {
      const int nr = r + grid::kDr4[k];
      const int nc = c + grid::kDc4[k];
      if (nr < 0 || nr >= rows || nc < 0 || nc >= cols) continue;
      if (fillable(nr, nc) && unknown_id(nr, nc) < 0) {
        unknown_id(nr, nc) = static_cast<int>(cells.size());
        cells.emplace_back(nr, nc);
      }
    }
  }

  Eigen::MatrixXd out = values;
  const int n = static_cast<int>(cells.size());
  if (n == 0) return out;

  std::vector<Eigen::Triplet<double>> triplets;
  triplets.reserve(static_cast<size_t>(n) * 5);
  Eigen::VectorXd rhs = Eigen::VectorXd::Zero(n);

  for (int i = 0; i < n; ++i) {
    const auto [r, c] = cells[i];
    double degree = 0.0;
    for (int k = 0; k < 4; ++k) {
      const int nr = r + grid::kDr4[k];
      const int nc = c + grid::kDc4[k];
      if (nr < 0 || nr >= rows || nc < 0 || nc >= cols) continue;
      const double v = values(nr, nc);
      if (std::isfinite(v)) {
        degree += 1.0;
        rhs(i) += v;
      } else if (unknown_id(nr, nc) >= 0) {
        degree += 1.0;
        triplets.emplace_back(i, unknown_id(nr, nc), -1.0);
      }
    }
    triplets.emplace_back(i, i, degree);
  }

  Eigen::SparseMatrix<double> A(n, n);
  A.setFromTriplets(triplets.begin(), triplets.end());

  Eigen::SimplicialLDLT<Eigen::SparseMatrix<double>> solver(A);
  if (solver.info() != Eigen::Success) {
    throw std::runtime_error("[Interpolate] Laplace system factorization failed");
  }
  const Eigen::VectorXd x = solver.solve(rhs);

  for (int i = 0; i < n; ++i) {
    out(cells[i].first, cells[i].second) = x(i);
  }
  return out;
}

/// Multi-source Dijkstra over 8-connected cells.
SpreadResult spreadImpl(const Eigen::MatrixXd& obs, const Mask& sources,
                        const Mask& passable, double dx, double dy) {
  const int rows = static_cast<int>(obs.rows());
  const int cols = static_cast<int>(obs.cols());
  const double ax = std::abs(dx);
  const double ay = std::abs(dy);
  const double diag = std::hypot(ax, ay);

  SpreadResult result;
  result.values = Eigen::MatrixXd::Constant(rows, cols, NAN);
  result.distance = Eigen::MatrixXd::Constant(rows, cols, INFINITY);
  result.source = Eigen::MatrixXi::Constant(rows, cols, -1);

  using Entry = std::pair<double, int>;  // (distance, row-major index)
  std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> open;

  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      if (!sources(r, c) || !std::isfinite(obs(r, c))) continue;
      result.values(r, c) = obs(r, c);
      result.distance(r, c) = 0.0;
      result.source(r, c) = r * cols + c;
      open.emplace(0.0, r * cols + c);
    }
  }

  while (!open.empty()) {
    const auto [d, idx] = open.top();
    open.pop();
    const int r = idx / cols;
    const int c = idx % cols;
    if (d > result.distance(r, c)) continue;

    for (int k = 0; k < 8; ++k) {
      const int nr = r + grid::kDr8[k];
      const int nc = c + grid::kDc8[k];
      if (nr < 0 || nr >= rows || nc < 0 || nc >= cols) continue;
      if (!passable(nr, nc)) continue;
      const double step =
          (grid::kDr8[k] != 0 && grid::kDc8[k] != 0) ? diag
          : (grid::kDr8[k] != 0)                     ? ay
                                                     : ax;
      const double nd = d + step;
      if (nd < result.distance(nr, nc)) {
        result.distance(nr, nc) = nd;
        result.values(nr, nc) = result.values(r, c);
        result.source(nr, nc) = result.source(r, c);
        open.emplace(nd, nr * cols + nc);
      }
    }
  }
  return result;
}

Eigen::MatrixXd fillNearest(const Eigen::MatrixXd& values, const Mask& fillable,
                            double dx, double dy) {
  const Mask valid = values.array().isFinite();
  const SpreadResult spread = spreadImpl(values, valid, valid || fillable, dx, dy);
  Eigen::MatrixXd out = values;
  for (Eigen::Index j = 0; j < out.cols(); ++j) {
    for (Eigen::Index i = 0; i < out.rows(); ++i) {
      if (fillable(i, j)) out(i, j) = spread.values(i, j);
    }
  }
  return out;
}

Eigen::MatrixXd fillIdw(const Eigen::MatrixXd& values, const Mask& fillable,
                        double dx, double dy) {
  const int rows = static_cast<int>(values.rows());
  const int cols = static_cast<int>(values.cols());
  const double ax = std::abs(dx);
  const double ay = std::abs(dy);
  Eigen::MatrixXd out = values;

  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      if (!fillable(r, c)) continue;

      // Ring search for the nearest valid cell
      int found = 0;
      for (int R = 1; R <= kIdwMaxRadius && found == 0; ++R) {
        for (int dr = -R; dr <= R && found == 0; ++dr) {
          for (int dc = -R; dc <= R; ++dc) {
            if (std::abs(dr) != R && std::abs(dc) != R) continue;
            const int nr = r + dr;
            const int nc = c + dc;
            if (nr < 0 || nr >= rows || nc < 0 || nc >= cols) continue;
            if (std::isfinite(values(nr, nc))) {
              found = R;
              break;
            }
          }
        }
      }
      if (found == 0) continue;

      const int radius = std::min(2 * found, kIdwMaxRadius);
      double wsum = 0.0;
      double vsum = 0.0;
      for (int dr = -radius; dr <= radius; ++dr) {
        for (int dc = -radius; dc <= radius; ++dc) {
          const int nr = r + dr;
          const int nc = c + dc;
          if (nr < 0 || nr >= rows || nc < 0 || nc >= cols) continue;
          const double v = values(nr, nc);
          if (!std::isfinite(v)) continue;
          const double d2 = (dr * ay) * (dr * ay) + (dc * ax) * (dc * ax);
          const double w = 1.0 / d2;
          wsum += w;
          vsum += w * v;
        }
      }
      if (wsum > 0.0) out(r, c) = vsum / wsum;
    }
  }
  return out;
}

}  // namespace

Eigen::MatrixXd interpolateNodata(const Eigen::MatrixXd& values,
                                  InterpMethod method, const Mask* target,
                                  double dx, double dy) {
  const Mask fillable = fillableCells(values, target);
  if (!fillable.any()) return values;

  switch (method) {
    case InterpMethod::Linear:
      return fillLinear(values, fillable);
    case InterpMethod::Nearest:
      return fillNearest(values, fillable, dx, dy);
    case InterpMethod::Idw:
      return fillIdw(values, fillable, dx, dy);
  }
  return values;
}

Raster interpolateNodata(const Raster& raster, InterpMethod method,
                         const Mask* target) {
  const auto& gt = raster.transform();
  const Eigen::MatrixXd filled =
      interpolateNodata(raster.masked(), method, target,
                        std::hypot(gt.dx, gt.ry), std::hypot(gt.rx, gt.dy));
  return raster.withMasked(filled);
}

SpreadResult spread2d(const Eigen::MatrixXd& obs, const Mask* mask, double dx,
                      double dy) {
  const Mask all = Mask::Constant(obs.rows(), obs.cols(), true);
  const Mask& passable = mask ? *mask : all;
  return spreadImpl(obs, passable, passable, dx, dy);
}

}  // namespace demfuse
