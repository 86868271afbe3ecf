// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * interpolate.hpp
 *
 * Nodata interpolation and nearest-value spreading for raster grids.
 */

#ifndef DEMFUSE_INTERPOLATE_HPP
#define DEMFUSE_INTERPOLATE_HPP

#include "demfuse/raster.hpp"

namespace demfuse {

/// Spatial interpolation method for nodata cells.
enum class InterpMethod {
  Linear,   ///< Harmonic (discrete Laplace) fill between valid cells
  Nearest,  ///< Value of the nearest valid cell
  Idw       ///< Inverse distance weighting (power 2)
};

/**
 * @brief Fill NaN cells from surrounding valid cells.
 *
 * Only NaN cells inside `target` are filled; other NaN cells act as
 * barriers. Cells that cannot be reached from any valid cell stay NaN.
 *
 * @param values Grid with NaN as nodata
 * @param method Interpolation method
 * @param target Cells to fill (nullptr: every NaN cell)
 * @param dx, dy Cell size, used for distances (Nearest, Idw)
 */
Eigen::MatrixXd interpolateNodata(const Eigen::MatrixXd& values,
                                  InterpMethod method,
                                  const Mask* target = nullptr,
                                  double dx = 1.0, double dy = 1.0);

/// Raster overload: nodata cells are filled, metadata is kept.
Raster interpolateNodata(const Raster& raster, InterpMethod method,
                         const Mask* target = nullptr);

/// Result of nearest-value spreading.
struct SpreadResult {
  Eigen::MatrixXd values;    ///< Spread values (NaN where unreached)
  Eigen::MatrixXd distance;  ///< Distance to the source cell [CRS units]
  Eigen::MatrixXi source;    ///< Row-major index of the source (-1 unreached)
};

/**
 * @brief Spread observed values to their nearest cells.
 *
 * Multi-source shortest path over 8-connected cells. Observations are the
 * finite cells of `obs`; with a mask, sources and paths are limited to
 * mask cells.
 */
SpreadResult spread2d(const Eigen::MatrixXd& obs, const Mask* mask = nullptr,
                      double dx = 1.0, double dy = 1.0);

}  // namespace demfuse

#endif  // DEMFUSE_INTERPOLATE_HPP
