// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * flow_direction.hpp
 *
 * D8 flow-direction network over raster cells.
 */

#ifndef DEMFUSE_HYDRO_FLOW_DIRECTION_HPP
#define DEMFUSE_HYDRO_FLOW_DIRECTION_HPP

#include <vector>

#include "demfuse/raster.hpp"

namespace demfuse {

/// Stream segment extracted from a FlowDirRaster.
struct StreamSegment {
  int idx = -1;            ///< Linear index of the upstream head cell
  int idx_ds = -1;         ///< Head cell of the downstream segment (-1: none)
  std::vector<int> cells;  ///< Cells from the head in flow direction
  bool pit = false;        ///< Last cell drains to a pit or leaves the mask
};

/**
 * @brief D8 flow-direction network.
 *
 * Every cell has at most one downstream neighbour, addressed by row-major
 * linear index. Pits drain nowhere (kPit); cells outside the network are
 * kNoFlow. The network never changes after construction; all derived
 * quantities and DEM adjustments are returned as new rasters.
 *
 * Distances and areas are in metres (geographic grids: 111111 m/degree).
 */
class FlowDirRaster {
 public:
  static constexpr int kPit = -1;
  static constexpr int kNoFlow = -2;

  FlowDirRaster() = default;

  /**
   * @param idxs_ds Downstream linear index per cell, kPit or kNoFlow
   * @param like    Grid the network lives on
   * @throws ConfigError on a size mismatch, out-of-grid index or a cycle
   */
  FlowDirRaster(std::vector<int> idxs_ds, const Raster& like);

  /**
   * @brief Network from ESRI D8 codes.
   *
   * 1=E 2=SE 4=S 8=SW 16=W 32=NW 64=N 128=NE; 0 and 255 are pits and 247
   * or the raster nodata value are outside the network. Cells draining off
   * the grid or into a nodata cell become pits.
   */
  static FlowDirRaster fromD8(const Raster& d8);

  /**
   * @brief Network derived from a DEM by priority flooding.
   *
   * Border cells and cells next to nodata are outlets. Depressions are
   * routed over their spill point.
   */
  static FlowDirRaster fromDem(const Raster& dem);

  int rows() const { return grid_.rows(); }
  int cols() const { return grid_.cols(); }
  int size() const { return static_cast<int>(idxs_ds_.size()); }
  const Raster& grid() const { return grid_; }

  bool isValid(int idx) const { return idxs_ds_[idx] != kNoFlow; }
  bool isPit(int idx) const { return idxs_ds_[idx] == kPit; }
  int downstream(int idx) const { return idxs_ds_[idx]; }
  const std::vector<int>& idxsDs() const { return idxs_ds_; }

  /// Valid cells ordered from upstream to downstream.
  const std::vector<int>& sequence() const { return seq_; }

  /// Upstream area including the cell itself [km2].
  Raster upstreamArea() const;

  /// Along-flow distance to the outlet [m].
  Raster distanceToOutlet() const;

  /// Strahler order within `mask` (all valid cells if null), 0 elsewhere.
  Raster streamOrder(const Mask* mask = nullptr) const;

  /**
   * @brief Height above nearest drainage.
   *
   * Elevation difference to the first drain cell downstream. Cells that
   * never reach a drain are nodata (-9999).
   */
  Raster hand(const Mask& drain, const Raster& elevation) const;

  /**
   * @brief Split the cells in `mask` into stream segments.
   *
   * A segment starts at a headwater or a confluence of two or more stream
   * branches and is at most `max_len` cells long (<= 0: unlimited).
   * Segments are ordered from upstream to downstream.
   */
  std::vector<StreamSegment> streams(const Mask& mask, int max_len = 0) const;

  /// Cell center line of a segment, extended to the downstream head.
  std::vector<Eigen::Vector2d> segmentLine(const StreamSegment& segment) const;

  /**
   * @brief Make elevation non-increasing in flow direction.
   *
   * Downstream cells higher than their upstream neighbour are lowered to
   * it. Nodata cells are left untouched.
   */
  Raster demAdjust(const Raster& elevation) const;

  /**
   * @brief Enforce D4 connectivity inside `mask`.
   *
   * For a masked cell draining diagonally where neither orthogonal cell
   * between it and its downstream cell is at or below its elevation, the
   * lower of those two cells is lowered to the cell elevation.
   */
  Raster digD4(const Raster& elevation, const Mask& mask) const;

  /// Metric length of the link from `idx` to its downstream cell.
  double linkLength(int idx) const;

 private:
  void buildSequence();

  std::vector<int> idxs_ds_;
  std::vector<int> seq_;
  Raster grid_;
};

}  // namespace demfuse

#endif  // DEMFUSE_HYDRO_FLOW_DIRECTION_HPP
