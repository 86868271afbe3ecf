// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef DEMFUSE_BATHYMETRY_BURN_HPP
#define DEMFUSE_BATHYMETRY_BURN_HPP

#include "demfuse/bathymetry/river_segments.hpp"
#include "demfuse/hydro/flow_direction.hpp"
#include "demfuse/logging.hpp"

namespace demfuse {

/**
 * @brief Burn segment bed levels into an elevation raster.
 *
 * Bed levels are drawn along the segment lines (downstream segments last),
 * spread over the river mask and merged by taking the cell-wise minimum,
 * so no cell is raised. With a flow network, bed levels are interpolated
 * along each segment using rivslp and rivdst, and with `adjust_dem` the
 * river cells are made monotonic and D4 connected.
 *
 * Cells outside the mask and nodata cells are returned unchanged.
 *
 * @param flwdir Flow network on the elevation grid, or nullptr
 * @throws ConfigError if mask, network and elevation grids differ
 */
Raster burnRiverZb(const RiverSegmentTable& table, const Raster& elevation,
                   const Mask& mask, const FlowDirRaster* flwdir = nullptr,
                   bool adjust_dem = true, const Logger& logger = nullptr);

}  // namespace demfuse

#endif  // DEMFUSE_BATHYMETRY_BURN_HPP
