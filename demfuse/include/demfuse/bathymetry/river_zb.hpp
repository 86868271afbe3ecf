// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * river_zb.hpp
 *
 * River bed level reconstruction from bank heights and bankfull depth.
 */

#ifndef DEMFUSE_BATHYMETRY_RIVER_ZB_HPP
#define DEMFUSE_BATHYMETRY_RIVER_ZB_HPP

#include <optional>
#include <string>
#include <vector>

#include "demfuse/bathymetry/river_segments.hpp"
#include "demfuse/config/river_bathymetry.hpp"
#include "demfuse/hydro/flow_direction.hpp"
#include "demfuse/logging.hpp"

namespace demfuse {

/// Grids and tables consumed by getRiverZb().
struct RiverInputs {
  Raster elevtn;                 ///< Model elevation (required)
  std::optional<Raster> uparea;  ///< Upstream area [km2]; derived if unset
  std::optional<Mask> rivmsk;    ///< Known river cells
  std::optional<FeatureTable> rivers;     ///< "rivwth" and/or "qbankfull"
  std::optional<FeatureTable> qbankfull;  ///< Bankfull discharge, overrides
};

/// Bank heights per segment plus the masks they were derived from.
struct RivbankDz {
  std::vector<double> rivbank_dz;  ///< [m], table order
  Mask river_mask;                 ///< River cells excluding banks
  Mask bank_mask;                  ///< Ring of cells around the river
};

struct RiverZbResult {
  RiverSegmentTable segments;
  Mask river_mask;
};

/**
 * @brief Split the river cells of a flow network into segments.
 *
 * River cells have an upstream area above `cfg.river_upa`. Segments are at
 * most round(segment_length / cell size) cells long; head-cell attributes
 * (uparea, elevtn, rivdst, strord) are stored per segment and rivlen is the
 * distance to the downstream segment head.
 */
RiverSegmentTable extractSegments(const FlowDirRaster& flwdir,
                                  const Raster& elevtn, const Raster& uparea,
                                  const config::RiverBathymetry& cfg);

/**
 * @brief Copy attributes of the nearest feature onto each segment.
 *
 * The segment midpoint is matched against feature geometries; only
 * features within `max_dist` count. Missing attributes are left as is.
 */
void joinRiverAttributes(RiverSegmentTable& table, const FeatureTable& features,
                         const std::vector<std::string>& columns,
                         double max_dist);

/**
 * @brief River cells of the model grid.
 *
 * With widths, segment lines are buffered by max(rivwth / 2, 1) and
 * intersected with valid elevation (projected CRS only). With a river mask,
 * the all-touched segment lines are added to it.
 *
 * @throws ConfigError without width and mask, or for a geographic CRS
 */
Mask riverMask(const RiverSegmentTable& table, const Raster& elevtn,
               const std::optional<Mask>& rivmsk);

/**
 * @brief Bank height per segment from HAND.
 *
 * Bank cells form the ring around the (hole-filled) river mask with a
 * positive HAND and belong to the nearest segment. Each segment gets the
 * q-th percentile of its bank HAND values, or 0 with fewer than `nmin`
 * bank cells.
 */
RivbankDz getRivbankDz(const RiverSegmentTable& table, const Mask& river_mask,
                       const Raster& hand, int nmin = 20, double q = 25.0);

/// Mask area assigned to each segment divided by its length [m].
std::vector<double> segmentWidth(const RiverSegmentTable& table,
                                 const Mask& river_mask,
                                 const FlowDirRaster& flwdir);

/**
 * @brief Water level, depth and bed level from bank heights.
 *
 * Requires elevtn, rivdst, qbankfull and (except for the power law) rivwth
 * on every segment. Fills zs0, zs, rivbank_dz, rivdph0, rivdph, estuary, zb
 * and rivslp. Segments without bank height keep zs = elevtn.
 *
 * @throws ConfigError on a size mismatch or segment_length <= 0
 */
void estimateBedLevels(RiverSegmentTable& table, const RiverNetwork& network,
                       const std::vector<double>& rivbank_dz,
                       const config::RiverBathymetry& cfg,
                       const Logger& logger = nullptr);

/**
 * @brief Reconstruct river bed levels.
 *
 * Runs segment extraction, attribute joins, river mask, bank heights,
 * width refinement and bed level estimation.
 *
 * @throws ConfigError for missing elevation, bankfull discharge or width,
 *         or segment_length <= 0
 */
RiverZbResult getRiverZb(const RiverInputs& inputs, const FlowDirRaster& flwdir,
                         const config::RiverBathymetry& cfg,
                         const Logger& logger = nullptr);

}  // namespace demfuse

#endif  // DEMFUSE_BATHYMETRY_RIVER_ZB_HPP
