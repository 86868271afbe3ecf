// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * river_segments.hpp
 *
 * River segment table shared by bed level estimation and burning.
 */

#ifndef DEMFUSE_BATHYMETRY_RIVER_SEGMENTS_HPP
#define DEMFUSE_BATHYMETRY_RIVER_SEGMENTS_HPP

#include <cmath>
#include <vector>

#include "demfuse/geometry.hpp"
#include "demfuse/hydro/river_network.hpp"

namespace demfuse {

/// One river segment. Missing values are NaN.
struct RiverSegment {
  int segid = 0;      ///< 1-based segment id
  int idx = -1;       ///< Head cell (linear index)
  int idx_ds = -1;    ///< Head cell of the downstream segment
  LineString geometry;
  std::vector<int> cells;

  double uparea = NAN;      ///< [km2]
  double rivdst = NAN;      ///< Distance to outlet [m]
  double rivlen = NAN;      ///< Distance to the downstream segment [m]
  double elevtn = NAN;      ///< [m+ref]
  int strord = 0;           ///< Strahler order

  double zs0 = NAN;         ///< Raw bankfull water level [m+ref]
  double zs = NAN;          ///< Bankfull water level [m+ref]
  double rivbank_dz = NAN;  ///< Bank height above elevtn [m]
  double rivwth = NAN;      ///< [m]
  double qbankfull = NAN;   ///< [m3/s]
  double rivdph0 = NAN;     ///< Unsmoothed depth [m]
  double rivdph = NAN;      ///< [m]
  double zb = NAN;          ///< Bed level [m+ref]
  double rivslp = NAN;      ///< Bed slope [m/m]
  int estuary = 0;
};

using RiverSegmentTable = std::vector<RiverSegment>;

/// Values of one attribute in table order.
std::vector<double> column(const RiverSegmentTable& table,
                           double RiverSegment::*field);

/// Write an attribute; `values` must match the table size.
void setColumn(RiverSegmentTable& table, double RiverSegment::*field,
               const std::vector<double>& values);

/// Segment network linked by (idx, idx_ds), main branch by uparea.
RiverNetwork segmentNetwork(const RiverSegmentTable& table);

std::vector<LineString> segmentLines(const RiverSegmentTable& table);

}  // namespace demfuse

#endif  // DEMFUSE_BATHYMETRY_RIVER_SEGMENTS_HPP
