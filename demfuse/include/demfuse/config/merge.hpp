// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * merge.hpp
 *
 * Merge configuration: seam smoothing defaults and elevation datasets.
 */

#ifndef DEMFUSE_CONFIG_MERGE_HPP
#define DEMFUSE_CONFIG_MERGE_HPP

#include <optional>
#include <string>

#include "demfuse/interpolate.hpp"
#include "demfuse/resample.hpp"

namespace demfuse {

/// How valid incoming cells combine with the accumulator.
enum class MergeRule {
  First,  ///< Fill base nodata only
  Last,   ///< Every valid incoming cell wins
  Min,    ///< Incoming wins where strictly lower
  Max,    ///< Incoming wins where strictly higher
  Mean    ///< Fill base nodata, average where both are valid
};

namespace config {

/// Defaults for multi-source merging.
struct Merge {
  int buffer_cells = 0;  ///< Seam band width [cells]
  InterpMethod interp_method = InterpMethod::Linear;
};

/**
 * @brief One elevation dataset entry.
 *
 * Names refer to entries of a DataCatalog.
 */
struct DepDataset {
  std::string elevtn;      ///< Elevation raster (required)
  std::string offset;      ///< Offset raster; empty: use offset_value
  double offset_value = 0.0;
  std::optional<double> zmin;  ///< Valid range, after offset
  std::optional<double> zmax;
  std::string gdf_valid;   ///< Valid-region polygons (key: mask)
  MergeRule merge_method = MergeRule::First;
  std::optional<ResampleMethod> reproj_method;  ///< Unset: by resolution
};

}  // namespace config
}  // namespace demfuse

#endif  // DEMFUSE_CONFIG_MERGE_HPP
