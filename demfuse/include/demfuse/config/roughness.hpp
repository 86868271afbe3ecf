// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef DEMFUSE_CONFIG_ROUGHNESS_HPP
#define DEMFUSE_CONFIG_ROUGHNESS_HPP

#include <map>
#include <string>
#include <vector>

#include "demfuse/config/merge.hpp"

namespace demfuse::config {

/// Gridded Manning roughness, or land use mapped through a table.
struct RoughnessDataset {
  std::string manning;  ///< Manning raster; takes precedence over lulc
  std::string lulc;     ///< Land use / land cover raster
  std::map<int, double> reclass_table;  ///< Land use class -> Manning n
  std::string gdf_valid;  ///< Valid-region polygons
  MergeRule merge_method = MergeRule::First;
  std::optional<ResampleMethod> reproj_method;
};

/// Manning roughness setup.
struct Roughness {
  double manning_land = 0.04;  ///< [s.m-1/3]
  double manning_sea = 0.02;   ///< [s.m-1/3]
  double rgh_lev_land = 0.0;   ///< Elevation separating land from sea [m]
  std::vector<RoughnessDataset> datasets;
};

}  // namespace demfuse::config

#endif  // DEMFUSE_CONFIG_ROUGHNESS_HPP
