// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * model.hpp
 *
 * Model grid holding the physical input layers of a flood model.
 */

#ifndef DEMFUSE_MODEL_HPP
#define DEMFUSE_MODEL_HPP

#include <map>
#include <string>
#include <vector>

#include "demfuse/bathymetry/river_zb.hpp"
#include "demfuse/catalog.hpp"
#include "demfuse/config/demfuse.hpp"
#include "demfuse/merge/merge_multi.hpp"

namespace demfuse {

/**
 * @brief Regular model grid and its layers.
 *
 * `msk` defines the grid every layer lives on. Setup methods replace the
 * layer they produce ("dep", "manning") and keep the others.
 */
struct ModelGrid {
  Raster msk;
  std::map<std::string, Raster> layers;
  RiverSegmentTable rivers;
  Mask river_mask;
  Logger logger;

  ModelGrid() = default;
  explicit ModelGrid(Raster mask, Logger log = nullptr);

  bool hasLayer(const std::string& name) const;

  /// @throws ConfigError if the layer has not been set up
  const Raster& layer(const std::string& name) const;

  /**
   * @brief Merge elevation sources into the "dep" layer.
   *
   * Cells still without data afterwards are filled by inverse distance
   * weighting, reported as a warning.
   */
  void setupDep(const std::vector<MergeSource>& sources, int buffer_cells = 0,
                InterpMethod interp_method = InterpMethod::Linear);

  /// @throws ConfigError if no configured dataset is usable
  void setupDep(const DataCatalog& catalog,
                const std::vector<config::DepDataset>& datasets,
                const config::Merge& cfg = {});

  /// Merge another elevation source into "dep" by the topobathy rules.
  void mergeTopobathy(const Raster& incoming, const config::Topobathy& cfg);

  /**
   * @brief Manning roughness layer.
   *
   * Gaps in the merged sources, or the whole grid without sources, get
   * `manning_land` where dep >= rgh_lev_land and `manning_sea` elsewhere
   * (land everywhere without a dep layer).
   */
  void setupManningRoughness(const std::vector<MergeSource>& sources,
                             double manning_land = 0.04,
                             double manning_sea = 0.02,
                             double rgh_lev_land = 0.0);

  void setupManningRoughness(const DataCatalog& catalog,
                             const config::Roughness& cfg);

  /**
   * @brief Estimate river bed levels and optionally burn them into "dep".
   *
   * An unset `inputs.elevtn` is taken from the "dep" layer.
   */
  void setupRiverBathymetry(const FlowDirRaster& flwdir, RiverInputs inputs,
                            const config::RiverBathymetry& cfg,
                            bool burn = true);
};

}  // namespace demfuse

#endif  // DEMFUSE_MODEL_HPP
