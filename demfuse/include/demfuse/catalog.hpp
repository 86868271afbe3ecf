// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * catalog.hpp
 *
 * Named access to rasters and feature tables, and resolution of configured
 * datasets into merge sources.
 */

#ifndef DEMFUSE_CATALOG_HPP
#define DEMFUSE_CATALOG_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "demfuse/config/merge.hpp"
#include "demfuse/config/roughness.hpp"
#include "demfuse/geometry.hpp"
#include "demfuse/logging.hpp"
#include "demfuse/merge/merge_multi.hpp"

namespace demfuse {

/**
 * @brief Source of named datasets.
 *
 * Implementations wrap whatever storage holds the data (files, tiles,
 * services); the library only reads through this interface.
 */
class DataCatalog {
 public:
  using Ptr = std::shared_ptr<DataCatalog>;

  virtual ~DataCatalog() = default;

  /// Raster by name, std::nullopt if the catalog has none.
  virtual std::optional<Raster> raster(const std::string& name) const = 0;

  /// Feature table by name, std::nullopt if the catalog has none.
  virtual std::optional<FeatureTable> features(const std::string& name) const = 0;
};

/// Catalog over datasets held in memory.
class InMemoryCatalog : public DataCatalog {
 public:
  void addRaster(const std::string& name, Raster raster);
  void addFeatures(const std::string& name, FeatureTable features);

  std::optional<Raster> raster(const std::string& name) const override;
  std::optional<FeatureTable> features(const std::string& name) const override;

 private:
  std::map<std::string, Raster> rasters_;
  std::map<std::string, FeatureTable> features_;
};

/// Closed polygons from feature geometries (rings with three or more vertices).
MultiPolygon toPolygons(const FeatureTable& features);

/**
 * @brief Map classes through a lookup table.
 *
 * Cells with nodata or a class missing from `table` become nodata (-9999).
 */
Raster reclassify(const Raster& classes, const std::map<int, double>& table);

/**
 * @brief Turn elevation dataset entries into merge sources.
 *
 * Datasets the catalog cannot provide, or whose extent misses `like`, are
 * skipped with a warning.
 *
 * @throws ConfigError for an entry without elevation name, or a missing
 *         offset or valid-region dataset
 */
std::vector<MergeSource> resolveDepDatasets(
    const DataCatalog& catalog, const std::vector<config::DepDataset>& datasets,
    const Raster& like, const Logger& logger = nullptr);

/// Roughness datasets as merge sources; land use is reclassified first.
std::vector<MergeSource> resolveRoughnessDatasets(
    const DataCatalog& catalog,
    const std::vector<config::RoughnessDataset>& datasets, const Raster& like,
    const Logger& logger = nullptr);

}  // namespace demfuse

#endif  // DEMFUSE_CATALOG_HPP
