// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "demfuse/catalog.hpp"

#include <cmath>

#include "demfuse/errors.hpp"

namespace demfuse {

namespace {

constexpr double kNodata = -9999.0;

// False if the dataset cannot contribute to the `like` grid
bool covers(const Raster& raster, const Raster& like) {
  if (!raster.isInitialized()) return false;
  if (!like.isInitialized()) return true;
  if (raster.crs().isDefined() && like.crs().isDefined() &&
      raster.crs() != like.crs()) {
    return true;  // left to the resampler
  }
  return raster.bounds().intersects(like.bounds());
}

MultiPolygon validRegion(const DataCatalog& catalog, const std::string& name) {
  if (name.empty()) return {};
  auto features = catalog.features(name);
  if (!features) {
    throw ConfigError("Valid-region dataset '" + name + "' not found");
  }
  return toPolygons(*features);
}

}  // namespace

void InMemoryCatalog::addRaster(const std::string& name, Raster raster) {
  rasters_[name] = std::move(raster);
}

void InMemoryCatalog::addFeatures(const std::string& name,
                                  FeatureTable features) {
  features_[name] = std::move(features);
}

std::optional<Raster> InMemoryCatalog::raster(const std::string& name) const {
  auto it = rasters_.find(name);
  if (it == rasters_.end()) return std::nullopt;
  return it->second;
}

std::optional<FeatureTable> InMemoryCatalog::features(
    const std::string& name) const {
  auto it = features_.find(name);
  if (it == features_.end()) return std::nullopt;
  return it->second;
}

MultiPolygon toPolygons(const FeatureTable& features) {
  MultiPolygon polygons;
  for (const auto& f : features) {
    if (f.geometry.size() < 3) continue;
    polygons.emplace_back(f.geometry);
  }
  return polygons;
}

Raster reclassify(const Raster& classes, const std::map<int, double>& table) {
  Eigen::MatrixXd out = Eigen::MatrixXd::Constant(classes.rows(), classes.cols(), NAN);
  for (int c = 0; c < classes.cols(); ++c) {
    for (int r = 0; r < classes.rows(); ++r) {
      if (!classes.isValid(r, c)) continue;
      auto it = table.find(static_cast<int>(std::lround(classes(r, c))));
      if (it != table.end()) out(r, c) = it->second;
    }
  }
  Raster result(classes.rows(), classes.cols(), classes.transform(),
                classes.crs(), kNodata, DataType::Float32);
  result.assignMasked(out);
  return result;
}

std::vector<MergeSource> resolveDepDatasets(
    const DataCatalog& catalog, const std::vector<config::DepDataset>& datasets,
    const Raster& like, const Logger& logger) {
  auto& log = sink(logger);
  std::vector<MergeSource> sources;
  for (size_t i = 0; i < datasets.size(); ++i) {
    const auto& ds = datasets[i];
    if (ds.elevtn.empty()) {
      throw ConfigError("No 'elevtn' (topobathy) dataset provided in datasets_dep[" +
                        std::to_string(i) + "]");
    }
    auto elevtn = catalog.raster(ds.elevtn);
    if (!elevtn || !covers(*elevtn, like)) {
      log.warn("[Catalog] {} not used; probably because all the data is "
               "outside of the model region",
               ds.elevtn);
      continue;
    }

    MergeSource source;
    source.name = ds.elevtn;
    source.raster = std::move(*elevtn);
    auto& policy = source.policy;
    policy.rule = ds.merge_method;
    if (!ds.offset.empty()) {
      auto offset = catalog.raster(ds.offset);
      if (!offset) {
        throw ConfigError("Offset dataset '" + ds.offset + "' not found");
      }
      policy.offset = std::move(*offset);
    } else {
      policy.offset = ds.offset_value;
    }
    policy.min_valid = ds.zmin;
    policy.max_valid = ds.zmax;
    policy.valid_region = validRegion(catalog, ds.gdf_valid);
    policy.resample_method = ds.reproj_method;
    sources.push_back(std::move(source));
  }
  return sources;
}

std::vector<MergeSource> resolveRoughnessDatasets(
    const DataCatalog& catalog,
    const std::vector<config::RoughnessDataset>& datasets, const Raster& like,
    const Logger& logger) {
  auto& log = sink(logger);
  std::vector<MergeSource> sources;
  for (const auto& ds : datasets) {
    MergeSource source;
    if (!ds.manning.empty()) {
      source.name = ds.manning;
      auto manning = catalog.raster(ds.manning);
      if (manning) source.raster = std::move(*manning);
    } else if (!ds.lulc.empty()) {
      source.name = ds.lulc;
      auto lulc = catalog.raster(ds.lulc);
      if (lulc) source.raster = reclassify(*lulc, ds.reclass_table);
    } else {
      throw ConfigError("No 'manning' dataset provided in roughness datasets");
    }
    if (!covers(source.raster, like)) {
      log.warn("[Catalog] {} not used; probably because all the data is "
               "outside of the model region",
               source.name);
      continue;
    }
    source.policy.rule = ds.merge_method;
    source.policy.valid_region = validRegion(catalog, ds.gdf_valid);
    source.policy.resample_method = ds.reproj_method;
    sources.push_back(std::move(source));
  }
  return sources;
}

}  // namespace demfuse
