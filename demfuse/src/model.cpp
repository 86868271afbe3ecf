// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "demfuse/model.hpp"

#include "demfuse/bathymetry/burn.hpp"
#include "demfuse/errors.hpp"
#include "demfuse/interpolate.hpp"
#include "demfuse/merge/topobathy.hpp"

namespace demfuse {

namespace {

constexpr double kNodata = -9999.0;

}  // namespace

ModelGrid::ModelGrid(Raster mask, Logger log)
    : msk(std::move(mask)), logger(std::move(log)) {
  if (!msk.isInitialized()) {
    throw ConfigError("ModelGrid: empty model grid");
  }
}

bool ModelGrid::hasLayer(const std::string& name) const {
  return layers.count(name) > 0;
}

const Raster& ModelGrid::layer(const std::string& name) const {
  auto it = layers.find(name);
  if (it == layers.end()) {
    throw ConfigError("ModelGrid: layer '" + name + "' has not been set up");
  }
  return it->second;
}

// ─── Elevation ──────────────────────────────────────────────────────────────

void ModelGrid::setupDep(const std::vector<MergeSource>& sources,
                         int buffer_cells, InterpMethod interp_method) {
  auto& log = sink(logger);
  MultiMergeOptions opts;
  opts.like = msk;
  opts.buffer_cells = buffer_cells;
  opts.interp_method = interp_method;
  Raster dep = mergeMultiRasters(sources, opts, {logger, nullptr});

  const Eigen::Index n_missing = dep.countNodata();
  if (n_missing > 0) {
    log.warn("[Model] Interpolate data at {} cells", n_missing);
    dep = interpolateNodata(dep, InterpMethod::Idw);
  }
  layers[layer::dep] = std::move(dep);
}

void ModelGrid::setupDep(const DataCatalog& catalog,
                         const std::vector<config::DepDataset>& datasets,
                         const config::Merge& cfg) {
  const auto sources = resolveDepDatasets(catalog, datasets, msk, logger);
  if (sources.empty()) {
    throw ConfigError("ModelGrid: no usable elevation dataset");
  }
  setupDep(sources, cfg.buffer_cells, cfg.interp_method);
}

void ModelGrid::mergeTopobathy(const Raster& incoming,
                               const config::Topobathy& cfg) {
  TopobathyPolicy policy;
  policy.rule = cfg.merge_method;
  policy.buffer_cells = cfg.merge_buffer;
  policy.elv_min = cfg.elv_min;
  policy.elv_max = cfg.elv_max;
  policy.resample_method = cfg.reproj_method;
  layers[layer::dep] =
      demfuse::mergeTopobathy(layer(layer::dep), incoming, policy, {logger, nullptr});
}

// ─── Roughness ──────────────────────────────────────────────────────────────

void ModelGrid::setupManningRoughness(const std::vector<MergeSource>& sources,
                                      double manning_land, double manning_sea,
                                      double rgh_lev_land) {
  auto& log = sink(logger);
  const Mask active = msk.validMask() && (msk.masked().array() > 0.0);

  Eigen::MatrixXd man;
  bool from_dep = sources.empty();
  if (!sources.empty()) {
    MultiMergeOptions opts;
    opts.like = msk;
    man = mergeMultiRasters(sources, opts, {logger, nullptr}).masked();
    from_dep = (active && man.array().isNaN()).any();
  }

  if (from_dep) {
    Eigen::MatrixXd man0;
    if (hasLayer(layer::dep)) {
      const Eigen::MatrixXd dep = layer(layer::dep).masked();
      man0 = (dep.array() >= rgh_lev_land).select(manning_land,
                                                  Eigen::MatrixXd::Constant(dep.rows(), dep.cols(), manning_sea));
    } else {
      man0 = Eigen::MatrixXd::Constant(msk.rows(), msk.cols(), manning_land);
    }
    if (!sources.empty()) {
      log.warn("[Model] nan values in manning roughness array");
      man = man.array().isNaN().select(man0, man);
    } else {
      man = man0;
    }
  }

  Raster out(msk.rows(), msk.cols(), msk.transform(), msk.crs(), kNodata,
             DataType::Float32);
  out.assignMasked(man);
  layers[layer::manning] = std::move(out);
}

void ModelGrid::setupManningRoughness(const DataCatalog& catalog,
                                      const config::Roughness& cfg) {
  const auto sources =
      resolveRoughnessDatasets(catalog, cfg.datasets, msk, logger);
  setupManningRoughness(sources, cfg.manning_land, cfg.manning_sea,
                        cfg.rgh_lev_land);
}

// ─── Rivers ─────────────────────────────────────────────────────────────────

void ModelGrid::setupRiverBathymetry(const FlowDirRaster& flwdir,
                                     RiverInputs inputs,
                                     const config::RiverBathymetry& cfg,
                                     bool burn) {
  if (!inputs.elevtn.isInitialized() && hasLayer(layer::dep)) {
    inputs.elevtn = layer(layer::dep);
  }
  auto result = getRiverZb(inputs, flwdir, cfg, logger);
  rivers = std::move(result.segments);
  river_mask = std::move(result.river_mask);

  if (burn) {
    layers[layer::dep] = burnRiverZb(rivers, inputs.elevtn, river_mask, &flwdir,
                                     cfg.adjust_dem, logger);
  }
}

}  // namespace demfuse
