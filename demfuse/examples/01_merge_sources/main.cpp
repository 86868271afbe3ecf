// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * 01_merge_sources - Topobathymetry from several elevation datasets
 *
 * Demonstrates:
 * - Registering datasets in an InMemoryCatalog
 * - Merging a fine land DEM with coarse bathymetry onto a model grid
 * - Smoothing the seam between the two sources
 * - Deriving Manning roughness from the merged elevation
 */

#include <spdlog/sinks/stdout_color_sinks.h>

#include <demfuse/demfuse.hpp>

#include <cmath>
#include <iostream>

using namespace demfuse;

namespace {

constexpr int kCells = 100;
constexpr double kRes = 30.0;
const Crs kUtm{32631, false};

// Land rises inland from a coastline at x = 1800 m; the sea is nodata
Raster makeLandDem() {
  const auto gt = GeoTransform::northUp(0.0, kCells * kRes, kRes);
  Raster dem(kCells, kCells, gt, kUtm, -9999.0, DataType::Float32);
  Eigen::MatrixXd z(kCells, kCells);
  for (int r = 0; r < kCells; ++r) {
    for (int c = 0; c < kCells; ++c) {
      const double x = (c + 0.5) * kRes;
      z(r, c) = x < 1800.0 ? 0.5 + (1800.0 - x) * 0.01 + 0.2 * std::sin(r * 0.3)
                           : NAN;
    }
  }
  dem.assignMasked(z);
  return dem;
}

// Coarse bathymetry sloping down offshore, covering the whole domain
Raster makeBathymetry() {
  const int n = kCells / 5;
  const auto gt = GeoTransform::northUp(0.0, kCells * kRes, kRes * 5);
  Eigen::MatrixXd z(n, n);
  for (int r = 0; r < n; ++r) {
    for (int c = 0; c < n; ++c) {
      const double x = (c + 0.5) * kRes * 5;
      z(r, c) = 1.0 - (x - 1500.0) * 0.008;
    }
  }
  return Raster(z, gt, kUtm, -9999.0, DataType::Float32);
}

void printStats(const Raster& raster, const std::string& name) {
  const Eigen::MatrixXd v = raster.masked();
  const Mask valid = raster.validMask();
  const double lo = valid.select(v.array(), INFINITY).minCoeff();
  const double hi = valid.select(v.array(), -INFINITY).maxCoeff();
  std::cout << "[" << name << "] " << raster.rows() << "x" << raster.cols()
            << ", nodata cells: " << raster.countNodata() << ", range: [" << lo
            << ", " << hi << "]" << std::endl;
}

}  // namespace

int main() {
  std::cout << "=== 01_merge_sources ===\n" << std::endl;

  auto logger = spdlog::stdout_color_mt("demfuse");
  logger->set_level(spdlog::level::debug);

  // 1. Datasets
  InMemoryCatalog catalog;
  catalog.addRaster("land_dem", makeLandDem());
  catalog.addRaster("bathymetry", makeBathymetry());

  // 2. Model grid: every cell active
  const auto gt = GeoTransform::northUp(0.0, kCells * kRes, kRes);
  ModelGrid model(Raster(Eigen::MatrixXd::Ones(kCells, kCells), gt, kUtm, 0.0,
                         DataType::UInt8),
                  logger);

  // 3. Merge, land DEM first, with a 3-cell seam band
  config::DepDataset land;
  land.elevtn = "land_dem";
  land.zmin = 0.0;
  config::DepDataset bathy;
  bathy.elevtn = "bathymetry";
  bathy.zmax = 0.5;

  config::Merge merge_cfg;
  merge_cfg.buffer_cells = 3;
  model.setupDep(catalog, {land, bathy}, merge_cfg);
  printStats(model.layer(layer::dep), "dep");

  // 4. Roughness from the elevation level
  config::Roughness rgh_cfg;
  model.setupManningRoughness(catalog, rgh_cfg);
  printStats(model.layer(layer::manning), "manning");

  return 0;
}
