// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * gdal_dataset.hpp
 *
 * In-memory GDAL datasets mirroring a Raster grid. Internal to the
 * resampling and rasterization code.
 */

#ifndef DEMFUSE_GDAL_DATASET_HPP
#define DEMFUSE_GDAL_DATASET_HPP

#include <gdal_priv.h>
#include <ogr_spatialref.h>

#include <memory>

#include "demfuse/raster.hpp"

namespace demfuse {
namespace gdal {

struct DatasetCloser {
  void operator()(GDALDataset* ds) const {
    if (ds) GDALClose(GDALDataset::ToHandle(ds));
  }
};

using DatasetPtr = std::unique_ptr<GDALDataset, DatasetCloser>;

using RowMajorXd =
    Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using RowMajorXi =
    Eigen::Matrix<int, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// Register all drivers once per process.
void registerDrivers();

/**
 * @brief Spatial reference for an EPSG code, in lon/lat axis order.
 *
 * @throws ConfigError if PROJ does not know the code
 */
OGRSpatialReference spatialReference(const Crs& crs);

/**
 * @brief Empty single-band MEM dataset on the grid of `like`.
 *
 * The band is filled with `fill` and tagged with `nodata`. `crs` may
 * differ from like.crs(); an undefined CRS leaves the dataset without
 * spatial reference.
 */
DatasetPtr createMem(const Raster& like, const Crs& crs, GDALDataType type,
                     double fill, double nodata);

/// Float64 MEM copy of `raster` with NaN as nodata.
DatasetPtr toMem(const Raster& raster, const Crs& crs);

/// Band 1 as double, row-major, converted to an Eigen matrix.
Eigen::MatrixXd readBand(GDALDataset& ds);

/// Band 1 as int.
Eigen::MatrixXi readBandInt(GDALDataset& ds);

}  // namespace gdal
}  // namespace demfuse

#endif  // DEMFUSE_GDAL_DATASET_HPP
