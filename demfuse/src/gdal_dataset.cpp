// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "gdal_dataset.hpp"

#include <cmath>
#include <mutex>
#include <stdexcept>
#include <string>

#include "demfuse/errors.hpp"

namespace demfuse {
namespace gdal {

void registerDrivers() {
  static std::once_flag once;
  std::call_once(once, [] { GDALAllRegister(); });
}

OGRSpatialReference spatialReference(const Crs& crs) {
  OGRSpatialReference srs;
  if (srs.importFromEPSG(crs.epsg) != OGRERR_NONE) {
    throw ConfigError("Unknown CRS EPSG:" + std::to_string(crs.epsg));
  }
  srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
  return srs;
}

DatasetPtr createMem(const Raster& like, const Crs& crs, GDALDataType type,
                     double fill, double nodata) {
  registerDrivers();
  GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("MEM");
  if (driver == nullptr) {
    throw std::runtime_error("GDAL MEM driver is not available");
  }
  DatasetPtr ds(driver->Create("", like.cols(), like.rows(), 1, type, nullptr));
  if (!ds) {
    throw std::runtime_error("Failed to create in-memory dataset");
  }

  const GeoTransform& gt = like.transform();
  double coeffs[6] = {gt.x0, gt.dx, gt.rx, gt.y0, gt.ry, gt.dy};
  ds->SetGeoTransform(coeffs);
  if (crs.isDefined()) {
    const OGRSpatialReference srs = spatialReference(crs);
    ds->SetSpatialRef(&srs);
  }

  GDALRasterBand* band = ds->GetRasterBand(1);
  band->SetNoDataValue(nodata);
  if (band->Fill(fill) != CE_None) {
    throw std::runtime_error("Failed to initialize in-memory band");
  }
  return ds;
}

DatasetPtr toMem(const Raster& raster, const Crs& crs) {
  DatasetPtr ds = createMem(raster, crs, GDT_Float64, NAN, NAN);
  RowMajorXd buffer = raster.masked();
  if (ds->GetRasterBand(1)->RasterIO(GF_Write, 0, 0, raster.cols(),
                                     raster.rows(), buffer.data(),
                                     raster.cols(), raster.rows(), GDT_Float64,
                                     0, 0) != CE_None) {
    throw std::runtime_error("Failed to write raster to in-memory dataset");
  }
  return ds;
}

Eigen::MatrixXd readBand(GDALDataset& ds) {
  const int cols = ds.GetRasterXSize();
  const int rows = ds.GetRasterYSize();
  RowMajorXd buffer(rows, cols);
  if (ds.GetRasterBand(1)->RasterIO(GF_Read, 0, 0, cols, rows, buffer.data(),
                                    cols, rows, GDT_Float64, 0,
                                    0) != CE_None) {
    throw std::runtime_error("Failed to read in-memory dataset");
  }
  return buffer;
}

Eigen::MatrixXi readBandInt(GDALDataset& ds) {
  const int cols = ds.GetRasterXSize();
  const int rows = ds.GetRasterYSize();
  RowMajorXi buffer(rows, cols);
  if (ds.GetRasterBand(1)->RasterIO(GF_Read, 0, 0, cols, rows, buffer.data(),
                                    cols, rows, GDT_Int32, 0, 0) != CE_None) {
    throw std::runtime_error("Failed to read in-memory dataset");
  }
  return buffer;
}

}  // namespace gdal
}  // namespace demfuse
