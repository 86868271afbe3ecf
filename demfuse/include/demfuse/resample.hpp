// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * resample.hpp
 *
 * Resampling interface and the default GDAL warp resampler.
 */

#ifndef DEMFUSE_RESAMPLE_HPP
#define DEMFUSE_RESAMPLE_HPP

#include <memory>
#include <string>

#include "demfuse/raster.hpp"

namespace demfuse {

enum class ResampleMethod { Nearest, Bilinear, Cubic, Average, Min, Max };

std::string toString(ResampleMethod method);

/**
 * @brief Resampler interface.
 *
 * Projects a source raster onto the pixel grid of another raster.
 * Semantic: "What does this dataset look like on that grid?"
 */
class Resampler {
 public:
  using Ptr = std::shared_ptr<const Resampler>;

  virtual ~Resampler() = default;

  /**
   * @brief Resample `src` onto the grid of `like`.
   *
   * The result has the grid and CRS of `like` and the nodata value and
   * dtype of `src`. Cells outside the source coverage are nodata.
   *
   * @throws CoverageError if the extents do not overlap
   */
  virtual Raster reproject(const Raster& src, const Raster& like,
                           ResampleMethod method) const = 0;
};

/**
 * @brief GDAL warp resampler.
 *
 * Runs GDALWarpOperation between in-memory copies of the two grids.
 * Rasters in different CRS are reprojected through PROJ; a raster
 * without CRS is taken to share the CRS of the other one. Area kernels
 * (average, min, max) ignore nodata source cells.
 *
 * @throws ConfigError if an EPSG code is unknown
 */
class GdalResampler : public Resampler {
 public:
  Raster reproject(const Raster& src, const Raster& like,
                   ResampleMethod method) const override;
};

/// Shared default instance.
Resampler::Ptr defaultResampler();

}  // namespace demfuse

#endif  // DEMFUSE_RESAMPLE_HPP
