// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "demfuse/resample.hpp"

#include <gdalwarper.h>
#include <ogr_spatialref.h>

#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "demfuse/errors.hpp"
#include "gdal_dataset.hpp"

namespace demfuse {

namespace {

constexpr int kEdgeSamples = 21;

GDALResampleAlg toGdal(ResampleMethod method) {
  switch (method) {
    case ResampleMethod::Nearest:
      return GRA_NearestNeighbour;
    case ResampleMethod::Bilinear:
      return GRA_Bilinear;
    case ResampleMethod::Cubic:
      return GRA_Cubic;
    case ResampleMethod::Average:
      return GRA_Average;
    case ResampleMethod::Min:
      return GRA_Min;
    case ResampleMethod::Max:
      return GRA_Max;
  }
  return GRA_NearestNeighbour;
}

// Extent of `like` expressed in `to`, densified along the edges.
// Returns false if no edge point can be transformed.
bool transformedBounds(const Raster& like, const Crs& from, const Crs& to,
                       Bounds& out) {
  const OGRSpatialReference src = gdal::spatialReference(from);
  const OGRSpatialReference dst = gdal::spatialReference(to);
  std::unique_ptr<OGRCoordinateTransformation> ct(
      OGRCreateCoordinateTransformation(&src, &dst));
  if (!ct) return false;

  const Bounds b = like.bounds();
  std::vector<double> xs;
  std::vector<double> ys;
  for (int i = 0; i < kEdgeSamples; ++i) {
    const double t = static_cast<double>(i) / (kEdgeSamples - 1);
    const double x = b.xmin + t * (b.xmax - b.xmin);
    const double y = b.ymin + t * (b.ymax - b.ymin);
    xs.insert(xs.end(), {x, x, b.xmin, b.xmax});
    ys.insert(ys.end(), {b.ymin, b.ymax, y, y});
  }
  std::vector<int> ok(xs.size(), FALSE);
  ct->Transform(static_cast<int>(xs.size()), xs.data(), ys.data(), nullptr,
                ok.data());

  bool any = false;
  for (size_t k = 0; k < xs.size(); ++k) {
    if (!ok[k]) continue;
    if (!any) {
      out = Bounds{xs[k], ys[k], xs[k], ys[k]};
      any = true;
      continue;
    }
    out.xmin = std::min(out.xmin, xs[k]);
    out.xmax = std::max(out.xmax, xs[k]);
    out.ymin = std::min(out.ymin, ys[k]);
    out.ymax = std::max(out.ymax, ys[k]);
  }
  return any;
}

bool overlaps(const Raster& src, const Crs& src_crs, const Raster& like,
              const Crs& dst_crs) {
  if (src_crs == dst_crs || !src_crs.isDefined() || !dst_crs.isDefined()) {
    return src.bounds().intersects(like.bounds());
  }
  Bounds footprint;
  return transformedBounds(like, dst_crs, src_crs, footprint) &&
         src.bounds().intersects(footprint);
}

struct WarpOptionsDeleter {
  void operator()(GDALWarpOptions* opts) const {
    if (opts == nullptr) return;
    if (opts->pTransformerArg) {
      GDALDestroyGenImgProjTransformer(opts->pTransformerArg);
    }
    GDALDestroyWarpOptions(opts);
  }
};

}  // namespace

std::string toString(ResampleMethod method) {
  switch (method) {
    case ResampleMethod::Nearest:
      return "nearest";
    case ResampleMethod::Bilinear:
      return "bilinear";
    case ResampleMethod::Cubic:
      return "cubic";
    case ResampleMethod::Average:
      return "average";
    case ResampleMethod::Min:
      return "min";
    case ResampleMethod::Max:
      return "max";
  }
  return "unknown";
}

Raster GdalResampler::reproject(const Raster& src, const Raster& like,
                                ResampleMethod method) const {
  if (!src.isInitialized() || !like.isInitialized()) {
    throw CoverageError("source extent does not overlap the destination grid");
  }
  if (src.identicalGrid(like)) return src;

  // An undefined CRS is taken to match the other side
  const Crs src_crs = src.crs().isDefined() ? src.crs() : like.crs();
  const Crs dst_crs = like.crs().isDefined() ? like.crs() : src.crs();
  if (!overlaps(src, src_crs, like, dst_crs)) {
    throw CoverageError("source extent does not overlap the destination grid");
  }

  gdal::DatasetPtr src_ds = gdal::toMem(src, src_crs);
  gdal::DatasetPtr dst_ds = gdal::createMem(like, dst_crs, GDT_Float64, NAN, NAN);

  std::unique_ptr<GDALWarpOptions, WarpOptionsDeleter> opts(
      GDALCreateWarpOptions());
  opts->hSrcDS = GDALDataset::ToHandle(src_ds.get());
  opts->hDstDS = GDALDataset::ToHandle(dst_ds.get());
  opts->eResampleAlg = toGdal(method);
  opts->nBandCount = 1;
  opts->panSrcBands = static_cast<int*>(CPLMalloc(sizeof(int)));
  opts->panSrcBands[0] = 1;
  opts->panDstBands = static_cast<int*>(CPLMalloc(sizeof(int)));
  opts->panDstBands[0] = 1;
  opts->padfSrcNoDataReal = static_cast<double*>(CPLMalloc(sizeof(double)));
  opts->padfSrcNoDataReal[0] = NAN;
  opts->padfDstNoDataReal = static_cast<double*>(CPLMalloc(sizeof(double)));
  opts->padfDstNoDataReal[0] = NAN;
  opts->papszWarpOptions =
      CSLSetNameValue(opts->papszWarpOptions, "INIT_DEST", "NO_DATA");

  opts->pTransformerArg =
      GDALCreateGenImgProjTransformer2(opts->hSrcDS, opts->hDstDS, nullptr);
  if (opts->pTransformerArg == nullptr) {
    throw std::runtime_error("Failed to create transformer for EPSG:" +
                             std::to_string(src_crs.epsg) + " -> EPSG:" +
                             std::to_string(dst_crs.epsg));
  }
  opts->pfnTransformer = GDALGenImgProjTransform;

  GDALWarpOperation warp;
  if (warp.Initialize(opts.get()) != CE_None) {
    throw std::runtime_error("Failed to initialize warping operation");
  }
  if (warp.ChunkAndWarpImage(0, 0, like.cols(), like.rows()) != CE_None) {
    throw std::runtime_error("Failed to warp " + toString(method));
  }

  Raster result(like.rows(), like.cols(), like.transform(), dst_crs,
                src.nodata(), src.dtype());
  result.assignMasked(gdal::readBand(*dst_ds));
  return result;
}

Resampler::Ptr defaultResampler() {
  static const Resampler::Ptr instance = std::make_shared<GdalResampler>();
  return instance;
}

}  // namespace demfuse
