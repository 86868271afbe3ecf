// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "demfuse/bathymetry/burn.hpp"

#include <cmath>

#include "demfuse/errors.hpp"
#include "demfuse/interpolate.hpp"

namespace demfuse {

Raster burnRiverZb(const RiverSegmentTable& table, const Raster& elevation,
                   const Mask& mask, const FlowDirRaster* flwdir,
                   bool adjust_dem, const Logger& logger) {
  if (mask.rows() != elevation.rows() || mask.cols() != elevation.cols()) {
    throw ConfigError("burnRiverZb: river mask does not match the elevation grid");
  }
  if (flwdir &&
      (flwdir->rows() != elevation.rows() || flwdir->cols() != elevation.cols())) {
    throw ConfigError("burnRiverZb: flow network does not match the elevation grid");
  }
  auto& log = sink(logger);
  log.debug("[Burn] Burn bedlevel values into DEM");

  const Eigen::MatrixXd z0 = elevation.masked();
  const Eigen::MatrixXi ids = rasterizeLines(elevation, segmentLines(table));

  Eigen::MatrixXd zb = Eigen::MatrixXd::Constant(z0.rows(), z0.cols(), NAN);
  for (Eigen::Index c = 0; c < ids.cols(); ++c) {
    for (Eigen::Index r = 0; r < ids.rows(); ++r) {
      if (ids(r, c) >= 0) zb(r, c) = table[ids(r, c)].zb;
    }
  }

  // Linear bed profile along each segment
  if (flwdir) {
    log.debug("[Burn] Interpolate bedlevel values");
    const Raster distnc = flwdir->distanceToOutlet();
    for (Eigen::Index c = 0; c < ids.cols(); ++c) {
      for (Eigen::Index r = 0; r < ids.rows(); ++r) {
        if (ids(r, c) < 0) continue;
        const auto& seg = table[ids(r, c)];
        const int ri = static_cast<int>(r);
        const int ci = static_cast<int>(c);
        if (!(seg.rivdst > 0.0) || !std::isfinite(seg.rivslp) ||
            !distnc.isValid(ri, ci)) {
          continue;
        }
        zb(r, c) += (distnc(ri, ci) - seg.rivdst) * seg.rivslp;
      }
    }
  }

  // Spread over the river mask, never raise the DEM
  const auto& gt = elevation.transform();
  const Eigen::MatrixXd spread =
      spread2d(zb, &mask, std::hypot(gt.dx, gt.ry), std::hypot(gt.rx, gt.dy)).values;
  Eigen::MatrixXd z1 = z0;
  for (Eigen::Index c = 0; c < z0.cols(); ++c) {
    for (Eigen::Index r = 0; r < z0.rows(); ++r) {
      if (mask(r, c) && std::isfinite(z0(r, c)) && std::isfinite(spread(r, c))) {
        z1(r, c) = std::min(z0(r, c), spread(r, c));
      }
    }
  }
  Raster out = elevation.withMasked(z1);

  if (adjust_dem && flwdir) {
    log.debug("[Burn] Correct for D4 connectivity bed level");
    const Raster adjusted = flwdir->digD4(flwdir->demAdjust(out), mask);
    const Eigen::MatrixXd za = adjusted.masked();
    for (Eigen::Index c = 0; c < z0.cols(); ++c) {
      for (Eigen::Index r = 0; r < z0.rows(); ++r) {
        if (mask(r, c) && std::isfinite(z0(r, c))) {
          z1(r, c) = std::min(z0(r, c), za(r, c));
        }
      }
    }
    out = elevation.withMasked(z1);
  }
  return out;
}

}  // namespace demfuse
