// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "demfuse/merge/topobathy.hpp"

#include <cmath>

#include "demfuse/errors.hpp"
#include "demfuse/morphology.hpp"

namespace demfuse {

Raster mergeTopobathy(const Raster& base, const Raster& incoming,
                      const TopobathyPolicy& policy, const MergeContext& ctx) {
  if (!base.hasFiniteNodata()) {
    throw ConfigError("mergeTopobathy: base raster requires a finite nodata value");
  }
  if (policy.rule == MergeRule::Mean) {
    throw ConfigError("mergeTopobathy: merge rule 'mean' is not supported");
  }
  if (policy.buffer_cells < 0) {
    throw ConfigError("mergeTopobathy: buffer_cells must be >= 0");
  }
  auto& log = sink(ctx.logger);

  MergePolicy filter;
  filter.offset = policy.offset;
  Eigen::MatrixXd inc;
  try {
    inc = prepareSource(incoming, base, filter, policy.resample_method, ctx);
  } catch (const CoverageError& e) {
    log.warn("[Topobathy] Skipping source: {}", e.what());
    return base;
  }

  const Eigen::MatrixXd b = base.masked();
  const Combination comb = combineValues(b, inc, policy.rule);
  Eigen::MatrixXd values = comb.values;

  // Region that may be interpolated: merged data plus its enclosed holes
  const Mask merged_valid = values.array().isFinite();
  const Mask region = merged_valid.all()
                          ? merged_valid
                          : binaryFillHoles(merged_valid, Connectivity::Eight);
  const Eigen::Index n_holes = (region && !merged_valid).count();

  // Outliers from the incoming source
  Mask outlier = Mask::Constant(values.rows(), values.cols(), false);
  if (policy.elv_min) {
    outlier = outlier || (inc.array() < *policy.elv_min);
  }
  if (policy.elv_max) {
    outlier = outlier || (inc.array() > *policy.elv_max);
  }
  outlier = outlier && comb.use_incoming;
  values = outlier.select(NAN, values);

  // Seam band
  const Mask support = b.array().isFinite() || inc.array().isFinite();
  const Mask band = seamBand(comb.use_incoming, support, policy.buffer_cells);
  values = band.select(NAN, values);

  const Mask target = region && values.array().isNaN();
  const Eigen::Index n_fill = target.count();
  if (n_fill > 0) {
    log.debug("[Topobathy] Interpolate topobathy at {} cells", n_fill);
    if (n_holes > 0) {
      log.warn("[Topobathy] {} interior nodata cells filled by interpolation",
               n_holes);
    }
    const auto& gt = base.transform();
    values = interpolateNodata(values, InterpMethod::Linear, &target,
                               std::hypot(gt.dx, gt.ry), std::hypot(gt.rx, gt.dy));
  }
  values = region.select(values, NAN);

  return base.withMasked(values);
}

Mask maskTopobathy(const Raster& elevation, std::optional<double> elv_min,
                   std::optional<double> elv_max) {
  Mask mask = elevation.validMask();
  const Eigen::MatrixXd values = elevation.masked();
  if (elv_min) {
    const Mask above = values.array() >= *elv_min;
    mask = mask && binaryFillHoles(above, Connectivity::Four);
  }
  if (elv_max) {
    mask = mask && (values.array() <= *elv_max);
  }
  return mask;
}

}  // namespace demfuse
