// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "demfuse/merge/merge.hpp"

#include <cmath>

#include "demfuse/errors.hpp"
#include "demfuse/morphology.hpp"

namespace demfuse {

std::string toString(MergeRule rule) {
  switch (rule) {
    case MergeRule::First:
      return "first";
    case MergeRule::Last:
      return "last";
    case MergeRule::Min:
      return "min";
    case MergeRule::Max:
      return "max";
    case MergeRule::Mean:
      return "mean";
  }
  return "unknown";
}

void validatePolicy(const MergePolicy& policy) {
  if (policy.buffer_cells && *policy.buffer_cells < 0) {
    throw ConfigError("merge policy: buffer_cells (" +
                      std::to_string(*policy.buffer_cells) + ") must be >= 0");
  }
  if (policy.min_valid && policy.max_valid &&
      *policy.min_valid > *policy.max_valid) {
    throw ConfigError("merge policy: min_valid (" +
                      std::to_string(*policy.min_valid) + ") > max_valid (" +
                      std::to_string(*policy.max_valid) + ")");
  }
}

Eigen::MatrixXd prepareSource(const Raster& src, const Raster& like,
                              const MergePolicy& policy, ResampleMethod method,
                              const MergeContext& ctx) {
  const Resampler& resampler =
      ctx.resampler ? *ctx.resampler : *defaultResampler();
  Eigen::MatrixXd values = resampler.reproject(src, like, method).masked();

  // 1. Vertical offset (NaN stays NaN)
  if (const double* constant = std::get_if<double>(&policy.offset)) {
    if (*constant != 0.0) values.array() += *constant;
  } else {
    const Raster& offset = std::get<Raster>(policy.offset);
    Eigen::MatrixXd shift;
    try {
      shift = resampler.reproject(offset, like, ResampleMethod::Bilinear).masked();
      shift = shift.array().isNaN().select(0.0, shift);
    } catch (const CoverageError&) {
      sink(ctx.logger).warn("[Merge] Offset raster does not cover the grid, using 0");
      shift = Eigen::MatrixXd::Zero(like.rows(), like.cols());
    }
    values += shift;
  }

  // 2. Valid range, in the destination datum
  if (policy.min_valid) {
    values = (values.array() < *policy.min_valid).select(NAN, values);
  }
  if (policy.max_valid) {
    values = (values.array() > *policy.max_valid).select(NAN, values);
  }

  // 3. Valid region
  if (!policy.valid_region.empty()) {
    const Mask inside = geometryMask(like, policy.valid_region);
    values = inside.select(values, NAN);
  }
  return values;
}

Combination combineValues(const Eigen::MatrixXd& base,
                          const Eigen::MatrixXd& incoming, MergeRule rule) {
  const Mask base_valid = base.array().isFinite();
  const Mask inc_valid = incoming.array().isFinite();

  Combination out;
  switch (rule) {
    case MergeRule::First:
      out.use_incoming = !base_valid && inc_valid;
      break;
    case MergeRule::Last:
      out.use_incoming = inc_valid;
      break;
    case MergeRule::Mean:
      out.use_incoming = inc_valid;
      break;
    case MergeRule::Max:
      out.use_incoming =
          inc_valid && (!base_valid || incoming.array() > base.array());
      break;
    case MergeRule::Min:
      out.use_incoming =
          inc_valid && (!base_valid || incoming.array() < base.array());
      break;
  }

  out.values = out.use_incoming.select(incoming, base);
  if (rule == MergeRule::Mean) {
    const Mask both = base_valid && inc_valid;
    out.values = both.select(0.5 * (base.array() + incoming.array()), out.values);
  }
  return out;
}

Mask seamBand(const Mask& use_incoming, const Mask& support, int buffer_cells) {
  if (buffer_cells <= 0 || !use_incoming.any()) {
    return Mask::Constant(use_incoming.rows(), use_incoming.cols(), false);
  }
  const Mask dilated =
      binaryDilation(use_incoming, buffer_cells, Connectivity::Eight);
  return dilated && !use_incoming && support;
}

Raster mergeRasters(const Raster& base, const Raster& incoming,
                    const MergePolicy& policy, const MergeContext& ctx) {
  if (!base.hasFiniteNodata()) {
    throw ConfigError("mergeRasters: base raster requires a finite nodata value");
  }
  validatePolicy(policy);
  auto& log = sink(ctx.logger);

  const ResampleMethod method =
      policy.resample_method.value_or(ResampleMethod::Bilinear);
  Eigen::MatrixXd inc;
  try {
    inc = prepareSource(incoming, base, policy, method, ctx);
  } catch (const CoverageError& e) {
    log.warn("[Merge] Skipping source: {}", e.what());
    return base;
  }

  const Eigen::MatrixXd b = base.masked();
  Combination comb = combineValues(b, inc, policy.rule);
  log.debug("[Merge] rule={} resample={} cells from incoming: {}",
            toString(policy.rule), toString(method), comb.use_incoming.count());

  const int buffer = policy.buffer_cells.value_or(0);
  if (buffer > 0) {
    const Mask support = b.array().isFinite() || inc.array().isFinite();
    const Mask band = seamBand(comb.use_incoming, support, buffer);
    if (band.any()) {
      const Eigen::MatrixXd holed = band.select(NAN, comb.values);
      const auto& gt = base.transform();
      const Eigen::MatrixXd filled =
          interpolateNodata(holed,
                            policy.interp_method.value_or(InterpMethod::Linear),
                            &band,
                            std::hypot(gt.dx, gt.ry), std::hypot(gt.rx, gt.dy));
      // Band cells the interpolation cannot reach keep their merged value
      comb.values = (band && filled.array().isFinite()).select(filled, comb.values);
      log.debug("[Merge] Smoothed {} seam cells", band.count());
    }
  }

  return base.withMasked(comb.values);
}

}  // namespace demfuse
