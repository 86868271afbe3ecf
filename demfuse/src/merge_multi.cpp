// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "demfuse/merge/merge_multi.hpp"

#include "demfuse/errors.hpp"

namespace demfuse {

namespace {

constexpr double kDefaultNodata = -9999.0;

std::string label(const MergeSource& source, size_t index) {
  return source.name.empty() ? "#" + std::to_string(index) : source.name;
}

}  // namespace

ResampleMethod defaultResampleMethod(const Raster& src, const Raster& dst) {
  const double dx_src = src.cellSizeMeters();
  const double dx_dst = dst.cellSizeMeters();
  return dx_src >= dx_dst * (1.0 - 1e-9) ? ResampleMethod::Bilinear
                                         : ResampleMethod::Average;
}

Raster mergeMultiRasters(const std::vector<MergeSource>& sources,
                         const MultiMergeOptions& opts,
                         const MergeContext& ctx) {
  if (sources.empty()) {
    throw ConfigError("mergeMultiRasters: no sources given");
  }
  if (opts.buffer_cells < 0) {
    throw ConfigError("mergeMultiRasters: buffer_cells (" +
                      std::to_string(opts.buffer_cells) + ") must be >= 0");
  }
  for (const auto& source : sources) validatePolicy(source.policy);
  auto& log = sink(ctx.logger);

  // Accumulator on the destination grid
  const MergeSource& first = sources.front();
  const Raster& dst = opts.like ? *opts.like : first.raster;
  const ResampleMethod first_method = first.policy.resample_method.value_or(
      opts.like ? defaultResampleMethod(first.raster, dst)
                : ResampleMethod::Bilinear);
  log.debug("[MergeMulti] Resampling {} with {}", label(first, 0),
            toString(first_method));

  Eigen::MatrixXd values;
  try {
    values = prepareSource(first.raster, dst, first.policy, first_method, ctx);
  } catch (const CoverageError& e) {
    log.warn("[MergeMulti] Source {} skipped: {}", label(first, 0), e.what());
    values = Eigen::MatrixXd::Constant(dst.rows(), dst.cols(), NAN);
  }

  const double nodata =
      first.raster.hasFiniteNodata() ? first.raster.nodata() : kDefaultNodata;
  Raster acc(dst.rows(), dst.cols(), dst.transform(),
             dst.crs().isDefined() ? dst.crs() : first.raster.crs(), nodata,
             first.raster.dtype());
  acc.assignMasked(values);

  for (size_t i = 1; i < sources.size(); ++i) {
    const MergeSource& source = sources[i];
    if (source.policy.rule == MergeRule::First && acc.countNodata() == 0) {
      log.debug("[MergeMulti] Source {} skipped: no nodata left",
                label(source, i));
      continue;
    }

    MergePolicy policy = source.policy;
    if (!policy.resample_method) {
      policy.resample_method = defaultResampleMethod(source.raster, acc);
    }
    if (!policy.buffer_cells) policy.buffer_cells = opts.buffer_cells;
    if (!policy.interp_method) policy.interp_method = opts.interp_method;
    log.debug("[MergeMulti] Merging {} (rule={}, resample={})", label(source, i),
              toString(policy.rule), toString(*policy.resample_method));

    acc = mergeRasters(acc, source.raster, policy, ctx);
  }
  return acc;
}

}  // namespace demfuse
