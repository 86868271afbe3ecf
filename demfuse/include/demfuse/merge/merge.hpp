// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * merge.hpp
 *
 * Pairwise raster merge with offset/range/region filtering and seam
 * smoothing.
 */

#ifndef DEMFUSE_MERGE_MERGE_HPP
#define DEMFUSE_MERGE_MERGE_HPP

#include <optional>
#include <string>
#include <variant>

#include "demfuse/config/merge.hpp"
#include "demfuse/geometry.hpp"
#include "demfuse/interpolate.hpp"
#include "demfuse/logging.hpp"
#include "demfuse/raster.hpp"
#include "demfuse/resample.hpp"

namespace demfuse {

std::string toString(MergeRule rule);

/**
 * @brief Per-source merge settings.
 *
 * Offset, range and region filters are applied to the incoming raster in
 * that order, so range thresholds are in the destination vertical datum.
 */
struct MergePolicy {
  MergeRule rule = MergeRule::First;
  std::variant<double, Raster> offset = 0.0;  ///< Constant or per-cell offset
  std::optional<double> min_valid;
  std::optional<double> max_valid;
  MultiPolygon valid_region;                     ///< Empty: no region filter
  std::optional<ResampleMethod> resample_method; ///< Unset: bilinear (pairwise)
  std::optional<int> buffer_cells;               ///< Seam band width [cells]
  std::optional<InterpMethod> interp_method;     ///< Unset: linear
};

/// Resampler and diagnostic sink shared by all merge entry points.
struct MergeContext {
  Logger logger;               ///< nullptr: no-op sink
  Resampler::Ptr resampler;    ///< nullptr: GdalResampler
};

/// @throws ConfigError on negative buffer or min_valid > max_valid
void validatePolicy(const MergePolicy& policy);

/**
 * @brief Resample a source onto `like` and apply the policy filters.
 *
 * @return NaN-masked values on the grid of `like`
 * @throws CoverageError if the source does not overlap `like`
 */
Eigen::MatrixXd prepareSource(const Raster& src, const Raster& like,
                              const MergePolicy& policy, ResampleMethod method,
                              const MergeContext& ctx);

/// Merged values before seam smoothing.
struct Combination {
  Eigen::MatrixXd values;  ///< NaN-masked merged values
  Mask use_incoming;       ///< Cells taken from or averaged with incoming
};

/// Combine NaN-masked base and incoming values by `rule`.
Combination combineValues(const Eigen::MatrixXd& base,
                          const Eigen::MatrixXd& incoming, MergeRule rule);

/**
 * @brief Seam band around the incoming selection.
 *
 * Cells within `buffer_cells` (8-connected) of the selection that were
 * not selected themselves, restricted to `support`.
 */
Mask seamBand(const Mask& use_incoming, const Mask& support, int buffer_cells);

/**
 * @brief Merge `incoming` into `base`.
 *
 * The result has the grid, nodata value and dtype of `base`. An incoming
 * raster that does not overlap the base is skipped with a warning. The
 * seam band width is `policy.buffer_cells` (0 if unset).
 *
 * @throws ConfigError if `base` has no finite nodata value
 */
Raster mergeRasters(const Raster& base, const Raster& incoming,
                    const MergePolicy& policy, const MergeContext& ctx = {});

}  // namespace demfuse

#endif  // DEMFUSE_MERGE_MERGE_HPP
