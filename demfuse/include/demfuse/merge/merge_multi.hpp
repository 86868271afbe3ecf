// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * merge_multi.hpp
 *
 * Ordered fold of several sources onto one destination grid.
 */

#ifndef DEMFUSE_MERGE_MERGE_MULTI_HPP
#define DEMFUSE_MERGE_MERGE_MULTI_HPP

#include <optional>
#include <string>
#include <vector>

#include "demfuse/merge/merge.hpp"

namespace demfuse {

struct MergeSource {
  Raster raster;
  MergePolicy policy;
  std::string name;  ///< Used in log messages only
};

struct MultiMergeOptions {
  std::optional<Raster> like;  ///< Destination grid; unset: first source
  int buffer_cells = 0;        ///< Used where a policy sets none
  InterpMethod interp_method = InterpMethod::Linear;
};

/**
 * @brief Resampling method for a source when its policy sets none.
 *
 * Sources at least as coarse as the destination are resampled bilinearly,
 * finer sources are area-averaged.
 */
ResampleMethod defaultResampleMethod(const Raster& src, const Raster& dst);

/**
 * @brief Merge sources in priority order.
 *
 * The first source (resampled onto `opts.like` if given) becomes the
 * accumulator; the rest are merged into it one by one. A NaN nodata value
 * on the accumulator is replaced by -9999.
 *
 * @throws ConfigError for an empty source list or an invalid policy
 */
Raster mergeMultiRasters(const std::vector<MergeSource>& sources,
                         const MultiMergeOptions& opts = {},
                         const MergeContext& ctx = {});

}  // namespace demfuse

#endif  // DEMFUSE_MERGE_MERGE_MULTI_HPP
