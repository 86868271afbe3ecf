// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * topobathy.hpp
 *
 * Elevation-specific merge: outlier masking and interior hole filling.
 */

#ifndef DEMFUSE_MERGE_TOPOBATHY_HPP
#define DEMFUSE_MERGE_TOPOBATHY_HPP

#include <optional>
#include <variant>

#include "demfuse/merge/merge.hpp"

namespace demfuse {

struct TopobathyPolicy {
  MergeRule rule = MergeRule::First;  ///< first, last, min or max
  std::variant<double, Raster> offset = 0.0;
  int buffer_cells = 0;
  std::optional<double> elv_min;  ///< Applied after offset
  std::optional<double> elv_max;
  ResampleMethod resample_method = ResampleMethod::Bilinear;
};

/**
 * @brief Merge two elevation rasters.
 *
 * Incoming cells selected by the rule but outside [elv_min, elv_max] are
 * discarded. Seam band cells, discarded cells and nodata holes enclosed by
 * valid data are then filled by linear interpolation. Nodata regions open
 * to the raster border stay nodata.
 *
 * @throws ConfigError if `base` has no finite nodata value or the rule is
 *         `mean`
 */
Raster mergeTopobathy(const Raster& base, const Raster& incoming,
                      const TopobathyPolicy& policy,
                      const MergeContext& ctx = {});

/**
 * @brief Valid elevation cells within [elv_min, elv_max].
 *
 * Cells below `elv_min` are excluded only where they connect to the
 * outside of the region above `elv_min`; enclosed local sinks are kept.
 */
Mask maskTopobathy(const Raster& elevation, std::optional<double> elv_min,
                   std::optional<double> elv_max = std::nullopt);

}  // namespace demfuse

#endif  // DEMFUSE_MERGE_TOPOBATHY_HPP
