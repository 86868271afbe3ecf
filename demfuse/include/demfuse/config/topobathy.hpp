// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef DEMFUSE_CONFIG_TOPOBATHY_HPP
#define DEMFUSE_CONFIG_TOPOBATHY_HPP

#include <optional>

#include "demfuse/config/merge.hpp"

namespace demfuse::config {

/// Elevation merge with outlier masking and hole filling.
struct Topobathy {
  MergeRule merge_method = MergeRule::First;
  int merge_buffer = 0;            ///< Seam band width [cells]
  std::optional<double> elv_min;   ///< Lower elevation cap [m]
  std::optional<double> elv_max;   ///< Upper elevation cap [m]
  ResampleMethod reproj_method = ResampleMethod::Bilinear;
};

}  // namespace demfuse::config

#endif  // DEMFUSE_CONFIG_TOPOBATHY_HPP
