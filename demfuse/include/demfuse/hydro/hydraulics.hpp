// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * hydraulics.hpp
 *
 * Bankfull river depth from discharge, width and water surface slope.
 */

#ifndef DEMFUSE_HYDRO_HYDRAULICS_HPP
#define DEMFUSE_HYDRO_HYDRAULICS_HPP

#include <vector>

#include "demfuse/config/river_bathymetry.hpp"
#include "demfuse/hydro/river_network.hpp"
#include "demfuse/logging.hpp"

namespace demfuse {

constexpr double kGravity = 9.81;  ///< [m/s2]

/// Power law depth h = hc * Q^hp [m].
double powlawDepth(double qbankfull, double hc, double hp);

/// Uniform flow depth of a wide rectangular channel [m].
double manningDepth(double qbankfull, double rivwth, double slope,
                    double manning_n);

/**
 * @brief Bankfull depth per segment.
 *
 * Per-segment inputs are in network node order. `zs` and `rivdst` give the
 * water surface slope to the downstream segment; they are unused by the
 * power law. Depths are clipped at `cfg.min_rivdph`; segments with missing
 * discharge or width get `min_rivdph` and are reported as a warning.
 */
std::vector<double> riverDepth(const RiverNetwork& network,
                               const std::vector<double>& qbankfull,
                               const std::vector<double>& rivwth,
                               const std::vector<double>& zs,
                               const std::vector<double>& rivdst,
                               const config::Hydraulics& cfg,
                               const Logger& logger = nullptr);

}  // namespace demfuse

#endif  // DEMFUSE_HYDRO_HYDRAULICS_HPP
