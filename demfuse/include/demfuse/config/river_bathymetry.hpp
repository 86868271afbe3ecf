// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * river_bathymetry.hpp
 *
 * River bed reconstruction and hydraulic depth parameters.
 */

#ifndef DEMFUSE_CONFIG_RIVER_BATHYMETRY_HPP
#define DEMFUSE_CONFIG_RIVER_BATHYMETRY_HPP

namespace demfuse {

/// Bankfull depth estimation method.
enum class DepthMethod {
  Gvf,      ///< Gradually varied flow profile
  Manning,  ///< Uniform flow (Manning's equation)
  Powlaw    ///< Power law of bankfull discharge
};

namespace config {

/**
 * @brief Hydraulic depth parameters.
 *
 * powlaw:  h = hc * Q^hp
 * manning: h = (Q * n / (w * sqrt(S)))^(3/5)
 */
struct Hydraulics {
  DepthMethod method = DepthMethod::Gvf;
  double hc = 0.27;           ///< Power law coefficient
  double hp = 0.30;           ///< Power law exponent
  double manning_n = 0.03;    ///< Channel roughness [s.m-1/3]
  double min_rivslp = 1e-5;   ///< Lower slope bound [m/m]
  double min_rivdph = 1.0;    ///< Lower depth bound [m]
  int gvf_iterations = 10;
};

/// River bed reconstruction.
struct RiverBathymetry {
  double river_upa = 100.0;        ///< Minimum upstream area of rivers [km2]
  double segment_length = 5e3;     ///< Target segment length [m]
  double smooth_length = 10e3;     ///< Smoothing length [m]
  double min_convergence = 0.01;   ///< Estuary width convergence [m/m]
  double estuary_max_elevtn = 5.0; ///< Estuaries lie below this [m]
  double max_dist = 100.0;         ///< Attribute join distance [m]
  double bankq = 25.0;             ///< Bank height percentile [0-100]
  int nmin = 20;                   ///< Minimum bank cells per segment
  bool adjust_estuary = true;
  bool adjust_rivwth = true;
  bool adjust_dem = true;
  Hydraulics hydraulics;
};

}  // namespace config
}  // namespace demfuse

#endif  // DEMFUSE_CONFIG_RIVER_BATHYMETRY_HPP
