// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "demfuse/hydro/hydraulics.hpp"

#include <algorithm>
#include <cmath>

#include "demfuse/errors.hpp"

namespace demfuse {

namespace {

constexpr double kMaxFroude2 = 0.9;

const char* methodName(DepthMethod method) {
  switch (method) {
    case DepthMethod::Gvf:
      return "gvf";
    case DepthMethod::Manning:
      return "manning";
    case DepthMethod::Powlaw:
      return "powlaw";
  }
  return "unknown";
}

// Slope to the downstream node, bounded below by min_slope
std::vector<double> downstreamSlope(const RiverNetwork& network,
                                    const std::vector<double>& z,
                                    const std::vector<double>& dst,
                                    double min_slope) {
  const auto z_ds = network.downstream(z);
  const auto dst_ds = network.downstream(dst);
  std::vector<double> slope(z.size(), min_slope);
  for (size_t i = 0; i < z.size(); ++i) {
    const double dx = dst[i] - dst_ds[i];
    if (!(dx > 0.0)) continue;
    const double s = (z[i] - z_ds[i]) / dx;
    if (std::isfinite(s)) slope[i] = std::max(s, min_slope);
  }
  return slope;
}

}  // namespace

double powlawDepth(double qbankfull, double hc, double hp) {
  return hc * std::pow(qbankfull, hp);
}

double manningDepth(double qbankfull, double rivwth, double slope,
                    double manning_n) {
  return std::pow(qbankfull * manning_n / (rivwth * std::sqrt(slope)), 0.6);
}

std::vector<double> riverDepth(const RiverNetwork& network,
                               const std::vector<double>& qbankfull,
                               const std::vector<double>& rivwth,
                               const std::vector<double>& zs,
                               const std::vector<double>& rivdst,
                               const config::Hydraulics& cfg,
                               const Logger& logger) {
  const size_t n = network.size();
  const bool needs_width = cfg.method != DepthMethod::Powlaw;
  if (qbankfull.size() != n || (needs_width && rivwth.size() != n)) {
    throw ConfigError("riverDepth: qbankfull/rivwth do not match the network");
  }
  if (needs_width && (zs.size() != n || rivdst.size() != n)) {
    throw ConfigError("riverDepth: zs/rivdst do not match the network");
  }
  auto& log = sink(logger);

  // Segments without usable discharge or width keep the minimum depth
  std::vector<char> usable(n, 1);
  size_t n_missing = 0;
  for (size_t i = 0; i < n; ++i) {
    const bool q_ok = std::isfinite(qbankfull[i]) && qbankfull[i] >= 0.0;
    const bool w_ok = !needs_width || (std::isfinite(rivwth[i]) && rivwth[i] > 0.0);
    if (!(q_ok && w_ok)) {
      usable[i] = 0;
      ++n_missing;
    }
  }
  if (n_missing > 0) {
    log.warn("[Hydraulics] {} of {} segments lack discharge or width, "
             "using min_rivdph = {} m",
             n_missing, n, cfg.min_rivdph);
  }

  auto clip = [&](double h) {
    return std::isfinite(h) ? std::max(h, cfg.min_rivdph) : cfg.min_rivdph;
  };

  std::vector<double> h(n, cfg.min_rivdph);
  if (cfg.method == DepthMethod::Powlaw) {
    for (size_t i = 0; i < n; ++i) {
      if (usable[i]) h[i] = clip(powlawDepth(qbankfull[i], cfg.hc, cfg.hp));
    }
    log.debug("[Hydraulics] River depth ({}) for {} segments",
              methodName(cfg.method), n);
    return h;
  }

  // Normal depth on the water surface slope
  const auto slope = downstreamSlope(network, zs, rivdst, cfg.min_rivslp);
  for (size_t i = 0; i < n; ++i) {
    if (usable[i]) {
      h[i] = clip(manningDepth(qbankfull[i], rivwth[i], slope[i], cfg.manning_n));
    }
  }

  if (cfg.method == DepthMethod::Gvf) {
    const auto& seq = network.sequence();
    std::vector<double> zb(n);
    for (int it = 0; it < cfg.gvf_iterations; ++it) {
      for (size_t i = 0; i < n; ++i) zb[i] = zs[i] - h[i];
      const auto s0 = downstreamSlope(network, zb, rivdst, cfg.min_rivslp);
      std::vector<double> h_new = h;
      // March upstream from the outlets
      for (auto r = seq.rbegin(); r != seq.rend(); ++r) {
        const int i = *r;
        if (!usable[i]) continue;
        const double q = qbankfull[i];
        const double w = rivwth[i];
        const int ds = network.downstreamOf(i);
        if (ds < 0) {
          h_new[i] = clip(manningDepth(q, w, s0[i], cfg.manning_n));
          continue;
        }
        const double dx = rivdst[i] - rivdst[ds];
        const double h_ds = h_new[ds];
        if (!(dx > 0.0)) {
          h_new[i] = h_ds;
          continue;
        }
        const double sf = std::pow(q * cfg.manning_n / (w * std::pow(h_ds, 5.0 / 3.0)), 2);
        const double fr2 =
            std::min(q * q / (kGravity * w * w * h_ds * h_ds * h_ds), kMaxFroude2);
        const double hi = h_ds - dx * (s0[i] - sf) / (1.0 - fr2);
        h_new[i] = std::isfinite(hi)
                       ? clip(hi)
                       : clip(manningDepth(q, w, s0[i], cfg.manning_n));
      }
      h.swap(h_new);
    }
  }

  log.debug("[Hydraulics] River depth ({}) for {} segments",
            methodName(cfg.method), n);
  return h;
}

}  // namespace demfuse
