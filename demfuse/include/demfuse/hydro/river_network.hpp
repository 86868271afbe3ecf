// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * river_network.hpp
 *
 * Segment-level river network (directed tree of river segments) and the
 * along-network operations on per-segment values.
 */

#ifndef DEMFUSE_HYDRO_RIVER_NETWORK_HPP
#define DEMFUSE_HYDRO_RIVER_NETWORK_HPP

#include <cmath>
#include <cstddef>
#include <vector>

namespace demfuse {

enum class FillDirection {
  Down,  ///< Values propagate from upstream into downstream gaps
  Up     ///< Values propagate from downstream into upstream gaps
};

/// How values meeting at a confluence are combined.
enum class FillHow { Max, Min, Mean };

/**
 * @brief River network over segments.
 *
 * Nodes are identified by an id (`idx`) and linked to the node whose id
 * is `idx_ds`; any `idx_ds` not in the id list marks an outlet. All
 * operations take per-node value vectors in the node order given at
 * construction and return new vectors.
 */
class RiverNetwork {
 public:
  RiverNetwork() = default;

  /**
   * @param idx    Node ids
   * @param idx_ds Downstream node id per node
   * @param uparea Upstream area per node, selects the main upstream
   *               branch (empty: first upstream node)
   * @throws ConfigError on duplicate ids, a size mismatch or a loop
   */
  RiverNetwork(const std::vector<int>& idx, const std::vector<int>& idx_ds,
               const std::vector<double>& uparea = {});

  size_t size() const { return ds_.size(); }

  /// Position of the downstream node, -1 at outlets.
  int downstreamOf(int i) const { return ds_[i]; }

  /// Position of the main upstream node, -1 at headwaters.
  int mainUpstreamOf(int i) const { return main_up_[i]; }

  const std::vector<int>& mainUpstream() const { return main_up_; }

  /// Node positions ordered from upstream to downstream.
  const std::vector<int>& sequence() const { return seq_; }

  /// Value of the downstream node; outlets return their own value.
  std::vector<double> downstream(const std::vector<double>& values) const;

  /**
   * @brief Moving average along the main stem.
   *
   * Averages the valid values of the node, `n` nodes downstream and `n`
   * nodes along the main upstream branch. Nodes that are nodata themselves
   * are written as `nodata`; NaN is always nodata.
   */
  std::vector<double> movingAverage(const std::vector<double>& values, int n,
                                    double nodata = NAN) const;

  /// Fill nodata values along the network.
  std::vector<double> fillnodata(const std::vector<double>& values,
                                 double nodata,
                                 FillDirection direction = FillDirection::Down,
                                 FillHow how = FillHow::Max) const;

  /**
   * @brief Lower values so they never increase in downstream direction.
   *
   * Non-finite nodes keep their value and pass the upstream minimum on
   * to their downstream node.
   */
  std::vector<double> demAdjust(const std::vector<double>& values) const;

  /**
   * @brief Flag estuary nodes.
   *
   * Starting at every outlet, nodes are estuarine while their elevation is
   * at most `max_elevtn` and the width converges landward faster than
   * `min_convergence`: (w_ds - w) / (dst - dst_ds) > min_convergence.
   *
   * @return 1 for estuary nodes, 0 otherwise
   */
  std::vector<int> classifyEstuaries(const std::vector<double>& elevtn,
                                     const std::vector<double>& rivwth,
                                     const std::vector<double>& rivdst,
                                     double min_convergence,
                                     double max_elevtn = 5.0) const;

 private:
  void checkSize(size_t n) const;

  std::vector<int> ds_;
  std::vector<int> main_up_;
  std::vector<std::vector<int>> up_;
  std::vector<int> seq_;
};

}  // namespace demfuse

#endif  // DEMFUSE_HYDRO_RIVER_NETWORK_HPP
