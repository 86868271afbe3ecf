// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "demfuse/hydro/river_network.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <unordered_map>

#include "demfuse/errors.hpp"

namespace demfuse {

namespace {

bool isNodata(double v, double nodata) { return std::isnan(v) || v == nodata; }

// Width convergence between a node and its downstream node [m/m]
double convergence(double w_up, double w_ds, double dst_up, double dst_ds) {
  const double dx = dst_up - dst_ds;
  if (!(dx > 0.0)) return 0.0;
  return (w_ds - w_up) / dx;
}

}  // namespace

RiverNetwork::RiverNetwork(const std::vector<int>& idx,
                           const std::vector<int>& idx_ds,
                           const std::vector<double>& uparea) {
  const size_t n = idx.size();
  if (idx_ds.size() != n || (!uparea.empty() && uparea.size() != n)) {
    throw ConfigError("RiverNetwork: idx, idx_ds and uparea sizes differ");
  }

  std::unordered_map<int, int> position;
  position.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    if (!position.emplace(idx[i], static_cast<int>(i)).second) {
      throw ConfigError("RiverNetwork: duplicate node id " +
                        std::to_string(idx[i]));
    }
  }

  ds_.assign(n, -1);
  up_.assign(n, {});
  for (size_t i = 0; i < n; ++i) {
    auto it = position.find(idx_ds[i]);
    if (it == position.end() || it->second == static_cast<int>(i)) continue;
    ds_[i] = it->second;
    up_[it->second].push_back(static_cast<int>(i));
  }

  main_up_.assign(n, -1);
  for (size_t i = 0; i < n; ++i) {
    for (int u : up_[i]) {
      if (main_up_[i] < 0 ||
          (!uparea.empty() && uparea[u] > uparea[main_up_[i]])) {
        main_up_[i] = u;
      }
    }
  }

  std::vector<int> n_up(n);
  std::deque<int> ready;
  for (size_t i = 0; i < n; ++i) {
    n_up[i] = static_cast<int>(up_[i].size());
    if (n_up[i] == 0) ready.push_back(static_cast<int>(i));
  }
  while (!ready.empty()) {
    const int i = ready.front();
    ready.pop_front();
    seq_.push_back(i);
    if (ds_[i] >= 0 && --n_up[ds_[i]] == 0) ready.push_back(ds_[i]);
  }
  if (seq_.size() != n) {
    throw ConfigError("RiverNetwork: segment links contain a loop");
  }
}

void RiverNetwork::checkSize(size_t n) const {
  if (n != size()) {
    throw ConfigError("RiverNetwork: expected " + std::to_string(size()) +
                      " values, got " + std::to_string(n));
  }
}

std::vector<double> RiverNetwork::downstream(
    const std::vector<double>& values) const {
  checkSize(values.size());
  std::vector<double> out(values.size());
  for (size_t i = 0; i < values.size(); ++i) {
    out[i] = ds_[i] >= 0 ? values[ds_[i]] : values[i];
  }
  return out;
}

std::vector<double> RiverNetwork::movingAverage(
    const std::vector<double>& values, int n, double nodata) const {
  checkSize(values.size());
  std::vector<double> out(values.size(), nodata);
  for (size_t i = 0; i < values.size(); ++i) {
    if (isNodata(values[i], nodata)) continue;
    double sum = values[i];
    int count = 1;
    auto visit = [&](int j) {
      if (!isNodata(values[j], nodata)) {
        sum += values[j];
        ++count;
      }
    };
    int j = static_cast<int>(i);
    for (int k = 0; k < n && ds_[j] >= 0; ++k) visit(j = ds_[j]);
    j = static_cast<int>(i);
    for (int k = 0; k < n && main_up_[j] >= 0; ++k) visit(j = main_up_[j]);
    out[i] = sum / count;
  }
  return out;
}

std::vector<double> RiverNetwork::fillnodata(const std::vector<double>& values,
                                             double nodata,
                                             FillDirection direction,
                                             FillHow how) const {
  checkSize(values.size());
  std::vector<double> out = values;

  if (direction == FillDirection::Up) {
    for (auto it = seq_.rbegin(); it != seq_.rend(); ++it) {
      const int i = *it;
      if (isNodata(out[i], nodata) && ds_[i] >= 0) out[i] = out[ds_[i]];
    }
    return out;
  }

  for (int i : seq_) {
    if (!isNodata(out[i], nodata)) continue;
    double acc = 0.0;
    int count = 0;
    for (int u : up_[i]) {
      const double v = out[u];
      if (isNodata(v, nodata)) continue;
      if (count == 0) {
        acc = v;
      } else if (how == FillHow::Max) {
        acc = std::max(acc, v);
      } else if (how == FillHow::Min) {
        acc = std::min(acc, v);
      } else {
        acc += v;
      }
      ++count;
    }
    if (count > 0) out[i] = how == FillHow::Mean ? acc / count : acc;
  }
  return out;
}

std::vector<double> RiverNetwork::demAdjust(
    const std::vector<double>& values) const {
  checkSize(values.size());
  std::vector<double> out = values;
  // Lowest finite value met on any path from the headwaters
  std::vector<double> cap(values.size(), INFINITY);
  for (int i : seq_) {
    double carried = cap[i];
    if (std::isfinite(out[i])) {
      out[i] = std::min(out[i], carried);
      carried = out[i];
    }
    const int ds = ds_[i];
    if (ds >= 0) cap[ds] = std::min(cap[ds], carried);
  }
  return out;
}

std::vector<int> RiverNetwork::classifyEstuaries(
    const std::vector<double>& elevtn, const std::vector<double>& rivwth,
    const std::vector<double>& rivdst, double min_convergence,
    double max_elevtn) const {
  checkSize(elevtn.size());
  checkSize(rivwth.size());
  checkSize(rivdst.size());

  std::vector<int> estuary(size(), 0);
  // Downstream to upstream, so every node sees its downstream flag
  for (auto it = seq_.rbegin(); it != seq_.rend(); ++it) {
    const int i = *it;
    if (!(elevtn[i] <= max_elevtn)) continue;
    const int ds = ds_[i];
    if (ds < 0) {
      const int up = main_up_[i];
      if (up >= 0 && convergence(rivwth[up], rivwth[i], rivdst[up], rivdst[i]) >
                         min_convergence) {
        estuary[i] = 1;
      }
    } else if (estuary[ds] == 1 &&
               convergence(rivwth[i], rivwth[ds], rivdst[i], rivdst[ds]) >
                   min_convergence) {
      estuary[i] = 1;
    }
  }
  return estuary;
}

}  // namespace demfuse
