// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "demfuse/hydro/flow_direction.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <deque>
#include <functional>
#include <queue>
#include <tuple>
#include <utility>

#include "demfuse/errors.hpp"

namespace demfuse {

namespace {

constexpr double kOutputNodata = -9999.0;

// ESRI D8 code -> (row, col) offset
bool d8Offset(int code, int& dr, int& dc) {
  switch (code) {
    case 1: dr = 0; dc = 1; return true;
    case 2: dr = 1; dc = 1; return true;
    case 4: dr = 1; dc = 0; return true;
    case 8: dr = 1; dc = -1; return true;
    case 16: dr = 0; dc = -1; return true;
    case 32: dr = -1; dc = -1; return true;
    case 64: dr = -1; dc = 0; return true;
    case 128: dr = -1; dc = 1; return true;
    default: return false;
  }
}

void checkShape(const FlowDirRaster& flw, int rows, int cols,
                const char* what) {
  if (rows != flw.rows() || cols != flw.cols()) {
    throw ConfigError(std::string("FlowDirRaster: ") + what +
                      " does not match the network grid");
  }
}

}  // namespace

FlowDirRaster::FlowDirRaster(std::vector<int> idxs_ds, const Raster& like)
    : idxs_ds_(std::move(idxs_ds)),
      grid_(like.rows(), like.cols(), like.transform(), like.crs(),
            kOutputNodata, DataType::Float64) {
  const int n = static_cast<int>(idxs_ds_.size());
  if (n != like.rows() * like.cols()) {
    throw ConfigError("FlowDirRaster: " + std::to_string(n) +
                      " downstream indices for a " + std::to_string(like.rows()) +
                      "x" + std::to_string(like.cols()) + " grid");
  }
  for (int i = 0; i < n; ++i) {
    int& ds = idxs_ds_[i];
    if (ds < kNoFlow || ds >= n) {
      throw ConfigError("FlowDirRaster: downstream index out of grid at cell " +
                        std::to_string(i));
    }
    if (ds == i) ds = kPit;
  }
  // Links into cells outside the network end there
  for (int i = 0; i < n; ++i) {
    int& ds = idxs_ds_[i];
    if (ds >= 0 && idxs_ds_[ds] == kNoFlow) ds = kPit;
  }
  buildSequence();
}

void FlowDirRaster::buildSequence() {
  const int n = size();
  std::vector<int> n_up(n, 0);
  int n_valid = 0;
  for (int i = 0; i < n; ++i) {
    if (!isValid(i)) continue;
    ++n_valid;
    if (idxs_ds_[i] >= 0) ++n_up[idxs_ds_[i]];
  }

  // Kahn ordering: a cell is emitted once all its upstream cells are
  seq_.clear();
  seq_.reserve(n_valid);
  std::deque<int> ready;
  for (int i = 0; i < n; ++i) {
    if (isValid(i) && n_up[i] == 0) ready.push_back(i);
  }
  while (!ready.empty()) {
    const int i = ready.front();
    ready.pop_front();
    seq_.push_back(i);
    const int ds = idxs_ds_[i];
    if (ds >= 0 && --n_up[ds] == 0) ready.push_back(ds);
  }
  if (static_cast<int>(seq_.size()) != n_valid) {
    throw ConfigError("FlowDirRaster: flow directions contain a loop");
  }
}

FlowDirRaster FlowDirRaster::fromD8(const Raster& d8) {
  const int rows = d8.rows();
  const int cols = d8.cols();
  std::vector<int> idxs_ds(static_cast<size_t>(rows) * cols, kNoFlow);

  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      const int i = r * cols + c;
      if (!d8.isValid(r, c)) continue;
      const int code = static_cast<int>(d8(r, c));
      if (code == 247) continue;
      if (code == 0 || code == 255) {
        idxs_ds[i] = kPit;
        continue;
      }
      int dr, dc;
      if (!d8Offset(code, dr, dc)) {
        throw ConfigError("FlowDirRaster: invalid D8 code " +
                          std::to_string(code) + " at cell (" +
                          std::to_string(r) + ", " + std::to_string(c) + ")");
      }
      const int nr = r + dr;
      const int nc = c + dc;
      const bool inside = nr >= 0 && nr < rows && nc >= 0 && nc < cols;
      idxs_ds[i] = inside ? nr * cols + nc : kPit;
    }
  }
  return FlowDirRaster(std::move(idxs_ds), d8);
}

FlowDirRaster FlowDirRaster::fromDem(const Raster& dem) {
  const int rows = dem.rows();
  const int cols = dem.cols();
  const Eigen::MatrixXd z = dem.masked();
  std::vector<int> idxs_ds(static_cast<size_t>(rows) * cols, kNoFlow);
  std::vector<uint8_t> closed(idxs_ds.size(), 0);

  // (spill elevation, insertion order, cell); insertion order breaks ties
  using Entry = std::tuple<double, uint64_t, int>;
  std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> open;
  uint64_t counter = 0;

  auto valid = [&](int r, int c) {
    return r >= 0 && r < rows && c >= 0 && c < cols && std::isfinite(z(r, c));
  };

  // Outlets: border cells and cells next to nodata
  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      if (!valid(r, c)) continue;
      bool edge = false;
      for (int k = 0; k < 8 && !edge; ++k) {
        edge = !valid(r + grid::kDr8[k], c + grid::kDc8[k]);
      }
      if (!edge) continue;
      const int i = r * cols + c;
      idxs_ds[i] = kPit;
      closed[i] = 1;
      open.emplace(z(r, c), counter++, i);
    }
  }

  while (!open.empty()) {
    const double zc = std::get<0>(open.top());
    const int i = std::get<2>(open.top());
    open.pop();
    const int r = i / cols;
    const int c = i % cols;
    for (int k = 0; k < 8; ++k) {
      const int nr = r + grid::kDr8[k];
      const int nc = c + grid::kDc8[k];
      if (!valid(nr, nc)) continue;
      const int j = nr * cols + nc;
      if (closed[j]) continue;
      closed[j] = 1;
      idxs_ds[j] = i;
      open.emplace(std::max(z(nr, nc), zc), counter++, j);
    }
  }
  return FlowDirRaster(std::move(idxs_ds), dem);
}

double FlowDirRaster::linkLength(int idx) const {
  const int ds = idxs_ds_[idx];
  if (ds < 0) return 0.0;
  const int n_cols = cols();
  const int dr = ds / n_cols - idx / n_cols;
  const int dc = ds % n_cols - idx % n_cols;

  const auto& gt = grid_.transform();
  double w = std::hypot(gt.dx, gt.ry);
  double h = std::hypot(gt.rx, gt.dy);
  if (grid_.crs().geographic) {
    const double lat = 0.5 * (grid_.cellCenter(idx / n_cols, 0).y() +
                              grid_.cellCenter(ds / n_cols, 0).y());
    w *= kMetersPerDegree * std::cos(lat * M_PI / 180.0);
    h *= kMetersPerDegree;
  }
  return std::hypot(dc * w, dr * h);
}

Raster FlowDirRaster::upstreamArea() const {
  const int n_cols = cols();
  std::vector<double> acc(size(), 0.0);
  for (int i : seq_) acc[i] += grid_.cellArea(i / n_cols) * 1e-6;
  for (int i : seq_) {
    const int ds = idxs_ds_[i];
    if (ds >= 0) acc[ds] += acc[i];
  }

  Eigen::MatrixXd out = Eigen::MatrixXd::Constant(rows(), cols(), kOutputNodata);
  for (int i : seq_) out(i / n_cols, i % n_cols) = acc[i];
  return Raster(out, grid_.transform(), grid_.crs(), kOutputNodata,
                DataType::Float64);
}

Raster FlowDirRaster::distanceToOutlet() const {
  const int n_cols = cols();
  std::vector<double> dist(size(), 0.0);
  for (auto it = seq_.rbegin(); it != seq_.rend(); ++it) {
    const int i = *it;
    const int ds = idxs_ds_[i];
    dist[i] = ds < 0 ? 0.0 : dist[ds] + linkLength(i);
  }

  Eigen::MatrixXd out = Eigen::MatrixXd::Constant(rows(), cols(), kOutputNodata);
  for (int i : seq_) out(i / n_cols, i % n_cols) = dist[i];
  return Raster(out, grid_.transform(), grid_.crs(), kOutputNodata,
                DataType::Float64);
}

Raster FlowDirRaster::streamOrder(const Mask* mask) const {
  if (mask) checkShape(*this, mask->rows(), mask->cols(), "stream mask");
  const int n_cols = cols();
  auto inMask = [&](int i) {
    return isValid(i) && (!mask || (*mask)(i / n_cols, i % n_cols));
  };

  std::vector<int> order(size(), 0);
  std::vector<int> max_up(size(), 0);
  std::vector<int> n_max_up(size(), 0);
  for (int i : seq_) {
    if (!inMask(i)) continue;
    if (max_up[i] == 0) {
      order[i] = 1;
    } else {
      order[i] = n_max_up[i] >= 2 ? max_up[i] + 1 : max_up[i];
    }
    const int ds = idxs_ds_[i];
    if (ds < 0 || !inMask(ds)) continue;
    if (order[i] > max_up[ds]) {
      max_up[ds] = order[i];
      n_max_up[ds] = 1;
    } else if (order[i] == max_up[ds]) {
      ++n_max_up[ds];
    }
  }

  Eigen::MatrixXd out = Eigen::MatrixXd::Constant(rows(), cols(), -1.0);
  for (int i : seq_) out(i / n_cols, i % n_cols) = order[i];
  return Raster(out, grid_.transform(), grid_.crs(), -1.0, DataType::Int32);
}

Raster FlowDirRaster::hand(const Mask& drain, const Raster& elevation) const {
  checkShape(*this, drain.rows(), drain.cols(), "drain mask");
  checkShape(*this, elevation.rows(), elevation.cols(), "elevation");
  const int n_cols = cols();
  const Eigen::MatrixXd z = elevation.masked();

  // Elevation of the first drain cell downstream, NaN if none is reached
  std::vector<double> z_drain(size(), NAN);
  Eigen::MatrixXd out = Eigen::MatrixXd::Constant(rows(), cols(), kOutputNodata);
  for (auto it = seq_.rbegin(); it != seq_.rend(); ++it) {
    const int i = *it;
    const int r = i / n_cols;
    const int c = i % n_cols;
    const int ds = idxs_ds_[i];
    if (drain(r, c)) {
      z_drain[i] = z(r, c);
    } else if (ds >= 0) {
      z_drain[i] = z_drain[ds];
    }
    const double h = z(r, c) - z_drain[i];
    if (std::isfinite(h)) out(r, c) = h;
  }
  return Raster(out, grid_.transform(), grid_.crs(), kOutputNodata,
                DataType::Float32);
}

std::vector<StreamSegment> FlowDirRaster::streams(const Mask& mask,
                                                  int max_len) const {
  checkShape(*this, mask.rows(), mask.cols(), "stream mask");
  const int n = size();
  const int n_cols = cols();
  auto river = [&](int i) { return isValid(i) && mask(i / n_cols, i % n_cols); };

  std::vector<int> n_up(n, 0);
  std::vector<int> position(n, -1);
  for (size_t k = 0; k < seq_.size(); ++k) {
    const int i = seq_[k];
    position[i] = static_cast<int>(k);
    const int ds = idxs_ds_[i];
    if (river(i) && ds >= 0 && river(ds)) ++n_up[ds];
  }

  // Headwaters and confluences
  std::vector<uint8_t> is_head(n, 0);
  std::deque<int> heads;
  for (int i : seq_) {
    if (river(i) && n_up[i] != 1) {
      is_head[i] = 1;
      heads.push_back(i);
    }
  }

  std::vector<StreamSegment> segments;
  while (!heads.empty()) {
    StreamSegment seg;
    seg.idx = heads.front();
    heads.pop_front();

    int cur = seg.idx;
    while (true) {
      seg.cells.push_back(cur);
      const int ds = idxs_ds_[cur];
      if (ds < 0 || !river(ds)) {
        seg.pit = true;
        break;
      }
      if (is_head[ds]) {
        seg.idx_ds = ds;
        break;
      }
      if (max_len > 0 && static_cast<int>(seg.cells.size()) >= max_len) {
        is_head[ds] = 1;
        heads.push_back(ds);
        seg.idx_ds = ds;
        break;
      }
      cur = ds;
    }
    segments.push_back(std::move(seg));
  }

  std::sort(segments.begin(), segments.end(),
            [&position](const StreamSegment& a, const StreamSegment& b) {
              return position[a.idx] < position[b.idx];
            });
  return segments;
}

std::vector<Eigen::Vector2d> FlowDirRaster::segmentLine(
    const StreamSegment& segment) const {
  const int n_cols = cols();
  std::vector<Eigen::Vector2d> line;
  line.reserve(segment.cells.size() + 1);
  for (int i : segment.cells) line.push_back(grid_.cellCenter(i / n_cols, i % n_cols));
  if (segment.idx_ds >= 0) {
    line.push_back(grid_.cellCenter(segment.idx_ds / n_cols, segment.idx_ds % n_cols));
  }
  return line;
}

Raster FlowDirRaster::demAdjust(const Raster& elevation) const {
  checkShape(*this, elevation.rows(), elevation.cols(), "elevation");
  const int n_cols = cols();
  Eigen::MatrixXd z = elevation.masked();
  for (int i : seq_) {
    const int ds = idxs_ds_[i];
    if (ds < 0) continue;
    const double zi = z(i / n_cols, i % n_cols);
    double& zd = z(ds / n_cols, ds % n_cols);
    if (std::isfinite(zi) && std::isfinite(zd) && zd > zi) zd = zi;
  }
  return elevation.withMasked(z);
}

Raster FlowDirRaster::digD4(const Raster& elevation, const Mask& mask) const {
  checkShape(*this, elevation.rows(), elevation.cols(), "elevation");
  checkShape(*this, mask.rows(), mask.cols(), "mask");
  const int n_cols = cols();
  Eigen::MatrixXd z = elevation.masked();

  for (int i : seq_) {
    const int r = i / n_cols;
    const int c = i % n_cols;
    const int ds = idxs_ds_[i];
    if (!mask(r, c) || ds < 0) continue;
    const int dr = ds / n_cols - r;
    const int dc = ds % n_cols - c;
    if (dr == 0 || dc == 0) continue;

    const double zi = z(r, c);
    if (!std::isfinite(zi)) continue;
    double& z1 = z(r + dr, c);
    double& z2 = z(r, c + dc);
    const bool open1 = std::isfinite(z1) && z1 <= zi;
    const bool open2 = std::isfinite(z2) && z2 <= zi;
    if (open1 || open2) continue;

    if (std::isfinite(z1) && (!std::isfinite(z2) || z1 <= z2)) {
      z1 = zi;
    } else if (std::isfinite(z2)) {
      z2 = zi;
    }
  }
  return elevation.withMasked(z);
}

}  // namespace demfuse
